#pragma once

#include "sbridge/link/link.hpp"

#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <utility>

namespace sbridge::link {

/**
 * @brief One direction of an in-process byte stream
 *
 * Thread safe. Closing wakes every waiting reader; bytes already queued can
 * still be read after close.
 */
class BytePipe {
public:
    void push(const std::vector<std::uint8_t>& bytes);

    /// Wait up to timeout (zero waits forever) for count bytes; returns what arrived
    std::vector<std::uint8_t> pop(std::size_t count, std::chrono::milliseconds timeout);

    void clear();
    void close();
    bool closed() const;
    std::size_t available() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::uint8_t> bytes_;
    bool closed_ = false;
};

/**
 * @brief Link endpoint backed by two BytePipes
 *
 * Created in connected pairs; whatever one endpoint writes the other reads.
 * Used for loopback runs where both roles live in one process.
 */
class MemoryLink : public Link {
public:
    MemoryLink(std::shared_ptr<BytePipe> inbound,
               std::shared_ptr<BytePipe> outbound,
               std::chrono::milliseconds read_timeout,
               std::string name);
    ~MemoryLink() override;

    Result<void> write(const std::vector<std::uint8_t>& bytes) override;
    Result<std::vector<std::uint8_t>> read_exact(std::size_t count) override;
    Result<void> flush() override { return Ok(); }
    void discard_input() override;
    void close() override;
    bool is_open() const override;

    std::chrono::milliseconds read_timeout() const override { return read_timeout_; }
    std::string describe() const override { return name_; }

private:
    std::shared_ptr<BytePipe> inbound_;
    std::shared_ptr<BytePipe> outbound_;
    std::chrono::milliseconds read_timeout_;
    std::string name_;
};

/// Two connected endpoints, "memory:a" and "memory:b"
std::pair<std::unique_ptr<MemoryLink>, std::unique_ptr<MemoryLink>>
make_memory_link_pair(std::chrono::milliseconds read_timeout);

} // namespace sbridge::link
