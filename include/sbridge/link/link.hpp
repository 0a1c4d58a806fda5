#pragma once

#include "sbridge/core/result.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace sbridge::link {

/**
 * @brief Byte channel consumed by the transfer engines
 *
 * The link has no framing of its own. read_exact() blocks until the
 * requested number of bytes arrived or the read timeout expired; on timeout
 * it returns whatever was received so far (possibly nothing). An error is
 * returned only when the link itself failed or was closed.
 *
 * A read timeout of zero means reads block until all bytes arrive.
 */
class Link {
public:
    virtual ~Link() = default;

    virtual Result<void> write(const std::vector<std::uint8_t>& bytes) = 0;
    virtual Result<std::vector<std::uint8_t>> read_exact(std::size_t count) = 0;

    /// Block until queued output has been handed to the device
    virtual Result<void> flush() = 0;

    /// Drop bytes received but not yet read
    virtual void discard_input() = 0;

    virtual void close() = 0;
    virtual bool is_open() const = 0;

    virtual std::chrono::milliseconds read_timeout() const = 0;
    virtual std::string describe() const = 0;
};

} // namespace sbridge::link
