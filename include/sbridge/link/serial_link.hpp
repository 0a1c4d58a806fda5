#pragma once

#include "sbridge/link/link.hpp"

#include <boost/asio.hpp>
#include <boost/asio/serial_port.hpp>

#include <memory>
#include <mutex>

namespace sbridge::link {

namespace asio = boost::asio;

/**
 * @brief Link over a serial device (USB-UART bridge, native UART)
 *
 * Configured as 8N1 without flow control. Reads are asynchronous operations
 * on a private io_context that is run for at most the read timeout; an
 * expired read is cancelled and returns the bytes that did arrive.
 *
 * Thread safety:
 * - Reads are serialized among themselves, writes likewise
 * - A read and a write may run concurrently from different threads
 */
class SerialLink : public Link {
    struct ConstructionTag {
        explicit ConstructionTag() = default;
    };

public:
    /**
     * @brief Open and configure a serial device
     *
     * Stale input and output queued in the driver is discarded.
     *
     * @return LinkOpenFailure when the device cannot be opened or configured
     */
    static Result<std::unique_ptr<SerialLink>> open(const std::string& device,
                                                    unsigned int baud_rate,
                                                    std::chrono::milliseconds read_timeout);

    /// Only reachable through open()
    SerialLink(ConstructionTag, std::string device, unsigned int baud_rate, std::chrono::milliseconds read_timeout);
    ~SerialLink() override;

    SerialLink(const SerialLink&) = delete;
    SerialLink& operator=(const SerialLink&) = delete;

    Result<void> write(const std::vector<std::uint8_t>& bytes) override;
    Result<std::vector<std::uint8_t>> read_exact(std::size_t count) override;
    Result<void> flush() override;
    void discard_input() override;
    void close() override;
    bool is_open() const override;

    std::chrono::milliseconds read_timeout() const override { return read_timeout_; }
    std::string describe() const override;

private:
    Result<void> configure();

    asio::io_context io_context_;
    asio::serial_port port_;
    std::string device_;
    unsigned int baud_rate_;
    std::chrono::milliseconds read_timeout_;

    std::mutex read_mutex_;
    std::mutex write_mutex_;
};

} // namespace sbridge::link
