#include "sbridge/link/serial_link.hpp"
#include "sbridge/core/platform.hpp"

#include <spdlog/spdlog.h>

namespace sbridge::link {

SerialLink::SerialLink(ConstructionTag, std::string device, unsigned int baud_rate, std::chrono::milliseconds read_timeout)
    : io_context_()
    , port_(io_context_)
    , device_(std::move(device))
    , baud_rate_(baud_rate)
    , read_timeout_(read_timeout) {
}

SerialLink::~SerialLink() {
    close();
}

Result<std::unique_ptr<SerialLink>> SerialLink::open(const std::string& device,
                                                     unsigned int baud_rate,
                                                     std::chrono::milliseconds read_timeout) {
    auto link = std::make_unique<SerialLink>(ConstructionTag{}, device, baud_rate, read_timeout);

    boost::system::error_code ec;
    link->port_.open(device, ec);
    if (ec) {
        return Err<std::unique_ptr<SerialLink>>(ErrorCode::LinkOpenFailure,
                                                "Failed to open " + device + ": " + ec.message());
    }

    auto configured = link->configure();
    if (configured.is_error()) {
        return Err<std::unique_ptr<SerialLink>>(configured.error());
    }

    spdlog::info("Serial link open: {} @ {} baud, read timeout {}ms",
                 device, baud_rate, read_timeout.count());
    return Ok(std::move(link));
}

Result<void> SerialLink::configure() {
    boost::system::error_code ec;
    port_.set_option(asio::serial_port_base::baud_rate(baud_rate_), ec);
    if (!ec) port_.set_option(asio::serial_port_base::character_size(8), ec);
    if (!ec) port_.set_option(asio::serial_port_base::parity(asio::serial_port_base::parity::none), ec);
    if (!ec) port_.set_option(asio::serial_port_base::stop_bits(asio::serial_port_base::stop_bits::one), ec);
    if (!ec) port_.set_option(asio::serial_port_base::flow_control(asio::serial_port_base::flow_control::none), ec);
    if (ec) {
        return Err<void>(ErrorCode::LinkOpenFailure,
                         "Failed to configure " + device_ + ": " + ec.message());
    }

#ifdef SBRIDGE_PLATFORM_WINDOWS
    const bool purged = ::PurgeComm(port_.native_handle(), PURGE_RXCLEAR | PURGE_TXCLEAR) != 0;
#else
    const bool purged = ::tcflush(port_.native_handle(), TCIOFLUSH) == 0;
#endif
    if (!purged) {
        spdlog::warn("Could not discard stale buffers on {}", device_);
    }
    return Ok();
}

Result<void> SerialLink::write(const std::vector<std::uint8_t>& bytes) {
    std::lock_guard lock(write_mutex_);
    if (!port_.is_open()) {
        return Err<void>(ErrorCode::LinkClosed, "Serial link not open");
    }

    boost::system::error_code ec;
    asio::write(port_, asio::buffer(bytes), ec);
    if (ec) {
        return Err<void>(ErrorCode::LinkClosed, "Write to " + device_ + " failed: " + ec.message());
    }
    return Ok();
}

Result<std::vector<std::uint8_t>> SerialLink::read_exact(std::size_t count) {
    std::lock_guard lock(read_mutex_);
    if (!port_.is_open()) {
        return Err<std::vector<std::uint8_t>>(ErrorCode::LinkClosed, "Serial link not open");
    }

    std::vector<std::uint8_t> buffer(count);
    if (count == 0) {
        return Ok(std::move(buffer));
    }

    boost::system::error_code read_ec;
    std::size_t transferred = 0;
    bool completed = false;

    asio::async_read(port_, asio::buffer(buffer),
        [&](const boost::system::error_code& ec, std::size_t bytes_transferred) {
            read_ec = ec;
            transferred = bytes_transferred;
            completed = true;
        });

    io_context_.restart();
    if (read_timeout_.count() > 0) {
        io_context_.run_for(read_timeout_);
        if (!completed) {
            // Cancelled reads still report the bytes that did arrive
            boost::system::error_code cancel_ec;
            port_.cancel(cancel_ec);
            io_context_.restart();
            io_context_.run();
        }
    } else {
        io_context_.run();
    }

    if (read_ec && read_ec != asio::error::operation_aborted) {
        return Err<std::vector<std::uint8_t>>(ErrorCode::LinkClosed,
                                              "Read from " + device_ + " failed: " + read_ec.message());
    }

    buffer.resize(transferred);
    return Ok(std::move(buffer));
}

Result<void> SerialLink::flush() {
    std::lock_guard lock(write_mutex_);
    if (!port_.is_open()) {
        return Err<void>(ErrorCode::LinkClosed, "Serial link not open");
    }

#ifdef SBRIDGE_PLATFORM_WINDOWS
    if (!::FlushFileBuffers(port_.native_handle())) {
        return Err<void>(ErrorCode::LinkClosed, "Failed to flush " + device_);
    }
#else
    if (::tcdrain(port_.native_handle()) != 0) {
        return Err<void>(ErrorCode::LinkClosed, "Failed to drain " + device_);
    }
#endif
    return Ok();
}

void SerialLink::discard_input() {
    if (!port_.is_open()) {
        return;
    }
#ifdef SBRIDGE_PLATFORM_WINDOWS
    const bool purged = ::PurgeComm(port_.native_handle(), PURGE_RXCLEAR) != 0;
#else
    const bool purged = ::tcflush(port_.native_handle(), TCIFLUSH) == 0;
#endif
    if (!purged) {
        spdlog::debug("Could not discard pending input on {}", device_);
    }
}

void SerialLink::close() {
    if (port_.is_open()) {
        boost::system::error_code ec;
        port_.close(ec);
        if (ec) {
            spdlog::warn("Closing {} reported: {}", device_, ec.message());
        } else {
            spdlog::debug("Serial link closed: {}", device_);
        }
    }
}

bool SerialLink::is_open() const {
    return port_.is_open();
}

std::string SerialLink::describe() const {
    return device_ + "@" + std::to_string(baud_rate_);
}

} // namespace sbridge::link
