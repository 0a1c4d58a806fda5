#include "sbridge/link/memory_link.hpp"

#include <algorithm>

namespace sbridge::link {

void BytePipe::push(const std::vector<std::uint8_t>& bytes) {
    {
        std::lock_guard lock(mutex_);
        if (closed_) {
            return;
        }
        bytes_.insert(bytes_.end(), bytes.begin(), bytes.end());
    }
    cv_.notify_all();
}

std::vector<std::uint8_t> BytePipe::pop(std::size_t count, std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    auto ready = [this, count]() {
        return bytes_.size() >= count || closed_;
    };

    if (timeout.count() > 0) {
        cv_.wait_for(lock, timeout, ready);
    } else {
        cv_.wait(lock, ready);
    }

    const std::size_t taken = std::min(count, bytes_.size());
    std::vector<std::uint8_t> out(bytes_.begin(), bytes_.begin() + static_cast<std::ptrdiff_t>(taken));
    bytes_.erase(bytes_.begin(), bytes_.begin() + static_cast<std::ptrdiff_t>(taken));
    return out;
}

void BytePipe::clear() {
    std::lock_guard lock(mutex_);
    bytes_.clear();
}

void BytePipe::close() {
    {
        std::lock_guard lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool BytePipe::closed() const {
    std::lock_guard lock(mutex_);
    return closed_;
}

std::size_t BytePipe::available() const {
    std::lock_guard lock(mutex_);
    return bytes_.size();
}

MemoryLink::MemoryLink(std::shared_ptr<BytePipe> inbound,
                       std::shared_ptr<BytePipe> outbound,
                       std::chrono::milliseconds read_timeout,
                       std::string name)
    : inbound_(std::move(inbound))
    , outbound_(std::move(outbound))
    , read_timeout_(read_timeout)
    , name_(std::move(name)) {
}

MemoryLink::~MemoryLink() {
    close();
}

Result<void> MemoryLink::write(const std::vector<std::uint8_t>& bytes) {
    if (outbound_->closed()) {
        return Err<void>(ErrorCode::LinkClosed, name_ + " peer closed");
    }
    outbound_->push(bytes);
    return Ok();
}

Result<std::vector<std::uint8_t>> MemoryLink::read_exact(std::size_t count) {
    auto bytes = inbound_->pop(count, read_timeout_);
    if (bytes.size() < count && inbound_->closed()) {
        return Err<std::vector<std::uint8_t>>(ErrorCode::LinkClosed, name_ + " closed");
    }
    return Ok(std::move(bytes));
}

void MemoryLink::discard_input() {
    inbound_->clear();
}

void MemoryLink::close() {
    inbound_->close();
    outbound_->close();
}

bool MemoryLink::is_open() const {
    return !inbound_->closed() && !outbound_->closed();
}

std::pair<std::unique_ptr<MemoryLink>, std::unique_ptr<MemoryLink>>
make_memory_link_pair(std::chrono::milliseconds read_timeout) {
    auto a_to_b = std::make_shared<BytePipe>();
    auto b_to_a = std::make_shared<BytePipe>();
    return {
        std::make_unique<MemoryLink>(b_to_a, a_to_b, read_timeout, "memory:a"),
        std::make_unique<MemoryLink>(a_to_b, b_to_a, read_timeout, "memory:b")
    };
}

} // namespace sbridge::link
