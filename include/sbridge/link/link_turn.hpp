/**
 * @file link_turn.hpp
 * @brief Turn-taking between the foreground sender and background receiver
 *
 * Both engines pair a write with a read of the reply. Only the engine that
 * holds the turn may do either, so replies are never read by the wrong one.
 *
 * The receiver takes and gives back the turn around every idle scan read.
 * A plain mutex would let it re-acquire immediately and starve a waiting
 * sender, so a pending foreground request blocks new background
 * acquisitions.
 *
 * EXAMPLE:
 * LinkTurn turn;
 * // receiver thread
 * std::unique_lock<LinkTurn> scan(turn);
 * // sender thread
 * LinkTurn::PriorityGuard send(turn);
 */

#pragma once

#include <condition_variable>
#include <mutex>

namespace sbridge::link {

class LinkTurn {
public:
    LinkTurn() = default;

    LinkTurn(const LinkTurn&) = delete;
    LinkTurn& operator=(const LinkTurn&) = delete;

    /**
     * @brief Background acquisition (BasicLockable)
     *
     * BLOCKS: while the turn is held or a foreground request is pending
     */
    void lock() {
        std::unique_lock guard(mutex_);
        cv_.wait(guard, [this]() {
            return !held_ && foreground_waiting_ == 0;
        });
        held_ = true;
    }

    bool try_lock() {
        std::lock_guard guard(mutex_);
        if (held_ || foreground_waiting_ > 0) {
            return false;
        }
        held_ = true;
        return true;
    }

    void unlock() {
        {
            std::lock_guard guard(mutex_);
            held_ = false;
        }
        cv_.notify_all();
    }

    /**
     * @brief Foreground acquisition, served before any background waiter
     */
    void lock_priority() {
        std::unique_lock guard(mutex_);
        ++foreground_waiting_;
        cv_.wait(guard, [this]() { return !held_; });
        --foreground_waiting_;
        held_ = true;
    }

    class PriorityGuard {
    public:
        explicit PriorityGuard(LinkTurn& turn) : turn_(turn) { turn_.lock_priority(); }
        ~PriorityGuard() { turn_.unlock(); }

        PriorityGuard(const PriorityGuard&) = delete;
        PriorityGuard& operator=(const PriorityGuard&) = delete;

    private:
        LinkTurn& turn_;
    };

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool held_ = false;
    int foreground_waiting_ = 0;
};

} // namespace sbridge::link
