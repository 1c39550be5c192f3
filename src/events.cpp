#include "quill/events.hpp"

#include <algorithm>

namespace quill {

    event_channel::event_channel(size_t capacity) : capacity_{std::max<size_t>(capacity, 1U)} {}

    void event_channel::append_locked(execution_event& event) {
        event.sequence = next_sequence_++;
        history_.push_back(event);
        pending_.push_back(std::move(event));
    }

    bool event_channel::push(execution_event event, std::stop_token stop) {
        std::unique_lock lock{mutex_};
        auto has_room = not_full_.wait(lock, stop, [this] { return closed_ || pending_.size() < capacity_; });
        if (!has_room || closed_) {
            return false;
        }
        auto terminal = is_terminal(event.kind);
        append_locked(event);
        if (terminal) {
            closed_ = true;
            not_full_.notify_all();
        }
        lock.unlock();
        not_empty_.notify_all();
        return true;
    }

    bool event_channel::close_with(execution_event event) {
        {
            std::lock_guard lock{mutex_};
            if (closed_) {
                return false;
            }
            append_locked(event);
            closed_ = true;
        }
        not_full_.notify_all();
        not_empty_.notify_all();
        return true;
    }

    channel_state event_channel::next(execution_event& out, std::chrono::milliseconds timeout) {
        std::unique_lock lock{mutex_};
        auto ready = not_empty_.wait_for(lock, timeout, [this] { return !pending_.empty() || closed_; });
        if (!ready) {
            return channel_state::timeout;
        }
        if (pending_.empty()) {
            return channel_state::finished;
        }
        out = std::move(pending_.front());
        pending_.pop_front();
        lock.unlock();
        not_full_.notify_all();
        return channel_state::ready;
    }

    bool event_channel::closed() const {
        std::lock_guard lock{mutex_};
        return closed_;
    }

    std::vector<execution_event> event_channel::history() const {
        std::lock_guard lock{mutex_};
        return history_;
    }

}  // namespace quill
