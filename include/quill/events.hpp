#pragma once

#include "change.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace quill {

    enum class event_kind : uint8_t {
        started,
        progress,
        file_read,
        thinking,
        code_change_proposed,
        completed,
        cancelled,
        error,
    };

    inline constexpr std::string_view to_string(event_kind kind) {
        switch (kind) {
            case event_kind::started:
                return "started"sv;
            case event_kind::progress:
                return "progress"sv;
            case event_kind::file_read:
                return "file_read"sv;
            case event_kind::thinking:
                return "thinking"sv;
            case event_kind::code_change_proposed:
                return "code_change_proposed"sv;
            case event_kind::completed:
                return "completed"sv;
            case event_kind::cancelled:
                return "cancelled"sv;
            case event_kind::error:
                return "error"sv;
        }
        return "progress"sv;
    }

    constexpr bool is_terminal(event_kind kind) {
        return kind == event_kind::completed || kind == event_kind::cancelled || kind == event_kind::error;
    }

    struct execution_event {
        // position in the execution's event log, starting at 0
        uint64_t sequence{};
        event_kind kind{event_kind::progress};
        std::string execution_id{};
        // progress/thinking text, the file path of file_read, the message of error
        std::string text{};
        // code_change_proposed: the change as extracted
        std::optional<change> proposed{};
        // completed: stream ended without an end marker or inside an open block
        bool truncated{false};
        // completed: number of changes produced
        size_t change_count{};
        // error: "<category>.<kind>", e.g. "execution.timeout"
        std::string error_kind{};
    };

    enum class channel_state : uint8_t { ready, timeout, finished };

    /*
     * Bounded single-consumer event queue with a replayable log.
     *
     * push() blocks while `capacity` events are undelivered, so a slow consumer slows the
     * producer instead of losing events. The first terminal event closes the channel
     * (close_with() bypasses the capacity bound); everything pushed afterwards is refused.
     * Every accepted event is also appended to history() in the same order.
     */
    class event_channel {
      public:
        explicit event_channel(size_t capacity);

        // false when the channel is closed or `stop` was requested while waiting for room
        bool push(execution_event event, std::stop_token stop = {});

        // Appends the terminal event and closes; false if already closed
        bool close_with(execution_event event);

        channel_state next(execution_event& out, std::chrono::milliseconds timeout);

        bool closed() const;
        std::vector<execution_event> history() const;

      private:
        mutable std::mutex mutex_;
        std::condition_variable_any not_full_;
        std::condition_variable_any not_empty_;
        size_t capacity_;
        std::deque<execution_event> pending_{};
        std::vector<execution_event> history_{};
        uint64_t next_sequence_{0U};
        bool closed_{false};

        void append_locked(execution_event& event);
    };

}  // namespace quill
