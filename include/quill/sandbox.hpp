#pragma once

#include "errors.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace quill {

    struct startup_config;

    struct terminal_size {
        uint16_t cols{80U};
        uint16_t rows{24U};

        bool operator==(const terminal_size&) const = default;
    };

    enum class session_signal : uint8_t { interrupt, terminate, kill };

    inline constexpr std::string_view to_string(session_signal sig) {
        switch (sig) {
            case session_signal::interrupt:
                return "interrupt"sv;
            case session_signal::terminate:
                return "terminate"sv;
            case session_signal::kill:
                return "kill"sv;
        }
        return "interrupt"sv;
    }

    bool try_parse_session_signal(std::string_view text, session_signal& out);

    enum class read_status : uint8_t { data, idle, ended };

    // Live connection to one sandbox target, as handed out by a provider
    class sandbox_channel {
      public:
        virtual ~sandbox_channel() = default;

        virtual void write(std::string_view bytes) = 0;

        // data: `out` holds new output; idle: nothing within `wait`; ended: no more output
        virtual read_status read(std::string& out, std::chrono::milliseconds wait) = 0;

        virtual void resize(terminal_size size) = 0;
        virtual void signal(session_signal sig) = 0;

        // Releases the target's process and descriptors; idempotent
        virtual void close() = 0;
    };

    class sandbox_provider {
      public:
        virtual ~sandbox_provider() = default;

        // Throws session_error{target_unavailable}
        virtual std::unique_ptr<sandbox_channel> open(std::string_view target_id, terminal_size size) = 0;
    };

    /*
     * Targets are directories: an absolute path, or a name under `sandbox_root`. Each
     * channel is `shell` running on a pseudo-terminal with the target as working directory.
     */
    class local_sandbox_provider : public sandbox_provider {
      public:
        local_sandbox_provider(std::filesystem::path sandbox_root, std::string shell = "/bin/sh");

        std::unique_ptr<sandbox_channel> open(std::string_view target_id, terminal_size size) override;

        std::optional<std::filesystem::path> resolve_target(std::string_view target_id) const;

      private:
        std::filesystem::path root_;
        std::string shell_;
    };

    struct sandbox_session_info {
        std::string session_id{};
        std::string target_id{};
        std::chrono::system_clock::time_point created_at{};
        std::chrono::system_clock::time_point last_activity_at{};
        terminal_size dimensions{};
        bool attached{false};
        bool ended{false};
    };

    struct output_chunk {
        // per session, starting at 0; a gap means output was discarded
        uint64_t sequence{};
        std::string data{};
    };

    struct registry_options {
        // how long unconsumed output is kept once the consumer detaches
        std::chrono::milliseconds retention{30'000};
        // 0 = sessions are never reaped for inactivity
        std::chrono::milliseconds idle_timeout{0};
        size_t max_buffered_bytes{1U << 20U};
        std::chrono::milliseconds reap_interval{250};

        static registry_options from_config(const startup_config& cfg);
    };

    class session_registry;

    namespace detail {
        struct session_buffer;
    }  // namespace detail

    /*
     * The single consumer of one session's output. Chunks come in arrival order; next()
     * returns nullopt on timeout, and `ended()` turns true once the session is gone and
     * everything buffered was consumed. Destroying the handle detaches.
     */
    class session_output {
      public:
        ~session_output();

        session_output(const session_output&) = delete;
        session_output& operator=(const session_output&) = delete;
        session_output(session_output&& other) noexcept;
        session_output& operator=(session_output&&) = delete;

        std::optional<output_chunk> next(std::chrono::milliseconds timeout);
        bool ended() const { return ended_; }

      private:
        friend class session_registry;

        session_output(std::string session_id, std::shared_ptr<detail::session_buffer> buffer);

        std::string session_id_{};
        std::shared_ptr<detail::session_buffer> state_{};
        bool ended_{false};
    };

    /*
     * Process-wide table of live sandbox sessions and single owner of their channels.
     *
     * Operations on different sessions run concurrently; operations on one session are
     * serialized, so two send_input() calls never interleave. close_session() on an
     * unknown or already closed id is a no-op. A reader thread per session drains the
     * channel into a bounded buffer. While a consumer is attached the reader stops at
     * `max_buffered_bytes` until it catches up; a detached session drops its oldest output;
     * a reaper thread discards the buffer of a detached session after `retention` and
     * closes sessions idle longer than `idle_timeout`.
     */
    class session_registry {
      public:
        explicit session_registry(sandbox_provider& provider, registry_options opts = {});
        ~session_registry();

        session_registry(const session_registry&) = delete;
        session_registry& operator=(const session_registry&) = delete;

        // Throws session_error{target_unavailable}
        std::string create_session(std::string_view target_id, terminal_size size = {});

        // Throws session_error{not_found|io_failure}
        void send_input(std::string_view session_id, std::string_view bytes);

        // Throws session_error{not_found|already_attached}
        session_output attach(std::string_view session_id);

        // Advisory; repeating the current size is a no-op. Throws session_error{not_found}
        void resize(std::string_view session_id, terminal_size size);

        // Throws session_error{not_found}
        void send_signal(std::string_view session_id, session_signal sig);

        void close_session(std::string_view session_id) noexcept;

        std::vector<sandbox_session_info> list_sessions() const;
        std::optional<sandbox_session_info> find(std::string_view session_id) const;

      private:
        struct session;

        sandbox_provider& provider_;
        registry_options opts_;
        mutable std::mutex mutex_;
        std::map<std::string, std::shared_ptr<session>, std::less<>> sessions_{};
        uint64_t next_id_{1U};
        std::condition_variable_any reaper_wake_;
        std::jthread reaper_;

        std::shared_ptr<session> lookup(std::string_view session_id) const;
        void reap(std::stop_token stop);
        static void read_loop(std::shared_ptr<session> s, size_t max_buffered_bytes, std::stop_token stop);
        static void teardown(session& s) noexcept;
    };

}  // namespace quill
