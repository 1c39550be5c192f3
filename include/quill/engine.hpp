#pragma once

#include "applier.hpp"
#include "command.hpp"
#include "context.hpp"
#include "events.hpp"
#include "services.hpp"
#include "workspace.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
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

    enum class execution_status : uint8_t {
        queued,
        running,
        awaiting_decision,
        committing,
        completed,
        cancelled,
        failed,
    };

    inline constexpr std::string_view to_string(execution_status status) {
        switch (status) {
            case execution_status::queued:
                return "queued"sv;
            case execution_status::running:
                return "running"sv;
            case execution_status::awaiting_decision:
                return "awaiting_decision"sv;
            case execution_status::committing:
                return "committing"sv;
            case execution_status::completed:
                return "completed"sv;
            case execution_status::cancelled:
                return "cancelled"sv;
            case execution_status::failed:
                return "failed"sv;
        }
        return "queued"sv;
    }

    constexpr bool is_terminal(execution_status status) {
        return status == execution_status::completed || status == execution_status::cancelled ||
               status == execution_status::failed;
    }

    struct failure_info {
        // "context" or "execution"
        std::string category{};
        std::string kind{};
        std::string message{};
    };

    // Copy of an execution's state at one point in time
    struct execution_snapshot {
        std::string id{};
        execution_status status{execution_status::queued};
        std::chrono::system_clock::time_point started_at{};
        parsed_command command{};
        std::vector<std::string> context_files{};
        size_t knowledge_count{};
        std::string stream_buffer{};
        std::vector<change> changes{};
        std::vector<std::string> warnings{};
        bool truncated{false};
        std::optional<failure_info> failure{};
        std::optional<apply_result> applied{};
    };

    struct decision {
        decision_kind kind{decision_kind::accept};
        // edit only
        std::string new_content{};

        static decision accept() { return {decision_kind::accept, {}}; }
        static decision reject() { return {decision_kind::reject, {}}; }
        static decision edit(std::string content) { return {decision_kind::edit, std::move(content)}; }
    };

    struct engine_options {
        std::string system_prompt{};
        // until the backend produces its first chunk
        std::chrono::milliseconds connect_timeout{15'000};
        size_t event_buffer_capacity{256U};
        size_t max_file_bytes{1U << 20U};
        // finished executions kept for get/list/revert; the oldest are dropped first
        size_t max_retained_executions{64U};

        static engine_options from_config(const startup_config& cfg);
    };

    // Consumer end of one execution's event channel
    class event_subscription {
      public:
        explicit event_subscription(std::shared_ptr<event_channel> channel) : channel_{std::move(channel)} {}

        channel_state next(execution_event& out, std::chrono::milliseconds timeout) {
            return channel_->next(out, timeout);
        }

      private:
        std::shared_ptr<event_channel> channel_;
    };

    /*
     * Drives submitted commands through context building, backend streaming, change
     * extraction, user decisions and the final apply.
     *
     * One engine is one session scope: at most one execution is queued or running at a
     * time, and a submission while one is in flight fails with busy_error. Each execution
     * runs on its own worker thread and reports through its event channel; all other
     * operations are synchronous and safe to call from any thread.
     *
     *   queued -> running -> awaiting_decision -> committing -> completed
     *                     \-> completed (no changes)
     *   any non-terminal state -> cancelled | failed
     */
    class execution_engine {
      public:
        execution_engine(
                const workspace& ws,
                context_builder& builder,
                reasoning_backend& backend,
                change_applier& applier,
                engine_options opts = {});
        ~execution_engine();

        execution_engine(const execution_engine&) = delete;
        execution_engine& operator=(const execution_engine&) = delete;

        /*
         * Parses, validates and dispatches `raw_input`; returns the execution id.
         * Throws parse_error for invalid input and busy_error while another execution is
         * queued or running.
         */
        std::string submit(std::string_view raw_input, const std::vector<std::string>& selection = {});

        // Idempotent; a no-op on terminal executions. Throws engine_error{unknown_execution}.
        void cancel(std::string_view execution_id);

        // Only while awaiting_decision; throws engine_error{unknown_execution|unknown_change|not_actionable}
        void decide(std::string_view execution_id, std::string_view change_id, const decision& d);

        /*
         * Applies every change that was not rejected. A failed apply (apply_error is
         * rethrown) leaves the workspace untouched and the execution awaiting_decision.
         */
        apply_result commit(std::string_view execution_id);

        // Reverts a committed execution; returns the restored paths
        std::vector<std::string> revert(std::string_view execution_id);

        // Single consumer; a second call throws engine_error{already_subscribed}
        event_subscription subscribe(std::string_view execution_id);

        execution_snapshot get(std::string_view execution_id) const;
        std::vector<execution_snapshot> list() const;
        std::optional<std::string> active_id() const;
        std::vector<decision_record> decisions() const;

        // Worker threads not yet joined; finished ones are reaped on the next submit
        size_t worker_count() const;

        // Every event emitted so far, in emission order
        std::vector<execution_event> events(std::string_view execution_id) const;

        /*
         * Waits until the execution leaves queued/running/committing and its worker thread
         * has returned; false on timeout.
         */
        bool wait_until_settled(std::string_view execution_id, std::chrono::milliseconds timeout) const;

      private:
        struct execution;
        struct proposal;

        const workspace& workspace_;
        context_builder& builder_;
        reasoning_backend& backend_;
        change_applier& applier_;
        engine_options opts_;

        mutable std::mutex mutex_;
        mutable std::condition_variable settled_;
        std::vector<std::shared_ptr<execution>> executions_{};
        std::vector<decision_record> decisions_{};
        uint64_t next_id_{1U};

        // declared last: destroyed (stopped and joined) first
        std::map<std::string, std::jthread, std::less<>> workers_{};

        std::shared_ptr<execution> find_locked(std::string_view execution_id) const;

        void run(std::shared_ptr<execution> exec, std::stop_token stop);
        void run_stages(const std::shared_ptr<execution>& exec, std::stop_token stop);
        void reap_locked(std::vector<std::jthread>& finished);
        void stream_response(execution& exec, const execution_context& ctx, std::stop_token stop);
        void propose(execution& exec, proposal block, std::stop_token stop);
        bool emit(execution& exec, execution_event event, std::stop_token stop);
        void add_warning(execution& exec, std::string warning);
        void finish(execution& exec, std::stop_token stop);
        void fail(execution& exec, std::string_view category, std::string_view kind, std::string message,
                  std::stop_token stop);
    };

}  // namespace quill
