#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace quill {

    using namespace std::string_view_literals;

    template <typename Code>
    class coded_error : public std::runtime_error {
      public:
        coded_error(Code code, const std::string& message) : std::runtime_error{message}, code_{code} {}

        Code code() const noexcept { return code_; }

      private:
        Code code_;
    };

    enum class validation_status : uint8_t {
        ok,
        unknown_verb,
        missing_argument,
        malformed_flag,
    };

    inline constexpr std::string_view to_string(validation_status status) {
        switch (status) {
            case validation_status::ok:
                return "ok"sv;
            case validation_status::unknown_verb:
                return "unknown_verb"sv;
            case validation_status::missing_argument:
                return "missing_argument"sv;
            case validation_status::malformed_flag:
                return "malformed_flag"sv;
        }
        return "ok"sv;
    }

    enum class context_errc : uint8_t {
        not_found,
        permission_denied,
        too_large,
        backend_unreachable,
    };

    inline constexpr std::string_view to_string(context_errc code) {
        switch (code) {
            case context_errc::not_found:
                return "not_found"sv;
            case context_errc::permission_denied:
                return "permission_denied"sv;
            case context_errc::too_large:
                return "too_large"sv;
            case context_errc::backend_unreachable:
                return "backend_unreachable"sv;
        }
        return "not_found"sv;
    }

    enum class execution_errc : uint8_t {
        backend_unreachable,
        backend_protocol_error,
        timeout,
    };

    inline constexpr std::string_view to_string(execution_errc code) {
        switch (code) {
            case execution_errc::backend_unreachable:
                return "backend_unreachable"sv;
            case execution_errc::backend_protocol_error:
                return "backend_protocol_error"sv;
            case execution_errc::timeout:
                return "timeout"sv;
        }
        return "backend_unreachable"sv;
    }

    enum class apply_errc : uint8_t {
        invalid_change_state,
        stale_change,
        io_failure,
        not_applied,
        already_reverted,
    };

    inline constexpr std::string_view to_string(apply_errc code) {
        switch (code) {
            case apply_errc::invalid_change_state:
                return "invalid_change_state"sv;
            case apply_errc::stale_change:
                return "stale_change"sv;
            case apply_errc::io_failure:
                return "io_failure"sv;
            case apply_errc::not_applied:
                return "not_applied"sv;
            case apply_errc::already_reverted:
                return "already_reverted"sv;
        }
        return "io_failure"sv;
    }

    enum class session_errc : uint8_t {
        target_unavailable,
        not_found,
        io_failure,
        already_attached,
    };

    inline constexpr std::string_view to_string(session_errc code) {
        switch (code) {
            case session_errc::target_unavailable:
                return "target_unavailable"sv;
            case session_errc::not_found:
                return "not_found"sv;
            case session_errc::io_failure:
                return "io_failure"sv;
            case session_errc::already_attached:
                return "already_attached"sv;
        }
        return "not_found"sv;
    }

    enum class engine_errc : uint8_t {
        unknown_execution,
        unknown_change,
        not_actionable,
        already_subscribed,
    };

    inline constexpr std::string_view to_string(engine_errc code) {
        switch (code) {
            case engine_errc::unknown_execution:
                return "unknown_execution"sv;
            case engine_errc::unknown_change:
                return "unknown_change"sv;
            case engine_errc::not_actionable:
                return "not_actionable"sv;
            case engine_errc::already_subscribed:
                return "already_subscribed"sv;
        }
        return "unknown_execution"sv;
    }

    class parse_error : public coded_error<validation_status> {
      public:
        using coded_error::coded_error;
    };

    class context_build_error : public coded_error<context_errc> {
      public:
        context_build_error(context_errc code, const std::string& message, std::string path = {})
                : coded_error{code, message}, path_{std::move(path)} {}

        const std::string& path() const noexcept { return path_; }

      private:
        std::string path_;
    };

    class execution_error : public coded_error<execution_errc> {
      public:
        using coded_error::coded_error;
    };

    class apply_error : public coded_error<apply_errc> {
      public:
        apply_error(apply_errc code, const std::string& message, std::optional<std::string> change_id = std::nullopt)
                : coded_error{code, message}, change_id_{std::move(change_id)} {}

        // The change that caused the batch to be refused, when one change is to blame
        const std::optional<std::string>& change_id() const noexcept { return change_id_; }

      private:
        std::optional<std::string> change_id_;
    };

    class session_error : public coded_error<session_errc> {
      public:
        using coded_error::coded_error;
    };

    class engine_error : public coded_error<engine_errc> {
      public:
        using coded_error::coded_error;
    };

    class busy_error : public std::runtime_error {
      public:
        explicit busy_error(std::string execution_id)
                : std::runtime_error{"an execution is already running: " + execution_id},
                  execution_id_{std::move(execution_id)} {}

        const std::string& execution_id() const noexcept { return execution_id_; }

      private:
        std::string execution_id_;
    };

}  // namespace quill
