#pragma once

#include "utils.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace quill {

    using namespace std::string_view_literals;

    /*
     * Quill Startup Config Options
     *
     * Session and UX
     * - workspace_root: Root directory every change path is resolved against.
     * - cache_dir: Directory for persisted config and interactive history.
     * - history_file: Path to persisted interactive command history.
     * - history_enabled: Enable/disable persistent history writes.
     * - color: ANSI color behavior for terminal output.
     * - output: Default machine/human output shape ("table" or "json").
     * - quiet/verbose: Coarse output verbosity knobs for app logs.
     *
     * Collaborators
     * - backend_command: argv of the reasoning backend process (JSON lines on stdout).
     * - knowledge_command: argv of the knowledge service process; empty disables enrichment.
     * - system_prompt: Base system prompt sent with every request.
     *
     * Limits and timeouts
     * - context_timeout_ms: Budget for assembling the execution context.
     * - connect_timeout_ms: Budget until the backend produces its first chunk.
     * - max_file_bytes: Mentioned or pinned files above this size are refused.
     * - max_knowledge_snippets: Cap on snippets kept from the knowledge service.
     * - event_buffer_capacity: Undelivered events buffered before the producer blocks.
     *
     * Sandbox sessions
     * - sandbox_root: Directory holding named sandbox targets.
     * - sandbox_shell: Shell started for each session.
     * - session_retention_ms: How long output is kept once the consumer detaches.
     * - session_idle_timeout_ms: Idle sessions are reaped after this long; 0 disables.
     * - session_max_buffered_bytes: Cap on buffered, unconsumed output per session.
     *
     * Version control
     * - vcs_enabled: Offer staging/committing of applied changes.
     * - vcs_auto_commit: Commit through version control right after a successful apply.
     *
     * Introspection flags (one-shot startup actions)
     * - print_config: Print resolved startup config and exit.
     */

    enum class output_mode { table, json };
    enum class color_mode { automatic, always, never };

    inline constexpr std::string_view to_string(output_mode mode) {
        switch (mode) {
            case output_mode::table:
                return "table"sv;
            case output_mode::json:
                return "json"sv;
        }
        return "table"sv;
    }

    inline constexpr std::string_view to_string(color_mode mode) {
        switch (mode) {
            case color_mode::automatic:
                return "auto"sv;
            case color_mode::always:
                return "always"sv;
            case color_mode::never:
                return "never"sv;
        }
        return "auto"sv;
    }

    inline constexpr bool try_parse_output_mode(std::string_view text, output_mode& out) {
        if (utils::str_case_eq(text, "table"sv)) {
            out = output_mode::table;
            return true;
        }
        if (utils::str_case_eq(text, "json"sv)) {
            out = output_mode::json;
            return true;
        }
        return false;
    }

    inline constexpr bool try_parse_color_mode(std::string_view text, color_mode& out) {
        if (utils::str_case_eq(text, "auto"sv)) {
            out = color_mode::automatic;
            return true;
        }
        if (utils::str_case_eq(text, "always"sv)) {
            out = color_mode::always;
            return true;
        }
        if (utils::str_case_eq(text, "never"sv)) {
            out = color_mode::never;
            return true;
        }
        return false;
    }

    inline constexpr bool try_parse_bool(std::string_view text, bool& out) {
        if (utils::str_case_eq(text, "true"sv) || utils::str_case_eq(text, "on"sv) || text == "1"sv) {
            out = true;
            return true;
        }
        if (utils::str_case_eq(text, "false"sv) || utils::str_case_eq(text, "off"sv) || text == "0"sv) {
            out = false;
            return true;
        }
        return false;
    }

    struct startup_config {
        std::filesystem::path workspace_root{"."};
        std::filesystem::path cache_dir{".quill"};
        std::filesystem::path history_file{".quill/history"};
        bool history_enabled{true};
        color_mode color{color_mode::automatic};
        output_mode output{output_mode::table};
        bool quiet{false};
        bool verbose{false};

        std::vector<std::string> backend_command{};
        std::vector<std::string> knowledge_command{};
        std::string system_prompt{"You are a careful software engineer working inside the user's repository."};

        int context_timeout_ms{10'000};
        int connect_timeout_ms{15'000};
        std::size_t max_file_bytes{1U << 20U};
        std::size_t max_knowledge_snippets{8U};
        std::size_t event_buffer_capacity{256U};

        std::filesystem::path sandbox_root{".quill/sandboxes"};
        std::filesystem::path sandbox_shell{"/bin/sh"};
        int session_retention_ms{30'000};
        int session_idle_timeout_ms{0};
        std::size_t session_max_buffered_bytes{1U << 20U};

        bool vcs_enabled{false};
        bool vcs_auto_commit{false};

        bool print_config{false};
    };

    // Reads <cache_dir>/config.json over `cfg` when present; throws on a malformed file
    void load_persisted_config(startup_config& cfg);
    void save_persisted_config(const startup_config& cfg);

    // Applies one `key=value` assignment; reports the problem to `err` and returns false on bad input
    bool apply_config_assignment(startup_config& cfg, std::string_view assignment, std::ostream& err);

}  // namespace quill
