#include "editor.hpp"

#include "quill/command.hpp"
#include "quill/format.hpp"
#include "quill/workspace.hpp"

#include "internal/platform.hpp"

extern "C" {
#include <isocline.h>
#include <sys/wait.h>
#include <unistd.h>
}

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <stdexcept>
#include <string_view>
#include <system_error>
#include <vector>

using namespace quill::literals;

namespace quill::cli { namespace detail {

    using namespace std::string_view_literals;

    static const char* meta_completions[] = {
            ":help",    ":quit",   ":q",      ":config", ":set",     ":select",  ":changes", ":diff",
            ":accept",  ":reject", ":edit",   ":commit", ":revert",  ":cancel",  ":status",  ":events",
            ":history", ":tree",   ":search", ":grep",   ":info",    ":vcs",     ":sandbox", nullptr};

    static const char* sandbox_completions[] = {
            "open", "send", "read", "resize", "signal", "close", "list", nullptr};
    static const char* signal_completions[] = {"interrupt", "terminate", "kill", nullptr};
    static const char* set_completions[] = {
            "output",
            "color",
            "verbose",
            "quiet",
            "backend_command",
            "knowledge_command",
            "system_prompt",
            "context_timeout_ms",
            "connect_timeout_ms",
            "max_file_bytes",
            "max_knowledge_snippets",
            "event_buffer_capacity",
            "session_retention_ms",
            "session_idle_timeout_ms",
            "session_max_buffered_bytes",
            "vcs_enabled",
            "vcs_auto_commit",
            nullptr};

    static constexpr std::string_view trim_left(std::string_view value) {
        auto start = value.find_first_not_of(" \t\r\n");
        if (start == std::string_view::npos) {
            return {};
        }
        return value.substr(start);
    }

    static constexpr std::string_view first_token(std::string_view value) {
        auto end = value.find_first_of(" \t\r\n");
        if (end == std::string_view::npos) {
            return value;
        }
        return value.substr(0, end);
    }

    static bool is_command_char(const char* s, long len) {
        if (len == 1 && (s[0] == ':' || s[0] == '/' || s[0] == '-')) {
            return true;
        }
        return ic_char_is_idletter(s, len);
    }

    static void complete_meta(ic_completion_env_t* cenv, const char* prefix) {
        (void)ic_add_completions(cenv, prefix, meta_completions);
    }

    static void complete_verbs(ic_completion_env_t* cenv, const char* prefix) {
        std::string_view typed{prefix};
        for (const auto& spec : command_registry()) {
            auto candidate = "/{}"_format(spec.verb);
            if (candidate.starts_with(typed)) {
                (void)ic_add_completion(cenv, candidate.c_str());
            }
        }
    }

    static void complete_flags(ic_completion_env_t* cenv, const char* prefix) {
        std::string_view typed{prefix};
        for (const auto& flag : global_flags()) {
            auto candidate = "--{}"_format(flag.name);
            if (candidate.starts_with(typed)) {
                (void)ic_add_completion(cenv, candidate.c_str());
            }
        }
    }

    static void complete_sandbox_args(ic_completion_env_t* cenv, const char* prefix) {
        (void)ic_add_completions(cenv, prefix, sandbox_completions);
    }

    static void complete_signal_args(ic_completion_env_t* cenv, const char* prefix) {
        (void)ic_add_completions(cenv, prefix, signal_completions);
    }

    static void complete_set_args(ic_completion_env_t* cenv, const char* prefix) {
        (void)ic_add_completions(cenv, prefix, set_completions);
    }

    static void complete_repl(ic_completion_env_t* cenv, const char* prefix) {
        if (prefix == nullptr) {
            return;
        }

        auto trimmed = trim_left(std::string_view{prefix});
        if (trimmed.empty()) {
            ic_complete_word(cenv, prefix, complete_meta, is_command_char);
            return;
        }

        auto command = first_token(trimmed);
        auto has_args = command.size() < trimmed.size();

        if (trimmed.starts_with('/')) {
            if (!has_args) {
                ic_complete_word(cenv, prefix, complete_verbs, is_command_char);
                return;
            }
            ic_complete_word(cenv, prefix, complete_flags, is_command_char);
            return;
        }

        if (!trimmed.starts_with(':')) {
            return;
        }
        if (!has_args) {
            ic_complete_word(cenv, prefix, complete_meta, is_command_char);
            return;
        }

        if (command == ":set"sv) {
            ic_complete_word(cenv, prefix, complete_set_args, nullptr);
            return;
        }
        if (command == ":sandbox"sv) {
            auto rest = trim_left(trimmed.substr(command.size()));
            if (first_token(rest) == "signal"sv) {
                ic_complete_word(cenv, prefix, complete_signal_args, nullptr);
                return;
            }
            ic_complete_word(cenv, prefix, complete_sandbox_args, nullptr);
            return;
        }
    }

}}  // namespace quill::cli::detail

namespace quill::cli {

    namespace fs = std::filesystem;

    line_editor::line_editor(const startup_config& cfg) {
        ic_enable_multiline(false);
        ic_enable_history_duplicates(false);
        ic_set_prompt_marker("", "");
        ic_set_default_completer(detail::complete_repl, nullptr);

        switch (cfg.color) {
            case color_mode::automatic:
                break;
            case color_mode::always:
                ic_enable_color(true);
                break;
            case color_mode::never:
                ic_enable_color(false);
                break;
        }

        if (!cfg.history_enabled) {
            ic_set_history(nullptr, 1000);
            return;
        }

        std::error_code ec{};
        auto history_parent = cfg.history_file.parent_path();
        if (!history_parent.empty()) {
            fs::create_directories(history_parent, ec);
        }

        auto history_file = cfg.history_file.string();
        ic_set_history(history_file.c_str(), 1000);
    }

    std::optional<std::string> line_editor::read_line(std::string_view prompt) {
        auto prompt_text = std::string(prompt);
        auto* raw = ic_readline(prompt_text.c_str());
        if (raw == nullptr) {
            return std::nullopt;
        }

        std::string line{raw};
        ic_free(raw);
        return line;
    }

    std::optional<std::string> edit_in_external_editor(
            const fs::path& scratch_dir, std::string_view file_name, std::string_view content) {
        auto scratch = scratch_dir / "edit-{}-{}"_format(static_cast<long>(::getpid()), fs::path{file_name}.filename().string());
        try {
            write_file_atomic(scratch, content);
        } catch (const std::system_error& e) {
            throw std::runtime_error("failed to stage {} for editing: {}"_format(scratch.string(), e.code().message()));
        }

        // the editor variable may carry its own arguments, so let the shell split it
        auto script = "${{VISUAL:-${{EDITOR:-{}}}}} \"$1\""_format(internal::platform::tool::default_editor);
        auto path_text = scratch.string();
        std::vector<char*> argv{
                const_cast<char*>("/bin/sh"),
                const_cast<char*>("-c"),
                script.data(),
                const_cast<char*>("quill-edit"),
                path_text.data(),
                nullptr};

        auto pid = ::fork();
        if (pid < 0) {
            std::error_code ec{};
            fs::remove(scratch, ec);
            throw std::runtime_error("fork failed: {}"_format(std::strerror(errno)));
        }
        if (pid == 0) {
            ::execv(argv[0], argv.data());
            ::_exit(127);
        }

        int status = 0;
        while (::waitpid(pid, &status, 0) < 0) {
            if (errno != EINTR) {
                break;
            }
        }

        std::optional<std::string> edited{};
        if (WIFEXITED(status) && WEXITSTATUS(status) == 0) {
            try {
                edited = read_file_bytes(scratch);
            } catch (const std::system_error& e) {
                warn_log("failed to read back ", path_text, ": ", e.code().message());
            }
        }

        std::error_code ec{};
        fs::remove(scratch, ec);
        return edited;
    }

}  // namespace quill::cli
