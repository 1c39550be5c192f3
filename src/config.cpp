#include "quill/config.hpp"

#include "quill/format.hpp"

#include "internal/json.hpp"
#include "internal/types.hpp"

#include <ostream>

using namespace quill::literals;

namespace quill {

    namespace fs = std::filesystem;

    namespace detail {

        static fs::path config_path(const startup_config& cfg) {
            return cfg.cache_dir / "config.json";
        }

        static std::vector<std::string> split_command(std::string_view text) {
            std::vector<std::string> argv{};
            size_t pos = 0U;
            while (pos < text.size()) {
                auto start = text.find_first_not_of(" \t", pos);
                if (start == std::string_view::npos) {
                    break;
                }
                auto end = text.find_first_of(" \t", start);
                if (end == std::string_view::npos) {
                    end = text.size();
                }
                argv.emplace_back(text.substr(start, end - start));
                pos = end;
            }
            return argv;
        }

        static internal::persisted_config make_persisted_config(const startup_config& cfg) {
            internal::persisted_config data{};
            data.workspace_root = cfg.workspace_root.string();
            data.history_file = cfg.history_file.string();
            data.history_enabled = cfg.history_enabled;
            data.output = std::string{to_string(cfg.output)};
            data.color = std::string{to_string(cfg.color)};
            data.backend_command = cfg.backend_command;
            data.knowledge_command = cfg.knowledge_command;
            data.system_prompt = cfg.system_prompt;
            data.context_timeout_ms = cfg.context_timeout_ms;
            data.connect_timeout_ms = cfg.connect_timeout_ms;
            data.max_file_bytes = cfg.max_file_bytes;
            data.max_knowledge_snippets = cfg.max_knowledge_snippets;
            data.event_buffer_capacity = cfg.event_buffer_capacity;
            data.sandbox_root = cfg.sandbox_root.string();
            data.sandbox_shell = cfg.sandbox_shell.string();
            data.session_retention_ms = cfg.session_retention_ms;
            data.session_idle_timeout_ms = cfg.session_idle_timeout_ms;
            data.session_max_buffered_bytes = cfg.session_max_buffered_bytes;
            data.vcs_enabled = cfg.vcs_enabled;
            data.vcs_auto_commit = cfg.vcs_auto_commit;
            return data;
        }

        static void apply_persisted_config(const internal::persisted_config& data, startup_config& cfg) {
            if (!try_parse_output_mode(data.output, cfg.output)) {
                throw std::runtime_error("invalid output in persisted config: " + data.output);
            }
            if (!try_parse_color_mode(data.color, cfg.color)) {
                throw std::runtime_error("invalid color in persisted config: " + data.color);
            }
            if (data.context_timeout_ms <= 0 || data.connect_timeout_ms <= 0) {
                throw std::runtime_error("invalid timeout in persisted config: timeouts must be positive");
            }
            if (data.event_buffer_capacity == 0U) {
                throw std::runtime_error("invalid event_buffer_capacity in persisted config: 0");
            }
            if (data.session_retention_ms < 0 || data.session_idle_timeout_ms < 0) {
                throw std::runtime_error("invalid session timing in persisted config: values must not be negative");
            }

            if (!data.workspace_root.empty()) {
                cfg.workspace_root = data.workspace_root;
            }
            if (!data.history_file.empty()) {
                cfg.history_file = data.history_file;
            }
            cfg.history_enabled = data.history_enabled;
            cfg.backend_command = data.backend_command;
            cfg.knowledge_command = data.knowledge_command;
            cfg.system_prompt = data.system_prompt;
            cfg.context_timeout_ms = data.context_timeout_ms;
            cfg.connect_timeout_ms = data.connect_timeout_ms;
            cfg.max_file_bytes = data.max_file_bytes;
            cfg.max_knowledge_snippets = data.max_knowledge_snippets;
            cfg.event_buffer_capacity = data.event_buffer_capacity;
            if (!data.sandbox_root.empty()) {
                cfg.sandbox_root = data.sandbox_root;
            }
            if (!data.sandbox_shell.empty()) {
                cfg.sandbox_shell = data.sandbox_shell;
            }
            cfg.session_retention_ms = data.session_retention_ms;
            cfg.session_idle_timeout_ms = data.session_idle_timeout_ms;
            cfg.session_max_buffered_bytes = data.session_max_buffered_bytes;
            cfg.vcs_enabled = data.vcs_enabled;
            cfg.vcs_auto_commit = data.vcs_auto_commit;
        }

        template <typename T>
        static bool set_number(T& field, std::string_view key, std::string_view value, T min, std::ostream& err) {
            auto parsed = utils::parse_arithmetic<T>(value);
            if (!parsed || *parsed < min) {
                err << "invalid " << key << ": " << value << " (expected an integer >= " << min << ")\n";
                return false;
            }
            field = *parsed;
            return true;
        }

        static bool set_flag(bool& field, std::string_view key, std::string_view value, std::ostream& err) {
            if (!try_parse_bool(value, field)) {
                err << "invalid " << key << ": " << value << " (expected true|false)\n";
                return false;
            }
            return true;
        }

    }  // namespace detail

    void load_persisted_config(startup_config& cfg) {
        auto path = detail::config_path(cfg);
        std::error_code ec{};
        if (!fs::exists(path, ec)) {
            return;
        }
        auto data = internal::read_json_file<internal::persisted_config>(path, true);
        internal::validate_supported_schema_version(data.schema_version, path);
        detail::apply_persisted_config(data, cfg);
        debug_log("loaded persisted config from ", path.string());
    }

    void save_persisted_config(const startup_config& cfg) {
        internal::write_json_file(detail::make_persisted_config(cfg), detail::config_path(cfg));
    }

    bool apply_config_assignment(startup_config& cfg, std::string_view assignment, std::ostream& err) {
        auto eq = assignment.find('=');
        if (eq == std::string_view::npos) {
            err << "invalid :set, expected key=value\n";
            return false;
        }

        auto key = utils::trim_view(assignment.substr(0, eq));
        auto value = utils::trim_view(assignment.substr(eq + 1U));
        if (key.empty()) {
            err << "invalid :set, key must be non-empty\n";
            return false;
        }

        // these may be cleared with an empty value
        if (key == "knowledge_command"sv) {
            cfg.knowledge_command = detail::split_command(value);
            return true;
        }
        if (key == "system_prompt"sv) {
            cfg.system_prompt = std::string{value};
            return true;
        }

        if (value.empty()) {
            err << "invalid :set, value for " << key << " must be non-empty\n";
            return false;
        }

        if (key == "output"sv) {
            if (!try_parse_output_mode(value, cfg.output)) {
                err << "invalid output: " << value << " (expected table|json)\n";
                return false;
            }
            return true;
        }
        if (key == "color"sv) {
            if (!try_parse_color_mode(value, cfg.color)) {
                err << "invalid color: " << value << " (expected auto|always|never)\n";
                return false;
            }
            return true;
        }
        if (key == "backend_command"sv) {
            cfg.backend_command = detail::split_command(value);
            return true;
        }
        if (key == "history"sv || key == "history_enabled"sv) {
            return detail::set_flag(cfg.history_enabled, key, value, err);
        }
        if (key == "quiet"sv) {
            return detail::set_flag(cfg.quiet, key, value, err);
        }
        if (key == "verbose"sv) {
            return detail::set_flag(cfg.verbose, key, value, err);
        }
        if (key == "vcs"sv || key == "vcs_enabled"sv) {
            return detail::set_flag(cfg.vcs_enabled, key, value, err);
        }
        if (key == "vcs_auto_commit"sv) {
            return detail::set_flag(cfg.vcs_auto_commit, key, value, err);
        }
        if (key == "context_timeout_ms"sv) {
            return detail::set_number(cfg.context_timeout_ms, key, value, 1, err);
        }
        if (key == "connect_timeout_ms"sv) {
            return detail::set_number(cfg.connect_timeout_ms, key, value, 1, err);
        }
        if (key == "max_file_bytes"sv) {
            return detail::set_number<std::size_t>(cfg.max_file_bytes, key, value, 1U, err);
        }
        if (key == "max_knowledge_snippets"sv) {
            return detail::set_number<std::size_t>(cfg.max_knowledge_snippets, key, value, 0U, err);
        }
        if (key == "event_buffer_capacity"sv) {
            return detail::set_number<std::size_t>(cfg.event_buffer_capacity, key, value, 1U, err);
        }
        if (key == "sandbox_root"sv) {
            cfg.sandbox_root = std::string{value};
            return true;
        }
        if (key == "sandbox_shell"sv) {
            cfg.sandbox_shell = std::string{value};
            return true;
        }
        if (key == "session_retention_ms"sv) {
            return detail::set_number(cfg.session_retention_ms, key, value, 0, err);
        }
        if (key == "session_idle_timeout_ms"sv) {
            return detail::set_number(cfg.session_idle_timeout_ms, key, value, 0, err);
        }
        if (key == "session_max_buffered_bytes"sv) {
            return detail::set_number<std::size_t>(cfg.session_max_buffered_bytes, key, value, 1U, err);
        }

        err << "unknown :set key: " << key << '\n';
        return false;
    }

}  // namespace quill
