#include "quill/cli.hpp"

#include "editor.hpp"

#include "quill/backend.hpp"
#include "quill/engine.hpp"
#include "quill/format.hpp"
#include "quill/sandbox.hpp"
#include "quill/vcs.hpp"

#include "internal/platform.hpp"
#include "internal/types.hpp"

#include <glaze/glaze.hpp>

#include <CLI/CLI.hpp>

extern "C" {
#include <signal.h>
}

#include <algorithm>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

using namespace quill::literals;

namespace quill::cli { namespace detail {

    using namespace std::string_view_literals;
    using namespace std::chrono_literals;
    namespace fs = std::filesystem;

    static constexpr auto event_poll_interval = 100ms;
    static constexpr auto default_sandbox_read_wait = 200ms;

    static volatile std::sig_atomic_t interrupt_requested = 0;

    static void on_interrupt(int) {
        interrupt_requested = 1;
    }

    // Ctrl-C is delivered to the streaming loop instead of terminating the process
    class interrupt_scope {
      public:
        interrupt_scope() {
            interrupt_requested = 0;
            struct sigaction action{};
            action.sa_handler = on_interrupt;
            sigemptyset(&action.sa_mask);
            installed_ = ::sigaction(SIGINT, &action, &previous_) == 0;
        }

        ~interrupt_scope() {
            if (installed_) {
                (void)::sigaction(SIGINT, &previous_, nullptr);
            }
        }

        interrupt_scope(const interrupt_scope&) = delete;
        interrupt_scope& operator=(const interrupt_scope&) = delete;

        bool triggered() const { return interrupt_requested != 0; }

      private:
        struct sigaction previous_{};
        bool installed_{false};
    };

    struct attached_session {
        session_output output;
        uint64_t next_sequence{0U};
    };

    static fs::path resolve_under(const fs::path& root, const fs::path& path) {
        if (path.is_absolute()) {
            return path;
        }
        return (root / path).lexically_normal();
    }

    static std::unique_ptr<knowledge_service> make_knowledge_service(
            const startup_config& cfg, const fs::path& root) {
        if (cfg.knowledge_command.empty()) {
            return nullptr;
        }
        return std::make_unique<process_knowledge_service>(cfg.knowledge_command, root);
    }

    // Collaborators are wired once per REPL; members are destroyed in reverse order
    struct repl_state {
        startup_config& cfg;
        workspace ws;
        std::unique_ptr<knowledge_service> knowledge;
        process_backend backend;
        context_builder builder;
        change_applier applier;
        local_sandbox_provider sandbox_provider;
        session_registry sessions;
        std::optional<git_service> vcs{};
        execution_engine engine;

        command_history history{};
        std::vector<std::string> selection{};
        std::optional<std::string> last_execution{};
        std::map<std::string, attached_session, std::less<>> attached{};

        explicit repl_state(startup_config& config)
                : cfg{config},
                  ws{config.workspace_root},
                  knowledge{make_knowledge_service(config, ws.root())},
                  backend{config.backend_command, ws.root()},
                  builder{ws, knowledge.get(), context_options::from_config(config)},
                  applier{ws, ws.root() / ".quill" / "ledger.json"},
                  sandbox_provider{resolve_under(ws.root(), config.sandbox_root), config.sandbox_shell.string()},
                  sessions{sandbox_provider, registry_options::from_config(config)},
                  engine{ws, builder, backend, applier, engine_options::from_config(config)} {
            if (config.vcs_enabled) {
                vcs.emplace(ws.root());
            }
        }
    };

    static bool matches_command(std::string_view cmd, std::string_view name) {
        if (!cmd.starts_with(name)) {
            return false;
        }
        if (cmd.size() == name.size()) {
            return true;
        }
        auto next = cmd[name.size()];
        return next == ' ' || next == '\t';
    }

    static std::optional<std::string_view> command_argument(std::string_view cmd, std::string_view name) {
        if (!matches_command(cmd, name)) {
            return std::nullopt;
        }
        return std::optional<std::string_view>{utils::trim_view(cmd.substr(name.size()))};
    }

    // Splits off the first whitespace-separated word of `text`
    static std::pair<std::string_view, std::string_view> split_word(std::string_view text) {
        text = utils::trim_view(text);
        auto end = text.find_first_of(" \t");
        if (end == std::string_view::npos) {
            return {text, {}};
        }
        return {text.substr(0, end), utils::trim_view(text.substr(end))};
    }

    template <typename T>
    static void write_json_line(const T& value, std::ostream& os) {
        std::string json{};
        auto ec = glz::write_json(value, json);
        if (ec) {
            throw std::runtime_error("failed to serialize json output");
        }
        os << json << '\n';
    }

    static internal::change_record to_change_record(const change& c) {
        internal::change_record record{};
        record.id = c.id;
        record.file_path = c.file_path;
        record.status = std::string{to_string(c.status)};
        record.creates_file = !c.original_exists;
        record.start_line = c.start_line;
        record.end_line = c.end_line;
        record.description = c.description;
        return record;
    }

    static internal::event_record to_event_record(const execution_event& ev) {
        internal::event_record record{};
        record.sequence = ev.sequence;
        record.kind = std::string{to_string(ev.kind)};
        record.execution_id = ev.execution_id;
        record.text = ev.text;
        if (ev.proposed) {
            record.change = to_change_record(*ev.proposed);
        }
        record.truncated = ev.truncated;
        record.change_count = ev.change_count;
        record.error_kind = ev.error_kind;
        return record;
    }

    class event_renderer {
      public:
        event_renderer(const startup_config& cfg, std::ostream& out, std::ostream& err)
                : cfg_{cfg}, out_{out}, err_{err} {}

        void render(const execution_event& ev) {
            if (cfg_.output == output_mode::json) {
                write_json_line(to_event_record(ev), out_);
                return;
            }

            if (ev.kind == event_kind::progress) {
                out_ << ev.text;
                if (!ev.text.empty()) {
                    mid_line_ = !ev.text.ends_with('\n');
                }
                out_.flush();
                return;
            }

            end_line();
            switch (ev.kind) {
                case event_kind::started:
                    if (!cfg_.quiet) {
                        out_ << "[{}] started: {}\n"_format(ev.execution_id, ev.text);
                    }
                    break;
                case event_kind::file_read:
                    if (!cfg_.quiet) {
                        out_ << "  read " << ev.text << '\n';
                    }
                    break;
                case event_kind::thinking:
                    if (cfg_.verbose) {
                        out_ << "  (thinking) " << ev.text << '\n';
                    }
                    break;
                case event_kind::code_change_proposed:
                    if (ev.proposed) {
                        out_ << "  proposed {} {}: {}\n"_format(
                                ev.proposed->id, ev.proposed->file_path, ev.proposed->description);
                    }
                    break;
                case event_kind::completed:
                    out_ << "completed: {} change(s){}\n"_format(
                            ev.change_count, ev.truncated ? " (truncated)"sv : ""sv);
                    break;
                case event_kind::cancelled:
                    out_ << "cancelled\n";
                    break;
                case event_kind::error:
                    err_ << "error [{}]: {}\n"_format(ev.error_kind, ev.text);
                    break;
                case event_kind::progress:
                    break;
            }
        }

        void end_line() {
            if (mid_line_) {
                out_ << '\n';
                mid_line_ = false;
            }
        }

      private:
        const startup_config& cfg_;
        std::ostream& out_;
        std::ostream& err_;
        bool mid_line_{false};
    };

    static void print_config(const startup_config& cfg, std::ostream& os) {
        os << ("  workspace_root={}\n"
               "  cache_dir={}\n"
               "  history_file={}\n"
               "  history_enabled={}\n"
               "  output={}\n"
               "  color={}\n"
               "  backend_command={}\n"
               "  knowledge_command={}\n"
               "  context_timeout_ms={}\n"
               "  connect_timeout_ms={}\n"
               "  max_file_bytes={}\n"
               "  max_knowledge_snippets={}\n"
               "  event_buffer_capacity={}\n"
               "  sandbox_root={}\n"
               "  sandbox_shell={}\n"
               "  session_retention_ms={}\n"
               "  session_idle_timeout_ms={}\n"
               "  session_max_buffered_bytes={}\n"
               "  vcs_enabled={}\n"
               "  vcs_auto_commit={}\n"_format(
                       cfg.workspace_root.string(),
                       cfg.cache_dir.string(),
                       cfg.history_file.string(),
                       cfg.history_enabled,
                       to_string(cfg.output),
                       to_string(cfg.color),
                       utils::join_with_separator(cfg.backend_command, " "sv),
                       utils::join_with_separator(cfg.knowledge_command, " "sv),
                       cfg.context_timeout_ms,
                       cfg.connect_timeout_ms,
                       cfg.max_file_bytes,
                       cfg.max_knowledge_snippets,
                       cfg.event_buffer_capacity,
                       cfg.sandbox_root.string(),
                       cfg.sandbox_shell.string(),
                       cfg.session_retention_ms,
                       cfg.session_idle_timeout_ms,
                       cfg.session_max_buffered_bytes,
                       cfg.vcs_enabled,
                       cfg.vcs_auto_commit));
    }

    static void print_help(std::ostream& os) {
        static constexpr auto help_text = R"(meta commands:
  :help
  :config
  :set <key>=<value>
  :select [clear|<path>...]
  :status
  :changes [execution]
  :diff <change>
  :accept <change|all>
  :reject <change|all>
  :edit <change> [file]
  :commit [message]
  :revert [execution]
  :cancel
  :events [execution]
  :history [query]
  :tree [dir]
  :search <query>
  :grep <query>
  :info <path>
  :vcs diff [path]
  :sandbox open <target> [<cols>x<rows>]
  :sandbox send <session> <text>
  :sandbox read <session> [ms]
  :sandbox resize <session> <cols>x<rows>
  :sandbox signal <session> <interrupt|terminate|kill>
  :sandbox close <session>
  :sandbox list
  :quit
)";
        os << help_text;
        os << command_reference();
    }

    static void print_changes(const repl_state& state, const execution_snapshot& snapshot, std::ostream& os) {
        if (state.cfg.output == output_mode::json) {
            for (const auto& c : snapshot.changes) {
                write_json_line(to_change_record(c), os);
            }
            return;
        }

        if (snapshot.changes.empty()) {
            os << "no changes for " << snapshot.id << '\n';
            return;
        }

        os << "changes for {} ({}):\n"_format(snapshot.id, to_string(snapshot.status));
        for (const auto& c : snapshot.changes) {
            os << "  {:<4} {:<9} {}"_format(c.id, to_string(c.status), c.file_path);
            if (!c.original_exists) {
                os << " (new file)";
            }
            else if (c.start_line != 0U) {
                os << " lines {}-{}"_format(c.start_line, c.end_line);
            }
            os << "  " << c.description << '\n';
        }
    }

    static void print_file_tree(const file_node& node, size_t depth, std::ostream& os) {
        for (const auto& child : node.children) {
            os << std::string(depth * 2U, ' ') << child.name << (child.is_directory ? "/"sv : ""sv) << '\n';
            if (child.is_directory) {
                print_file_tree(child, depth + 1U, os);
            }
        }
    }

    static std::optional<std::string> resolve_execution(
            const repl_state& state, std::string_view arg, std::ostream& err) {
        if (!arg.empty()) {
            return std::string{arg};
        }
        if (!state.last_execution) {
            err << "no execution yet\n";
            return std::nullopt;
        }
        return state.last_execution;
    }

    static void stream_events(repl_state& state, const std::string& execution_id) {
        auto subscription = state.engine.subscribe(execution_id);
        event_renderer renderer{state.cfg, std::cout, std::cerr};
        interrupt_scope interrupts{};
        bool cancel_sent = false;

        execution_event ev{};
        while (true) {
            if (interrupts.triggered() && !cancel_sent) {
                renderer.end_line();
                std::cerr << "interrupt: cancelling " << execution_id << '\n';
                state.engine.cancel(execution_id);
                cancel_sent = true;
            }

            auto result = subscription.next(ev, event_poll_interval);
            if (result == channel_state::finished) {
                break;
            }
            if (result == channel_state::timeout) {
                continue;
            }
            renderer.render(ev);
        }
        renderer.end_line();
    }

    static void submit_and_stream(repl_state& state, std::string_view line) {
        std::string execution_id{};
        try {
            execution_id = state.engine.submit(line, state.selection);
        } catch (const parse_error& e) {
            std::cerr << "invalid command [{}]: {}\n"_format(to_string(e.code()), e.what());
            if (e.code() == validation_status::unknown_verb) {
                auto word = split_word(line).first;
                auto history = state.history.entries();
                auto hints = suggestions(word.substr(0, std::min<size_t>(word.size(), 3U)), history);
                if (!hints.empty()) {
                    std::cerr << "did you mean:";
                    for (size_t i = 0U; i < hints.size() && i < 3U; ++i) {
                        std::cerr << ' ' << hints[i].text;
                    }
                    std::cerr << '\n';
                }
            }
            return;
        } catch (const busy_error& e) {
            std::cerr << "busy: execution " << e.execution_id() << " is still running\n";
            return;
        }

        state.last_execution = execution_id;
        stream_events(state, execution_id);

        auto snapshot = state.engine.get(execution_id);
        for (const auto& warning : snapshot.warnings) {
            std::cerr << "warning: " << warning << '\n';
        }
        if (snapshot.status == execution_status::awaiting_decision) {
            print_changes(state, snapshot, std::cout);
            if (state.cfg.output == output_mode::table && !state.cfg.quiet) {
                std::cout << "review with :diff <change>, decide with :accept/:reject/:edit, then :commit\n";
            }
        }
    }

    static void decide_changes(
            repl_state& state, std::string_view target, decision_kind kind, std::ostream& out, std::ostream& err) {
        if (target.empty()) {
            err << "expected a change id or 'all'\n";
            return;
        }
        if (!state.last_execution) {
            err << "no execution yet\n";
            return;
        }

        auto snapshot = state.engine.get(*state.last_execution);
        std::vector<std::string> ids{};
        if (target == "all"sv) {
            // edited changes keep their edit under `:accept all`
            for (const auto& c : snapshot.changes) {
                auto wanted = kind == decision_kind::reject ? change_status::rejected : change_status::accepted;
                if (c.status == wanted || !can_transition(c.status, wanted)) {
                    continue;
                }
                if (wanted == change_status::accepted && c.status == change_status::modified) {
                    continue;
                }
                ids.push_back(c.id);
            }
        }
        else {
            ids.emplace_back(target);
        }

        auto d = kind == decision_kind::reject ? decision::reject() : decision::accept();
        for (const auto& id : ids) {
            try {
                state.engine.decide(*state.last_execution, id, d);
                out << "{} {}\n"_format(kind == decision_kind::reject ? "rejected"sv : "accepted"sv, id);
            } catch (const engine_error& e) {
                err << "{} failed [{}]: {}\n"_format(to_string(kind), to_string(e.code()), e.what());
            }
        }
    }

    static void edit_change(repl_state& state, std::string_view args, std::ostream& out, std::ostream& err) {
        auto [change_id, file_arg] = split_word(args);
        if (change_id.empty()) {
            err << "invalid :edit, expected a change id\n";
            return;
        }
        if (!state.last_execution) {
            err << "no execution yet\n";
            return;
        }

        auto snapshot = state.engine.get(*state.last_execution);
        auto it = std::ranges::find(snapshot.changes, change_id, &change::id);
        if (it == snapshot.changes.end()) {
            err << "unknown change: " << change_id << '\n';
            return;
        }

        std::optional<std::string> content{};
        if (!file_arg.empty()) {
            try {
                content = read_file_bytes(fs::path{file_arg});
            } catch (const std::system_error& e) {
                err << "failed to read {}: {}\n"_format(file_arg, e.code().message());
                return;
            }
        }
        else {
            content = edit_in_external_editor(state.cfg.cache_dir, it->file_path, it->modified);
            if (!content) {
                err << "editor exited with an error, change left as is\n";
                return;
            }
        }

        try {
            state.engine.decide(*state.last_execution, change_id, decision::edit(std::move(*content)));
            out << "modified " << change_id << '\n';
        } catch (const engine_error& e) {
            err << "edit failed [{}]: {}\n"_format(to_string(e.code()), e.what());
        }
    }

    static void commit_execution(repl_state& state, std::string_view message, std::ostream& out, std::ostream& err) {
        if (!state.last_execution) {
            err << "no execution yet\n";
            return;
        }
        const auto& execution_id = *state.last_execution;

        apply_result result{};
        try {
            result = state.engine.commit(execution_id);
        } catch (const apply_error& e) {
            err << "commit failed [{}]: {}\n"_format(to_string(e.code()), e.what());
            if (e.change_id()) {
                err << "  offending change: " << *e.change_id() << " (reject or edit it, then :commit again)\n";
            }
            return;
        } catch (const engine_error& e) {
            err << "commit failed [{}]: {}\n"_format(to_string(e.code()), e.what());
            return;
        }

        std::optional<std::string> commit_id{};
        if (state.vcs && state.cfg.vcs_auto_commit && !result.written_paths.empty()) {
            std::string commit_message{message};
            if (commit_message.empty()) {
                commit_message = "quill: {}"_format(state.engine.get(execution_id).command.raw_input);
            }
            try {
                commit_id = sync_with_vcs(*state.vcs, result, commit_message);
            } catch (const vcs_error& e) {
                err << "changes applied, but version control sync failed: " << e.what() << '\n';
            }
        }

        if (state.cfg.output == output_mode::json) {
            internal::apply_record record{};
            record.execution_id = execution_id;
            record.written_paths = result.written_paths;
            record.commit_id = commit_id;
            write_json_line(record, out);
            return;
        }

        out << "applied {} file(s)\n"_format(result.written_paths.size());
        for (const auto& path : result.written_paths) {
            out << "  " << path << '\n';
        }
        if (commit_id) {
            out << "committed " << *commit_id << '\n';
        }
    }

    static void revert_execution(repl_state& state, std::string_view arg, std::ostream& out, std::ostream& err) {
        auto execution_id = resolve_execution(state, arg, err);
        if (!execution_id) {
            return;
        }
        try {
            auto restored = state.engine.revert(*execution_id);
            out << "reverted {} file(s)\n"_format(restored.size());
            for (const auto& path : restored) {
                out << "  " << path << '\n';
            }
        } catch (const apply_error& e) {
            err << "revert failed [{}]: {}\n"_format(to_string(e.code()), e.what());
        } catch (const engine_error& e) {
            err << "revert failed [{}]: {}\n"_format(to_string(e.code()), e.what());
        }
    }

    static void update_selection(repl_state& state, std::string_view args, std::ostream& out, std::ostream& err) {
        if (args == "clear"sv) {
            state.selection.clear();
            out << "selection cleared\n";
            return;
        }

        auto rest = args;
        while (!rest.empty()) {
            auto [word, tail] = split_word(rest);
            rest = tail;
            auto normalized = state.ws.normalize(word);
            if (!normalized) {
                err << "not inside the workspace: " << word << '\n';
                continue;
            }
            if (std::ranges::find(state.selection, *normalized) == state.selection.end()) {
                state.selection.push_back(std::move(*normalized));
            }
        }

        if (state.selection.empty()) {
            out << "no files selected\n";
            return;
        }
        out << "selected:\n";
        for (const auto& path : state.selection) {
            out << "  " << path << '\n';
        }
    }

    static std::optional<terminal_size> parse_terminal_size(std::string_view text) {
        auto x = text.find('x');
        if (x == std::string_view::npos) {
            return std::nullopt;
        }
        auto cols = utils::parse_arithmetic<uint16_t>(text.substr(0, x));
        auto rows = utils::parse_arithmetic<uint16_t>(text.substr(x + 1U));
        if (!cols || !rows || *cols == 0U || *rows == 0U) {
            return std::nullopt;
        }
        return terminal_size{*cols, *rows};
    }

    static void read_session_output(
            repl_state& state, std::string_view session_id, std::chrono::milliseconds wait, std::ostream& out) {
        auto it = state.attached.find(session_id);
        if (it == state.attached.end()) {
            throw session_error{session_errc::not_found, "no attached session: {}"_format(session_id)};
        }

        auto& session = it->second;
        auto deadline = std::chrono::steady_clock::now() + wait;
        while (!session.output.ended()) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                    deadline - std::chrono::steady_clock::now());
            if (remaining <= 0ms) {
                break;
            }
            auto chunk = session.output.next(remaining);
            if (!chunk) {
                continue;
            }
            if (chunk->sequence != session.next_sequence) {
                out << "\n[{} chunk(s) of output dropped]\n"_format(chunk->sequence - session.next_sequence);
            }
            session.next_sequence = chunk->sequence + 1U;
            out << chunk->data;
        }
        out.flush();
        if (session.output.ended()) {
            out << "\n[session " << session_id << " ended]\n";
        }
    }

    static void process_sandbox_command(repl_state& state, std::string_view args, std::ostream& out, std::ostream& err) {
        auto [sub, rest] = split_word(args);
        try {
            if (sub == "list"sv) {
                auto sessions = state.sessions.list_sessions();
                if (sessions.empty()) {
                    out << "no sandbox sessions\n";
                    return;
                }
                for (const auto& info : sessions) {
                    out << "  {} {} {}x{}{}\n"_format(
                            info.session_id,
                            info.target_id,
                            info.dimensions.cols,
                            info.dimensions.rows,
                            info.ended ? " (ended)"sv : ""sv);
                }
                return;
            }
            if (sub == "open"sv) {
                auto [target, size_arg] = split_word(rest);
                if (target.empty()) {
                    err << "invalid :sandbox open, expected a target\n";
                    return;
                }
                terminal_size size{};
                if (!size_arg.empty()) {
                    auto parsed = parse_terminal_size(size_arg);
                    if (!parsed) {
                        err << "invalid terminal size: " << size_arg << " (expected <cols>x<rows>)\n";
                        return;
                    }
                    size = *parsed;
                }
                auto session_id = state.sessions.create_session(target, size);
                state.attached.emplace(session_id, attached_session{state.sessions.attach(session_id)});
                out << "opened " << session_id << '\n';
                return;
            }

            auto [session_id, tail] = split_word(rest);
            if (session_id.empty()) {
                err << "invalid :sandbox " << sub << ", expected a session id\n";
                return;
            }

            if (sub == "send"sv) {
                state.sessions.send_input(session_id, "{}\n"_format(tail));
                return;
            }
            if (sub == "read"sv) {
                auto wait = std::chrono::milliseconds{default_sandbox_read_wait};
                if (!tail.empty()) {
                    auto ms = utils::parse_arithmetic<int>(tail);
                    if (!ms || *ms < 0) {
                        err << "invalid wait: " << tail << " (expected milliseconds)\n";
                        return;
                    }
                    wait = std::chrono::milliseconds{*ms};
                }
                read_session_output(state, session_id, wait, out);
                return;
            }
            if (sub == "resize"sv) {
                auto size = parse_terminal_size(tail);
                if (!size) {
                    err << "invalid terminal size: " << tail << " (expected <cols>x<rows>)\n";
                    return;
                }
                state.sessions.resize(session_id, *size);
                return;
            }
            if (sub == "signal"sv) {
                session_signal sig{};
                if (!try_parse_session_signal(tail, sig)) {
                    err << "invalid signal: " << tail << " (expected interrupt|terminate|kill)\n";
                    return;
                }
                state.sessions.send_signal(session_id, sig);
                return;
            }
            if (sub == "close"sv) {
                state.attached.erase(std::string{session_id});
                state.sessions.close_session(session_id);
                out << "closed " << session_id << '\n';
                return;
            }
        } catch (const session_error& e) {
            err << "sandbox error [{}]: {}\n"_format(to_string(e.code()), e.what());
            return;
        }

        err << "unknown :sandbox command: " << sub << " (expected open|send|read|resize|signal|close|list)\n";
    }

    // applied to the running REPL right away; everything else is picked up on the next start
    static bool is_live_setting(std::string_view assignment) {
        auto key = utils::trim_view(assignment.substr(0, assignment.find('=')));
        return key == "output"sv || key == "color"sv || key == "quiet"sv || key == "verbose"sv ||
               key == "vcs_auto_commit"sv;
    }

    static bool process_command(std::string_view cmd, repl_state& state, bool& should_quit) {
        auto& out = std::cout;
        auto& err = std::cerr;

        if (cmd == ":quit"sv || cmd == ":q"sv) {
            should_quit = true;
            return true;
        }
        if (cmd == ":help"sv) {
            print_help(out);
            return true;
        }
        if (cmd == ":config"sv) {
            print_config(state.cfg, out);
            return true;
        }
        if (auto assignment = command_argument(cmd, ":set"sv)) {
            if (!apply_config_assignment(state.cfg, *assignment, err)) {
                return true;
            }
            try {
                save_persisted_config(state.cfg);
            } catch (const std::runtime_error& e) {
                err << "failed to persist config: " << e.what() << '\n';
            }
            out << "updated " << *assignment;
            if (!is_live_setting(*assignment)) {
                out << " (applies from the next start)";
            }
            out << '\n';
            return true;
        }
        if (auto args = command_argument(cmd, ":select"sv)) {
            update_selection(state, *args, out, err);
            return true;
        }
        if (cmd == ":status"sv) {
            auto executions = state.engine.list();
            if (executions.empty()) {
                out << "no executions\n";
                return true;
            }
            for (const auto& snapshot : executions) {
                out << "  {} {:<17} {}\n"_format(snapshot.id, to_string(snapshot.status), snapshot.command.raw_input);
                if (snapshot.failure) {
                    out << "      {}.{}: {}\n"_format(
                            snapshot.failure->category, snapshot.failure->kind, snapshot.failure->message);
                }
            }
            return true;
        }
        if (auto arg = command_argument(cmd, ":changes"sv)) {
            if (auto execution_id = resolve_execution(state, *arg, err)) {
                try {
                    print_changes(state, state.engine.get(*execution_id), out);
                } catch (const engine_error& e) {
                    err << e.what() << '\n';
                }
            }
            return true;
        }
        if (auto arg = command_argument(cmd, ":diff"sv)) {
            if (arg->empty()) {
                err << "invalid :diff, expected a change id\n";
                return true;
            }
            if (!state.last_execution) {
                err << "no execution yet\n";
                return true;
            }
            auto snapshot = state.engine.get(*state.last_execution);
            auto it = std::ranges::find(snapshot.changes, *arg, &change::id);
            if (it == snapshot.changes.end()) {
                err << "unknown change: " << *arg << '\n';
                return true;
            }
            auto hunks = generate_diff(it->original, it->modified);
            if (hunks.empty()) {
                out << "no differences\n";
                return true;
            }
            out << format_unified_diff(it->file_path, hunks);
            return true;
        }
        if (auto arg = command_argument(cmd, ":accept"sv)) {
            decide_changes(state, *arg, decision_kind::accept, out, err);
            return true;
        }
        if (auto arg = command_argument(cmd, ":reject"sv)) {
            decide_changes(state, *arg, decision_kind::reject, out, err);
            return true;
        }
        if (auto arg = command_argument(cmd, ":edit"sv)) {
            try {
                edit_change(state, *arg, out, err);
            } catch (const std::runtime_error& e) {
                err << "edit failed: " << e.what() << '\n';
            }
            return true;
        }
        if (auto arg = command_argument(cmd, ":commit"sv)) {
            commit_execution(state, *arg, out, err);
            return true;
        }
        if (auto arg = command_argument(cmd, ":revert"sv)) {
            revert_execution(state, *arg, out, err);
            return true;
        }
        if (cmd == ":cancel"sv) {
            auto active = state.engine.active_id();
            if (!active) {
                out << "no execution in flight\n";
                return true;
            }
            state.engine.cancel(*active);
            out << "cancelled " << *active << '\n';
            return true;
        }
        if (auto arg = command_argument(cmd, ":events"sv)) {
            if (auto execution_id = resolve_execution(state, *arg, err)) {
                try {
                    event_renderer renderer{state.cfg, out, err};
                    for (const auto& ev : state.engine.events(*execution_id)) {
                        renderer.render(ev);
                    }
                    renderer.end_line();
                } catch (const engine_error& e) {
                    err << e.what() << '\n';
                }
            }
            return true;
        }
        if (auto arg = command_argument(cmd, ":history"sv)) {
            auto entries = arg->empty() ? state.history.entries() : state.history.search(*arg);
            if (entries.empty()) {
                out << "no history\n";
                return true;
            }
            for (const auto& entry : entries) {
                out << "  " << entry << '\n';
            }
            return true;
        }
        if (auto arg = command_argument(cmd, ":tree"sv)) {
            try {
                auto tree = state.ws.file_tree(*arg);
                out << (tree.path.empty() ? "."sv : std::string_view{tree.path}) << "/\n";
                print_file_tree(tree, 1U, out);
            } catch (const context_build_error& e) {
                err << "tree failed [{}]: {}\n"_format(to_string(e.code()), e.what());
            }
            return true;
        }
        if (auto arg = command_argument(cmd, ":search"sv)) {
            if (arg->empty()) {
                err << "invalid :search, expected a query\n";
                return true;
            }
            auto paths = state.ws.search_files(*arg);
            if (paths.empty()) {
                out << "no matching files\n";
            }
            for (const auto& path : paths) {
                out << "  " << path << '\n';
            }
            return true;
        }
        if (auto arg = command_argument(cmd, ":grep"sv)) {
            if (arg->empty()) {
                err << "invalid :grep, expected a query\n";
                return true;
            }
            auto matches = state.ws.search_content(*arg);
            if (matches.empty()) {
                out << "no matches\n";
            }
            for (const auto& m : matches) {
                out << "{}:{}:{}: {}\n"_format(m.path, m.line, m.column_start, m.line_text);
            }
            return true;
        }
        if (auto arg = command_argument(cmd, ":info"sv)) {
            if (arg->empty()) {
                err << "invalid :info, expected a path\n";
                return true;
            }
            try {
                auto info = state.ws.get_file_info(*arg);
                out << ("  path={}\n"
                        "  directory={}\n"
                        "  size={}\n"
                        "  lines={}\n"
                        "  language={}\n"_format(
                                info.path, info.is_directory, info.size, info.line_count, info.language));
            } catch (const context_build_error& e) {
                err << "info failed [{}]: {}\n"_format(to_string(e.code()), e.what());
            }
            return true;
        }
        if (auto arg = command_argument(cmd, ":vcs"sv)) {
            auto [sub, path] = split_word(*arg);
            if (sub != "diff"sv) {
                err << "unknown :vcs command: " << sub << " (expected diff)\n";
                return true;
            }
            if (!state.vcs) {
                err << "version control is disabled (:set vcs=true and restart)\n";
                return true;
            }
            try {
                out << state.vcs->diff(path.empty() ? std::nullopt : std::optional<std::string_view>{path});
            } catch (const vcs_error& e) {
                err << e.what() << '\n';
            }
            return true;
        }
        if (auto arg = command_argument(cmd, ":sandbox"sv)) {
            process_sandbox_command(state, *arg, out, err);
            return true;
        }

        err << "unknown command: " << cmd << '\n';
        return true;
    }

}}  // namespace quill::cli::detail

namespace quill::cli {

    void run_repl(startup_config& cfg) {
        detail::repl_state state{cfg};
        line_editor editor{cfg};
        bool should_quit = false;

        if (!cfg.quiet) {
            std::cout << "quill " << internal::platform::version << '\n';
            std::cout << "workspace: " << state.ws.root().string() << '\n';
            if (cfg.backend_command.empty()) {
                std::cout << "no reasoning backend configured (--backend or :set backend_command=...)\n";
            }
            std::cout << "type :help for commands\n";
        }

        while (!should_quit) {
            auto next_line = editor.read_line("quill> "sv);
            if (!next_line) {
                std::cout << '\n';
                break;
            }

            auto line = utils::trim_view(*next_line);
            if (line.empty()) {
                continue;
            }
            state.history.add(line);

            if (line.starts_with(':')) {
                (void)detail::process_command(line, state, should_quit);
                continue;
            }
            detail::submit_and_stream(state, line);
        }
    }

    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg) {
        CLI::App app{"quill"};

        bool show_version = false;
        bool no_history = false;
        std::string workspace_arg{};
        std::string cache_dir_arg{};
        std::string history_file_arg{};
        std::string output_arg{};
        std::string color_arg{};
        std::string backend_arg{};
        std::string knowledge_arg{};
        std::string system_prompt_arg{};
        std::string sandbox_root_arg{};
        std::string sandbox_shell_arg{};
        std::string context_timeout_arg{};
        std::string connect_timeout_arg{};
        std::string max_file_bytes_arg{};

        app.add_flag("--version", show_version, "Print version and exit");
        auto* workspace_opt = app.add_option("-w,--workspace", workspace_arg, "Workspace root directory");
        auto* cache_dir_opt = app.add_option("--cache-dir", cache_dir_arg, "Config/history directory");
        auto* history_file_opt = app.add_option("--history-file", history_file_arg, "Persistent REPL history path");
        app.add_flag("--no-history", no_history, "Disable persistent REPL history");
        auto* backend_opt = app.add_option("--backend", backend_arg, "Reasoning backend command line");
        auto* knowledge_opt = app.add_option("--knowledge", knowledge_arg, "Knowledge service command line");
        auto* system_prompt_opt = app.add_option("--system-prompt", system_prompt_arg, "Base system prompt");
        auto* context_timeout_opt =
                app.add_option("--context-timeout-ms", context_timeout_arg, "Context assembly budget");
        auto* connect_timeout_opt =
                app.add_option("--connect-timeout-ms", connect_timeout_arg, "Budget until the backend answers");
        auto* max_file_bytes_opt = app.add_option("--max-file-bytes", max_file_bytes_arg, "Largest readable file");
        auto* sandbox_root_opt = app.add_option("--sandbox-root", sandbox_root_arg, "Directory of sandbox targets");
        auto* sandbox_shell_opt = app.add_option("--sandbox-shell", sandbox_shell_arg, "Shell run in sandboxes");
        auto* vcs_opt = app.add_flag("--vcs", "Enable git integration");
        auto* vcs_auto_commit_opt = app.add_flag("--vcs-auto-commit", "Commit through git after :commit");
        auto* output_opt = app.add_option("--output", output_arg, "Output mode: table|json");
        auto* color_opt = app.add_option("--color", color_arg, "Color mode: auto|always|never");
        app.add_flag("--no-color", "Force color mode to never");
        app.add_flag("--print-config", cfg.print_config, "Print resolved config and exit");
        app.add_flag("--quiet", cfg.quiet, "Suppress non-essential output");
        app.add_flag("--verbose", cfg.verbose, "Enable verbose output");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            return std::optional<int>{app.exit(e)};
        }

        if (show_version) {
            std::cout << "quill " << internal::platform::version << '\n';
            return std::optional<int>{0};
        }

        if (cfg.quiet && cfg.verbose) {
            std::cerr << "--quiet and --verbose are mutually exclusive\n";
            return std::optional<int>{2};
        }

        // persisted values sit between the defaults and the command line
        if (cache_dir_opt->count() > 0U) {
            cfg.cache_dir = cache_dir_arg;
            cfg.history_file = cfg.cache_dir / "history";
        }
        try {
            load_persisted_config(cfg);
        } catch (const std::runtime_error& e) {
            std::cerr << "failed to load persisted config: " << e.what() << '\n';
            return std::optional<int>{2};
        }

        if (output_opt->count() > 0U && !try_parse_output_mode(output_arg, cfg.output)) {
            std::cerr << "invalid --output value: " << output_arg << " (expected table|json)\n";
            return std::optional<int>{2};
        }
        if (color_opt->count() > 0U && !try_parse_color_mode(color_arg, cfg.color)) {
            std::cerr << "invalid --color value: " << color_arg << " (expected auto|always|never)\n";
            return std::optional<int>{2};
        }

        const std::pair<CLI::Option*, std::string_view> assignments[] = {
                {backend_opt, "backend_command"sv},
                {knowledge_opt, "knowledge_command"sv},
                {system_prompt_opt, "system_prompt"sv},
                {context_timeout_opt, "context_timeout_ms"sv},
                {connect_timeout_opt, "connect_timeout_ms"sv},
                {max_file_bytes_opt, "max_file_bytes"sv},
                {sandbox_root_opt, "sandbox_root"sv},
                {sandbox_shell_opt, "sandbox_shell"sv},
        };
        const std::string* values[] = {
                &backend_arg,
                &knowledge_arg,
                &system_prompt_arg,
                &context_timeout_arg,
                &connect_timeout_arg,
                &max_file_bytes_arg,
                &sandbox_root_arg,
                &sandbox_shell_arg,
        };
        for (size_t i = 0U; i < std::size(assignments); ++i) {
            auto [opt, key] = assignments[i];
            if (opt->count() == 0U) {
                continue;
            }
            if (!apply_config_assignment(cfg, "{}={}"_format(key, *values[i]), std::cerr)) {
                return std::optional<int>{2};
            }
        }

        if (workspace_opt->count() > 0U) {
            cfg.workspace_root = workspace_arg;
        }
        if (history_file_opt->count() > 0U) {
            cfg.history_file = history_file_arg;
        }
        if (no_history) {
            cfg.history_enabled = false;
        }
        if (vcs_opt->count() > 0U) {
            cfg.vcs_enabled = true;
        }
        if (vcs_auto_commit_opt->count() > 0U) {
            cfg.vcs_enabled = true;
            cfg.vcs_auto_commit = true;
        }
        if (app.get_option("--no-color")->count() > 0U) {
            cfg.color = color_mode::never;
        }

        if (cfg.print_config) {
            detail::print_config(cfg, std::cout);
            return std::optional<int>{0};
        }

        return std::nullopt;
    }

}  // namespace quill::cli
