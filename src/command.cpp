#include "quill/command.hpp"

#include "quill/format.hpp"
#include "quill/utils.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

using namespace quill::literals;

namespace quill {

    namespace detail {

        using namespace std::string_view_literals;

        static constexpr std::array<flag_spec, 2> global_flag_table{{
                {"dry-run"sv, flag_shape::boolean},
                {"model"sv, flag_shape::value},
        }};

        static constexpr std::array<flag_spec, 1> implement_flags{{{"no-verify"sv, flag_shape::boolean}}};
        static constexpr std::array<flag_spec, 1> tasks_flags{{{"status"sv, flag_shape::value}}};

        static constexpr std::array<command_spec, 8> registry{{
                {"spec"sv, {}, "/spec <description>"sv, "Create or update a specification"sv, true, {}},
                {"plan"sv, {}, "/plan <task>"sv, "Generate an implementation plan"sv, true, {}},
                {"tasks"sv, {}, "/tasks [filter]"sv, "List and manage tasks"sv, false, tasks_flags},
                {"implement"sv,
                 "impl"sv,
                 "/implement <instruction>"sv,
                 "Implement changes with AI assistance"sv,
                 true,
                 implement_flags},
                {"debug"sv, {}, "/debug [error] [in <file>]"sv, "Debug issues and suggest fixes"sv, false, {}},
                {"review"sv, {}, "/review [files]"sv, "Review code and suggest improvements"sv, false, {}},
                {"ask"sv, {}, "/ask <question>"sv, "Ask any question about the codebase"sv, true, {}},
                {"help"sv, "?"sv, "/help"sv, "Show the command reference"sv, false, {}},
        }};

        struct token {
            std::string text{};
            size_t begin{};
            size_t end{};
        };

        static constexpr bool is_space(char c) {
            return c == ' ' || c == '\t' || c == '\r' || c == '\n';
        }

        // Splits on whitespace; quoted runs ("..." or '...') keep their spaces and lose the quotes
        static std::vector<token> tokenize(std::string_view text) {
            std::vector<token> tokens{};
            size_t i = 0U;
            while (i < text.size()) {
                while (i < text.size() && is_space(text[i])) {
                    ++i;
                }
                if (i >= text.size()) {
                    break;
                }

                token current{};
                current.begin = i;
                char quote = '\0';
                while (i < text.size()) {
                    auto c = text[i];
                    if (quote != '\0') {
                        if (c == quote) {
                            quote = '\0';
                        }
                        else {
                            current.text.push_back(c);
                        }
                        ++i;
                        continue;
                    }
                    if (c == '"' || c == '\'') {
                        quote = c;
                        ++i;
                        continue;
                    }
                    if (is_space(c)) {
                        break;
                    }
                    current.text.push_back(c);
                    ++i;
                }
                current.end = i;
                tokens.push_back(std::move(current));
            }
            return tokens;
        }

        static constexpr bool is_flag_name_char(char c) {
            return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-' ||
                   c == '_';
        }

        static bool parse_flag(std::string_view text, parsed_command& command) {
            auto body = text.substr(2U);
            auto eq = body.find('=');
            auto name = body.substr(0U, eq);
            if (name.empty() || name.front() == '-' || !std::ranges::all_of(name, is_flag_name_char)) {
                return false;
            }
            if (eq == std::string_view::npos) {
                command.flags.insert_or_assign(std::string{name}, flag_value{true});
                return true;
            }
            auto value = body.substr(eq + 1U);
            if (value.empty()) {
                return false;
            }
            command.flags.insert_or_assign(std::string{name}, flag_value{std::string{value}});
            return true;
        }

        static void add_mention(parsed_command& command, std::string_view path) {
            if (path.empty()) {
                return;
            }
            if (std::ranges::find(command.mentioned_files, path) != command.mentioned_files.end()) {
                return;
            }
            command.mentioned_files.emplace_back(path);
        }

        static const flag_spec* find_flag(std::span<const flag_spec> table, std::string_view name) {
            auto it = std::ranges::find(table, name, &flag_spec::name);
            return it == table.end() ? nullptr : &*it;
        }

    }  // namespace detail

    std::span<const command_spec> command_registry() {
        return detail::registry;
    }

    std::span<const flag_spec> global_flags() {
        return detail::global_flag_table;
    }

    const command_spec* find_command(std::string_view verb) {
        for (const auto& spec : detail::registry) {
            if (spec.verb == verb || (!spec.alias.empty() && spec.alias == verb)) {
                return &spec;
            }
        }
        return nullptr;
    }

    bool parsed_command::has_flag(std::string_view name) const {
        auto it = flags.find(name);
        if (it == flags.end()) {
            return false;
        }
        if (auto* value = std::get_if<bool>(&it->second)) {
            return *value;
        }
        return true;
    }

    std::optional<std::string> parsed_command::flag_string(std::string_view name) const {
        auto it = flags.find(name);
        if (it == flags.end()) {
            return std::nullopt;
        }
        if (auto* value = std::get_if<std::string>(&it->second)) {
            return *value;
        }
        return std::nullopt;
    }

    parsed_command parse(std::string_view raw_input) {
        parsed_command command{};
        command.raw_input = std::string{raw_input};

        auto trimmed = utils::trim_view(raw_input);
        if (trimmed.empty()) {
            return command;
        }

        std::string_view rest = trimmed;
        if (trimmed.front() == '/') {
            auto verb_end = trimmed.find_first_of(" \t\r\n");
            auto verb_token = trimmed.substr(1U, verb_end == std::string_view::npos ? verb_end : verb_end - 1U);
            auto verb = utils::to_lower(verb_token);
            if (const auto* spec = find_command(verb)) {
                command.verb = std::string{spec->verb};
            }
            else {
                command.verb = std::move(verb);
            }
            rest = verb_end == std::string_view::npos ? std::string_view{} : trimmed.substr(verb_end);
        }
        else {
            command.verb = "ask";
        }

        std::string argument{};
        size_t cursor = 0U;
        for (auto& tok : detail::tokenize(rest)) {
            if (tok.text.starts_with("--"sv) && rest.substr(tok.begin, 2U) == "--"sv) {
                if (!detail::parse_flag(tok.text, command)) {
                    command.malformed_flags.push_back(std::string{rest.substr(tok.begin, tok.end - tok.begin)});
                }
                argument.append(rest.substr(cursor, tok.begin - cursor));
                cursor = tok.end;
                while (cursor < rest.size() && detail::is_space(rest[cursor])) {
                    ++cursor;
                }
                continue;
            }
            if (tok.text.size() > 1U && tok.text.front() == '@') {
                detail::add_mention(command, std::string_view{tok.text}.substr(1U));
            }
        }
        if (cursor < rest.size()) {
            argument.append(rest.substr(cursor));
        }
        command.argument = std::string{utils::trim_view(argument)};

        if (command.verb == "debug"sv) {
            auto pos = command.argument.find(" in "sv);
            if (pos != std::string::npos) {
                auto file = utils::trim_view(std::string_view{command.argument}.substr(pos + 4U));
                if (file.starts_with('@')) {
                    file.remove_prefix(1U);
                }
                detail::add_mention(command, file);
            }
        }

        return command;
    }

    validation_result validate(const parsed_command& command) {
        if (command.verb.empty()) {
            return {validation_status::unknown_verb, "empty command"};
        }

        const auto* spec = find_command(command.verb);
        if (spec == nullptr) {
            return {validation_status::unknown_verb, "unknown command: /{}"_format(command.verb)};
        }

        if (!command.malformed_flags.empty()) {
            return {validation_status::malformed_flag, "malformed flag: {}"_format(command.malformed_flags.front())};
        }

        for (const auto& [name, value] : command.flags) {
            const auto* flag = detail::find_flag(spec->flags, name);
            if (flag == nullptr) {
                flag = detail::find_flag(detail::global_flag_table, name);
            }
            if (flag == nullptr) {
                return {validation_status::malformed_flag, "unknown flag --{} for /{}"_format(name, spec->verb)};
            }
            auto is_boolean = std::holds_alternative<bool>(value);
            if (flag->shape == flag_shape::boolean && !is_boolean) {
                return {validation_status::malformed_flag, "flag --{} does not take a value"_format(name)};
            }
            if (flag->shape == flag_shape::value && is_boolean) {
                return {validation_status::malformed_flag, "flag --{} expects --{}=<value>"_format(name, name)};
            }
        }

        if (spec->requires_argument && command.argument.empty()) {
            return {validation_status::missing_argument, "usage: {}"_format(spec->usage)};
        }

        return {};
    }

    std::vector<suggestion> suggestions(std::string_view partial, std::span<const std::string> recent_history) {
        struct ranked {
            suggestion item{};
            size_t order{};
        };

        auto registry = command_registry();
        auto needle = utils::trim_view(partial);
        std::vector<ranked> ranked_items{};

        if (needle.empty() || needle.front() == '/') {
            auto verb_needle = needle.empty() ? std::string{} : utils::to_lower(needle.substr(1U));
            for (size_t i = 0U; i < registry.size(); ++i) {
                const auto& spec = registry[i];
                int score = 0;
                if (spec.verb == verb_needle) {
                    score = 4;
                }
                else if (spec.verb.starts_with(verb_needle)) {
                    score = 3;
                }
                else if (!spec.alias.empty() && spec.alias.starts_with(verb_needle)) {
                    score = 2;
                }
                if (score == 0) {
                    continue;
                }
                ranked_items.push_back(
                        ranked{suggestion{"/" + std::string{spec.verb}, suggestion_kind::command, score}, i});
            }
        }

        if (!needle.empty()) {
            std::vector<std::string> seen{};
            for (auto it = recent_history.rbegin(); it != recent_history.rend(); ++it) {
                const auto& entry = *it;
                if (entry == needle || !utils::starts_with_case(entry, needle)) {
                    continue;
                }
                if (std::ranges::find(seen, entry) != seen.end()) {
                    continue;
                }
                seen.push_back(entry);
                ranked_items.push_back(ranked{suggestion{entry, suggestion_kind::history, 1}, registry.size()});
            }
        }

        std::ranges::sort(ranked_items, [](const ranked& lhs, const ranked& rhs) {
            if (lhs.item.score != rhs.item.score) {
                return lhs.item.score > rhs.item.score;
            }
            if (lhs.order != rhs.order) {
                return lhs.order < rhs.order;
            }
            return lhs.item.text < rhs.item.text;
        });

        std::vector<suggestion> out{};
        out.reserve(ranked_items.size());
        for (auto& entry : ranked_items) {
            out.push_back(std::move(entry.item));
        }
        return out;
    }

    void command_history::add(std::string_view input) {
        if (utils::trim_view(input).empty()) {
            return;
        }
        if (!entries_.empty() && entries_.back() == input) {
            return;
        }
        entries_.emplace_back(input);
        while (entries_.size() > capacity_) {
            entries_.pop_front();
        }
    }

    std::vector<std::string> command_history::entries() const {
        return {entries_.begin(), entries_.end()};
    }

    std::vector<std::string> command_history::search(std::string_view query) const {
        std::vector<std::string> out{};
        for (const auto& entry : entries_) {
            if (utils::contains_case(entry, query)) {
                out.push_back(entry);
            }
        }
        return out;
    }

    std::string command_reference() {
        std::string out{"commands:\n"};
        for (const auto& spec : command_registry()) {
            out.append("  {:<28} {}"_format(spec.usage, spec.summary));
            if (!spec.alias.empty()) {
                out.append(" (alias /{})"_format(spec.alias));
            }
            if (!spec.flags.empty()) {
                out.append(" [");
                for (size_t i = 0U; i < spec.flags.size(); ++i) {
                    const auto& flag = spec.flags[i];
                    out.append(i == 0U ? "--" : " --");
                    out.append(flag.name);
                    if (flag.shape == flag_shape::value) {
                        out.append("=<value>");
                    }
                }
                out.push_back(']');
            }
            out.push_back('\n');
        }
        out.append("flags accepted by every command: --dry-run, --model=<id>\n");
        out.append("text without a leading '/' is sent as /ask; mention files with @path or @\"path with spaces\"\n");
        return out;
    }

    std::string_view verb_preamble(std::string_view verb) {
        if (verb == "spec"sv) {
            return "Write or refine a specification for the described feature."sv;
        }
        if (verb == "plan"sv) {
            return "Produce a step by step implementation plan without editing files."sv;
        }
        if (verb == "tasks"sv) {
            return "List the outstanding tasks relevant to the request."sv;
        }
        if (verb == "implement"sv) {
            return "Implement the request. Emit every file edit as a fenced block tagged with its workspace "
                   "relative path, either the complete new file or a unified diff."sv;
        }
        if (verb == "debug"sv) {
            return "Find the root cause of the reported problem and propose a minimal fix as file edits."sv;
        }
        if (verb == "review"sv) {
            return "Review the referenced code and point out defects; propose edits only when asked."sv;
        }
        return "Answer the question about the codebase concisely."sv;
    }

}  // namespace quill
