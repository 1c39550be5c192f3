#include "quill/context.hpp"

#include "quill/config.hpp"
#include "quill/format.hpp"
#include "quill/utils.hpp"

#include <algorithm>
#include <cerrno>
#include <system_error>

using namespace quill::literals;

namespace quill {

    namespace fs = std::filesystem;

    namespace detail {

        using clock = std::chrono::steady_clock;

        static void check_deadline(clock::time_point deadline, std::string_view stage) {
            if (clock::now() >= deadline) {
                throw execution_error{execution_errc::timeout, "context build timed out while {}"_format(stage)};
            }
        }

        // Knowledge query terms: the request text first, then each mentioned path
        static std::vector<std::string> query_terms(const parsed_command& command) {
            std::vector<std::string> terms{};
            if (!command.argument.empty()) {
                terms.push_back(command.argument);
            }
            for (const auto& path : command.mentioned_files) {
                terms.push_back(path);
            }
            return terms;
        }

    }  // namespace detail

    context_options context_options::from_config(const startup_config& cfg) {
        context_options opts{};
        opts.max_file_bytes = cfg.max_file_bytes;
        opts.max_knowledge_snippets = cfg.max_knowledge_snippets;
        opts.timeout = std::chrono::milliseconds{cfg.context_timeout_ms};
        return opts;
    }

    context_builder::context_builder(const workspace& ws, knowledge_service* knowledge, context_options opts)
            : workspace_{ws}, knowledge_{knowledge}, opts_{opts} {}

    file_snapshot context_builder::read_file(std::string_view path) const {
        auto rel = workspace_.normalize(path);
        if (!rel || rel->empty()) {
            throw context_build_error{
                    context_errc::permission_denied, "path is outside the workspace: {}"_format(path), std::string{path}};
        }
        auto absolute = workspace_.root() / *rel;

        std::error_code ec{};
        auto status = fs::status(absolute, ec);
        if (ec && ec != std::errc::no_such_file_or_directory) {
            auto code = ec == std::errc::permission_denied ? context_errc::permission_denied : context_errc::not_found;
            throw context_build_error{code, "cannot stat {}: {}"_format(*rel, ec.message()), *rel};
        }
        if (!fs::exists(status)) {
            throw context_build_error{context_errc::not_found, "file not found: {}"_format(*rel), *rel};
        }
        if (!fs::is_regular_file(status)) {
            throw context_build_error{context_errc::not_found, "not a regular file: {}"_format(*rel), *rel};
        }

        auto size = fs::file_size(absolute, ec);
        if (!ec && size > opts_.max_file_bytes) {
            throw context_build_error{
                    context_errc::too_large,
                    "{} is {} bytes (limit {})"_format(*rel, size, opts_.max_file_bytes),
                    *rel};
        }

        try {
            auto content = read_file_bytes(absolute);
            if (content.size() > opts_.max_file_bytes) {
                throw context_build_error{
                        context_errc::too_large,
                        "{} is {} bytes (limit {})"_format(*rel, content.size(), opts_.max_file_bytes),
                        *rel};
            }
            return {*rel, std::move(content)};
        } catch (const std::system_error& e) {
            auto code = e.code() == std::errc::permission_denied ? context_errc::permission_denied
                                                                   : context_errc::not_found;
            throw context_build_error{code, "cannot read {}: {}"_format(*rel, e.code().message()), *rel};
        }
    }

    execution_context context_builder::build(
            const parsed_command& command,
            const std::vector<std::string>& selection,
            std::vector<decision_record> prior_decisions,
            std::stop_token stop) const {
        auto deadline = detail::clock::now() + opts_.timeout;

        execution_context ctx{};
        ctx.workspace_root = workspace_.root();
        ctx.active_command = command;
        ctx.prior_decisions = std::move(prior_decisions);

        for (const auto& path : selection) {
            auto rel = workspace_.normalize(path);
            ctx.selected_files.push_back(rel ? *rel : path);
        }
        std::ranges::sort(ctx.selected_files);
        auto dup = std::ranges::unique(ctx.selected_files);
        ctx.selected_files.erase(dup.begin(), dup.end());

        std::vector<std::string> ordered{};
        auto add_unique = [&ordered](const std::string& path) {
            if (std::ranges::find(ordered, path) == ordered.end()) {
                ordered.push_back(path);
            }
        };
        for (const auto& path : command.mentioned_files) {
            auto rel = workspace_.normalize(path);
            add_unique(rel ? *rel : path);
        }
        for (const auto& path : ctx.selected_files) {
            add_unique(path);
        }

        for (const auto& path : ordered) {
            if (stop.stop_requested()) {
                return ctx;
            }
            detail::check_deadline(deadline, "reading files");
            ctx.files.push_back(read_file(path));
        }

        if (knowledge_ != nullptr && !stop.stop_requested()) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - detail::clock::now());
            try {
                auto snippets = knowledge_->query(detail::query_terms(command), command.verb, remaining);
                if (snippets.size() > opts_.max_knowledge_snippets) {
                    snippets.resize(opts_.max_knowledge_snippets);
                }
                ctx.knowledge_snippets = std::move(snippets);
            } catch (const std::exception& e) {
                ctx.warnings.push_back("knowledge service unavailable: {}"_format(e.what()));
                ctx.knowledge_snippets.clear();
            }
            detail::check_deadline(deadline, "querying the knowledge service");
        }

        return ctx;
    }

}  // namespace quill
