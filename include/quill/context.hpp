#pragma once

#include "command.hpp"
#include "services.hpp"
#include "workspace.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <stop_token>
#include <string>
#include <vector>

namespace quill {

    struct startup_config;

    enum class decision_kind : uint8_t { accept, reject, edit };

    inline constexpr std::string_view to_string(decision_kind kind) {
        switch (kind) {
            case decision_kind::accept:
                return "accept"sv;
            case decision_kind::reject:
                return "reject"sv;
            case decision_kind::edit:
                return "edit"sv;
        }
        return "accept"sv;
    }

    struct decision_record {
        std::string execution_id{};
        std::string change_id{};
        std::string file_path{};
        decision_kind kind{decision_kind::accept};
    };

    struct file_snapshot {
        std::string path{};
        std::string content{};
    };

    struct execution_context {
        std::filesystem::path workspace_root{};
        // sorted, unique
        std::vector<std::string> selected_files{};
        // mentioned files in input order, then selected files not already mentioned
        std::vector<file_snapshot> files{};
        std::vector<knowledge_snippet> knowledge_snippets{};
        std::vector<decision_record> prior_decisions{};
        parsed_command active_command{};
        std::vector<std::string> warnings{};
    };

    struct context_options {
        size_t max_file_bytes{1U << 20U};
        size_t max_knowledge_snippets{8U};
        std::chrono::milliseconds timeout{10'000};

        static context_options from_config(const startup_config& cfg);
    };

    class context_builder {
      public:
        // `knowledge` may be null when no Knowledge Service is configured
        context_builder(const workspace& ws, knowledge_service* knowledge, context_options opts = {});

        /*
         * Reads every mentioned and selected file and queries the Knowledge Service.
         *
         * Throws:
         * - context_build_error{not_found|permission_denied|too_large} for an unreadable file
         *   (a path outside the workspace is permission_denied).
         * - execution_error{timeout} once the options' timeout has elapsed.
         * A failing Knowledge Service is recorded in `warnings` and leaves the snippets empty.
         */
        execution_context build(
                const parsed_command& command,
                const std::vector<std::string>& selection,
                std::vector<decision_record> prior_decisions = {},
                std::stop_token stop = {}) const;

        const context_options& options() const noexcept { return opts_; }

      private:
        const workspace& workspace_;
        knowledge_service* knowledge_;
        context_options opts_;

        file_snapshot read_file(std::string_view path) const;
    };

}  // namespace quill
