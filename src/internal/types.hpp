#pragma once

#include "quill/services.hpp"

#include <glaze/glaze.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace quill::internal {

    struct persisted_config {
        int schema_version{1};
        std::string workspace_root{};
        std::string history_file{};
        bool history_enabled{true};
        std::string output{};
        std::string color{};
        std::vector<std::string> backend_command{};
        std::vector<std::string> knowledge_command{};
        std::string system_prompt{};
        int context_timeout_ms{10'000};
        int connect_timeout_ms{15'000};
        uint64_t max_file_bytes{1U << 20U};
        uint64_t max_knowledge_snippets{8U};
        uint64_t event_buffer_capacity{256U};
        std::string sandbox_root{};
        std::string sandbox_shell{};
        int session_retention_ms{30'000};
        int session_idle_timeout_ms{0};
        uint64_t session_max_buffered_bytes{1U << 20U};
        bool vcs_enabled{false};
        bool vcs_auto_commit{false};
    };

    struct ledger_record {
        std::string execution_id{};
        std::string change_id{};
        std::string file_path{};
        std::string before{};
        bool before_existed{true};
        std::string after{};
        std::string status{};
        int64_t applied_at_ms{};
        std::optional<int64_t> reverted_at_ms{};
    };

    struct persisted_ledger {
        int schema_version{1};
        std::vector<ledger_record> entries{};
    };

    // ── Reasoning Backend wire protocol (one JSON object per line) ──

    struct wire_chunk {
        std::string kind{};
        std::string payload{};
        std::string path{};
        std::string language{};
        std::string description{};
    };

    // ── Knowledge Service wire protocol ─────────────────────────────

    struct knowledge_request {
        std::vector<std::string> terms{};
        std::string scope{};
    };

    // ── `--output json` records ─────────────────────────────────────

    struct change_record {
        std::string id{};
        std::string file_path{};
        std::string status{};
        bool creates_file{false};
        uint64_t start_line{};
        uint64_t end_line{};
        std::string description{};
    };

    struct event_record {
        uint64_t sequence{};
        std::string kind{};
        std::string execution_id{};
        std::string text{};
        std::optional<change_record> change{};
        bool truncated{false};
        uint64_t change_count{};
        std::string error_kind{};
    };

    struct apply_record {
        std::string execution_id{};
        std::vector<std::string> written_paths{};
        std::optional<std::string> commit_id{};
    };

}  // namespace quill::internal

namespace glz {

    template <>
    struct meta<quill::internal::persisted_config> {
        using T = quill::internal::persisted_config;
        static constexpr auto value =
                object("schema_version",
                       &T::schema_version,
                       "workspace_root",
                       &T::workspace_root,
                       "history_file",
                       &T::history_file,
                       "history_enabled",
                       &T::history_enabled,
                       "output",
                       &T::output,
                       "color",
                       &T::color,
                       "backend_command",
                       &T::backend_command,
                       "knowledge_command",
                       &T::knowledge_command,
                       "system_prompt",
                       &T::system_prompt,
                       "context_timeout_ms",
                       &T::context_timeout_ms,
                       "connect_timeout_ms",
                       &T::connect_timeout_ms,
                       "max_file_bytes",
                       &T::max_file_bytes,
                       "max_knowledge_snippets",
                       &T::max_knowledge_snippets,
                       "event_buffer_capacity",
                       &T::event_buffer_capacity,
                       "sandbox_root",
                       &T::sandbox_root,
                       "sandbox_shell",
                       &T::sandbox_shell,
                       "session_retention_ms",
                       &T::session_retention_ms,
                       "session_idle_timeout_ms",
                       &T::session_idle_timeout_ms,
                       "session_max_buffered_bytes",
                       &T::session_max_buffered_bytes,
                       "vcs_enabled",
                       &T::vcs_enabled,
                       "vcs_auto_commit",
                       &T::vcs_auto_commit);
    };

    template <>
    struct meta<quill::internal::ledger_record> {
        using T = quill::internal::ledger_record;
        static constexpr auto value =
                object("execution_id",
                       &T::execution_id,
                       "change_id",
                       &T::change_id,
                       "file_path",
                       &T::file_path,
                       "before",
                       &T::before,
                       "before_existed",
                       &T::before_existed,
                       "after",
                       &T::after,
                       "status",
                       &T::status,
                       "applied_at_ms",
                       &T::applied_at_ms,
                       "reverted_at_ms",
                       &T::reverted_at_ms);
    };

    template <>
    struct meta<quill::internal::persisted_ledger> {
        using T = quill::internal::persisted_ledger;
        static constexpr auto value = object("schema_version", &T::schema_version, "entries", &T::entries);
    };

    template <>
    struct meta<quill::internal::wire_chunk> {
        using T = quill::internal::wire_chunk;
        static constexpr auto value =
                object("kind",
                       &T::kind,
                       "payload",
                       &T::payload,
                       "path",
                       &T::path,
                       "language",
                       &T::language,
                       "description",
                       &T::description);
    };

    template <>
    struct meta<quill::internal::knowledge_request> {
        using T = quill::internal::knowledge_request;
        static constexpr auto value = object("terms", &T::terms, "scope", &T::scope);
    };

    template <>
    struct meta<quill::knowledge_snippet> {
        using T = quill::knowledge_snippet;
        static constexpr auto value =
                object("text", &T::text, "provenance", &T::provenance, "relevance", &T::relevance);
    };

    template <>
    struct meta<quill::backend_file> {
        using T = quill::backend_file;
        static constexpr auto value = object("path", &T::path, "content", &T::content);
    };

    template <>
    struct meta<quill::backend_request> {
        using T = quill::backend_request;
        static constexpr auto value =
                object("system_prompt",
                       &T::system_prompt,
                       "request",
                       &T::user_request,
                       "verb",
                       &T::verb,
                       "model",
                       &T::model,
                       "flags",
                       &T::flags,
                       "files",
                       &T::files,
                       "knowledge",
                       &T::knowledge,
                       "prior_decisions",
                       &T::prior_decisions);
    };

    template <>
    struct meta<quill::internal::change_record> {
        using T = quill::internal::change_record;
        static constexpr auto value =
                object("id",
                       &T::id,
                       "file_path",
                       &T::file_path,
                       "status",
                       &T::status,
                       "creates_file",
                       &T::creates_file,
                       "start_line",
                       &T::start_line,
                       "end_line",
                       &T::end_line,
                       "description",
                       &T::description);
    };

    template <>
    struct meta<quill::internal::event_record> {
        using T = quill::internal::event_record;
        static constexpr auto value =
                object("sequence",
                       &T::sequence,
                       "kind",
                       &T::kind,
                       "execution_id",
                       &T::execution_id,
                       "text",
                       &T::text,
                       "change",
                       &T::change,
                       "truncated",
                       &T::truncated,
                       "change_count",
                       &T::change_count,
                       "error_kind",
                       &T::error_kind);
    };

    template <>
    struct meta<quill::internal::apply_record> {
        using T = quill::internal::apply_record;
        static constexpr auto value =
                object("execution_id",
                       &T::execution_id,
                       "written_paths",
                       &T::written_paths,
                       "commit_id",
                       &T::commit_id);
    };

}  // namespace glz
