#pragma once

#include "errors.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace quill {

    // ── Knowledge Service ───────────────────────────────────────────

    struct knowledge_snippet {
        std::string text{};
        std::string provenance{};
        double relevance{};
    };

    class knowledge_service {
      public:
        virtual ~knowledge_service() = default;

        // Snippets in the service's own relevance order; throws on an unreachable service
        virtual std::vector<knowledge_snippet> query(
                const std::vector<std::string>& terms, std::string_view scope, std::chrono::milliseconds timeout) = 0;
    };

    // ── Reasoning Backend ───────────────────────────────────────────

    enum class chunk_kind : uint8_t {
        text,
        thinking,
        code_block,
        diff_block,
        end,
        // connection closed before an end marker
        disconnected,
    };

    inline constexpr std::string_view to_string(chunk_kind kind) {
        switch (kind) {
            case chunk_kind::text:
                return "text"sv;
            case chunk_kind::thinking:
                return "thinking"sv;
            case chunk_kind::code_block:
                return "code_block"sv;
            case chunk_kind::diff_block:
                return "diff_block"sv;
            case chunk_kind::end:
                return "end"sv;
            case chunk_kind::disconnected:
                return "disconnected"sv;
        }
        return "text"sv;
    }

    bool try_parse_chunk_kind(std::string_view text, chunk_kind& out);

    struct backend_chunk {
        chunk_kind kind{chunk_kind::text};
        std::string payload{};
        // code_block / diff_block only
        std::string path{};
        std::string language{};
        std::string description{};
    };

    struct backend_file {
        std::string path{};
        std::string content{};
    };

    struct backend_request {
        std::string system_prompt{};
        std::string user_request{};
        std::string verb{};
        std::optional<std::string> model{};
        std::map<std::string, std::string, std::less<>> flags{};
        std::vector<backend_file> files{};
        std::vector<knowledge_snippet> knowledge{};
        std::vector<std::string> prior_decisions{};
    };

    class backend_stream {
      public:
        virtual ~backend_stream() = default;

        /*
         * Waits at most `wait` for the next chunk. nullopt means nothing arrived yet; the
         * stream is over after a chunk of kind `end` or `disconnected`. Throws
         * execution_error on protocol violations.
         */
        virtual std::optional<backend_chunk> next(std::chrono::milliseconds wait) = 0;

        // Abandons the stream and releases the connection; may throw
        virtual void close() = 0;
    };

    class reasoning_backend {
      public:
        virtual ~reasoning_backend() = default;

        // Throws execution_error{backend_unreachable} when no stream can be opened
        virtual std::unique_ptr<backend_stream> stream(const backend_request& request) = 0;
    };

    // ── Version-Control Service ─────────────────────────────────────

    class vcs_service {
      public:
        virtual ~vcs_service() = default;

        virtual void stage(const std::vector<std::string>& paths) = 0;
        virtual std::string commit(std::string_view message) = 0;
        virtual std::string diff(std::optional<std::string_view> path = std::nullopt) = 0;
    };

}  // namespace quill
