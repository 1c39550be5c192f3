#pragma once

#include "services.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace quill {

    /*
     * Reasoning Backend reached through a child process.
     *
     * The request is written to the child's stdin as one JSON object followed by a newline,
     * then stdin is closed. The write is non-blocking and advances while the stream is
     * polled, so a child that never reads its request only delays its own output. The child answers on stdout with one JSON object per line:
     *
     *   {"kind":"text","payload":"..."}
     *   {"kind":"thinking","payload":"..."}
     *   {"kind":"code_block","path":"src/a.cpp","language":"cpp","payload":"<full file>"}
     *   {"kind":"diff_block","path":"src/a.cpp","payload":"<unified diff>"}
     *   {"kind":"end"}
     *
     * Exiting without an `end` line is reported as a `disconnected` chunk.
     */
    class process_backend : public reasoning_backend {
      public:
        explicit process_backend(std::vector<std::string> argv, std::filesystem::path cwd = {});

        std::unique_ptr<backend_stream> stream(const backend_request& request) override;

      private:
        std::vector<std::string> argv_;
        std::filesystem::path cwd_;
    };

    /*
     * Knowledge Service reached through a child process: one JSON request
     * `{"terms":[...],"scope":"..."}` on stdin, snippets `{"text","provenance","relevance"}`
     * on stdout, either as a JSON array or one object per line.
     */
    class process_knowledge_service : public knowledge_service {
      public:
        explicit process_knowledge_service(std::vector<std::string> argv, std::filesystem::path cwd = {});

        std::vector<knowledge_snippet> query(
                const std::vector<std::string>& terms,
                std::string_view scope,
                std::chrono::milliseconds timeout) override;

      private:
        std::vector<std::string> argv_;
        std::filesystem::path cwd_;
    };

}  // namespace quill
