#include "quill/backend.hpp"

#include "quill/format.hpp"
#include "quill/utils.hpp"

#include "internal/process.hpp"
#include "internal/types.hpp"

#include <fcntl.h>
#include <poll.h>

#include <array>
#include <cerrno>

using namespace quill::literals;

namespace quill {

    bool try_parse_chunk_kind(std::string_view text, chunk_kind& out) {
        for (auto kind :
             {chunk_kind::text,
              chunk_kind::thinking,
              chunk_kind::code_block,
              chunk_kind::diff_block,
              chunk_kind::end,
              chunk_kind::disconnected}) {
            if (utils::str_case_eq(text, to_string(kind))) {
                out = kind;
                return true;
            }
        }
        return false;
    }

    namespace detail {

        static backend_chunk decode_chunk(const std::string& line) {
            internal::wire_chunk wire{};
            auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(wire, line);
            if (ec) {
                throw execution_error{
                        execution_errc::backend_protocol_error,
                        "malformed backend chunk: {}"_format(glz::format_error(ec, line))};
            }
            backend_chunk chunk{};
            if (!try_parse_chunk_kind(wire.kind, chunk.kind)) {
                throw execution_error{
                        execution_errc::backend_protocol_error, "unknown backend chunk kind: '{}'"_format(wire.kind)};
            }
            chunk.payload = std::move(wire.payload);
            chunk.path = std::move(wire.path);
            chunk.language = std::move(wire.language);
            chunk.description = std::move(wire.description);
            return chunk;
        }

        class process_stream : public backend_stream {
          public:
            process_stream(std::unique_ptr<internal::child_process> child, std::string request)
                    : child_{std::move(child)}, request_{std::move(request)} {
                for (auto fd : {child_->stdout_fd(), child_->stdin_fd()}) {
                    auto flags = ::fcntl(fd, F_GETFL);
                    ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
                }
                send_request();
            }

            ~process_stream() override = default;

            std::optional<backend_chunk> next(std::chrono::milliseconds wait) override {
                if (finished_ || !child_) {
                    return std::nullopt;
                }
                if (auto chunk = take_line()) {
                    return chunk;
                }
                if (eof_) {
                    return finish_disconnected();
                }

                // the request is pumped from here, so a backend that never reads it cannot block us
                std::array<pollfd, 2> fds{};
                fds[0] = {.fd = child_->stdout_fd(), .events = POLLIN, .revents = 0};
                fds[1] = {.fd = request_sent() ? -1 : child_->stdin_fd(), .events = POLLOUT, .revents = 0};
                int ret = ::poll(fds.data(), fds.size(), static_cast<int>(wait.count()));
                if (ret < 0) {
                    if (errno == EINTR) {
                        return std::nullopt;
                    }
                    return finish_disconnected();
                }
                if (ret == 0) {
                    return std::nullopt;
                }
                if (fds[1].fd >= 0 && (fds[1].revents & (POLLOUT | POLLERR | POLLHUP)) != 0) {
                    send_request();
                }
                if ((fds[0].revents & (POLLIN | POLLHUP | POLLERR)) != 0 &&
                    !internal::read_available(child_->stdout_fd(), buffer_)) {
                    eof_ = true;
                }
                if (auto chunk = take_line()) {
                    return chunk;
                }
                if (eof_) {
                    return finish_disconnected();
                }
                return std::nullopt;
            }

            void close() override {
                if (!child_) {
                    return;
                }
                // the destructor kills and reaps
                auto pid = child_->pid();
                child_.reset();
                debug_log("closed backend stream (pid ", pid, ")");
            }

          private:
            std::unique_ptr<internal::child_process> child_;
            std::string request_;
            size_t sent_{0U};
            std::string buffer_{};
            bool eof_{false};
            bool finished_{false};

            bool request_sent() const { return sent_ >= request_.size(); }

            void send_request() {
                while (!request_sent()) {
                    auto pending = std::string_view{request_}.substr(sent_);
                    auto n = ::write(child_->stdin_fd(), pending.data(), pending.size());
                    if (n > 0) {
                        sent_ += static_cast<size_t>(n);
                        continue;
                    }
                    if (n < 0 && errno == EINTR) {
                        continue;
                    }
                    if (n < 0 && errno == EAGAIN) {
                        return;
                    }
                    // a backend may answer without reading its request; its output still decides the outcome
                    debug_log("backend closed its stdin after ", sent_, " of ", request_.size(), " request bytes");
                    sent_ = request_.size();
                }
                child_->close_stdin();
                request_.clear();
                request_.shrink_to_fit();
                sent_ = 0U;
            }

            std::optional<backend_chunk> take_line() {
                for (;;) {
                    auto nl = buffer_.find('\n');
                    if (nl == std::string::npos) {
                        // a final line without newline still counts once the child is gone
                        if (!eof_ || utils::trim_view(buffer_).empty()) {
                            return std::nullopt;
                        }
                        nl = buffer_.size();
                    }
                    auto line = std::string{utils::trim_view(std::string_view{buffer_}.substr(0, nl))};
                    buffer_.erase(0, std::min(nl + 1U, buffer_.size()));
                    if (line.empty()) {
                        continue;
                    }
                    auto chunk = decode_chunk(line);
                    if (chunk.kind == chunk_kind::end || chunk.kind == chunk_kind::disconnected) {
                        finished_ = true;
                    }
                    return chunk;
                }
            }

            backend_chunk finish_disconnected() {
                finished_ = true;
                debug_log("backend closed its output without an end marker");
                return backend_chunk{.kind = chunk_kind::disconnected};
            }
        };

    }  // namespace detail

    process_backend::process_backend(std::vector<std::string> argv, std::filesystem::path cwd)
            : argv_{std::move(argv)}, cwd_{std::move(cwd)} {}

    std::unique_ptr<backend_stream> process_backend::stream(const backend_request& request) {
        if (argv_.empty()) {
            throw execution_error{execution_errc::backend_unreachable, "no backend command configured"};
        }

        std::string json{};
        if (glz::write_json(request, json)) {
            throw execution_error{execution_errc::backend_protocol_error, "failed to serialize backend request"};
        }
        json.push_back('\n');

        std::unique_ptr<internal::child_process> child{};
        try {
            child = std::make_unique<internal::child_process>(argv_, cwd_);
        } catch (const std::runtime_error& e) {
            throw execution_error{execution_errc::backend_unreachable, e.what()};
        }
        return std::make_unique<detail::process_stream>(std::move(child), std::move(json));
    }

    process_knowledge_service::process_knowledge_service(std::vector<std::string> argv, std::filesystem::path cwd)
            : argv_{std::move(argv)}, cwd_{std::move(cwd)} {}

    std::vector<knowledge_snippet> process_knowledge_service::query(
            const std::vector<std::string>& terms, std::string_view scope, std::chrono::milliseconds timeout) {
        if (timeout.count() <= 0) {
            throw std::runtime_error("no time left for the knowledge query");
        }

        internal::knowledge_request request{.terms = terms, .scope = std::string{scope}};
        std::string json{};
        if (glz::write_json(request, json)) {
            throw std::runtime_error("failed to serialize knowledge request");
        }
        json.push_back('\n');

        auto result = internal::run_process(argv_, json, timeout, cwd_);
        if (result.timed_out) {
            throw std::runtime_error("knowledge service timed out after {}ms"_format(timeout.count()));
        }
        if (result.exit_code != 0) {
            auto reason = utils::trim_view(result.stderr_output);
            throw std::runtime_error(
                    "knowledge service exited with {}{}"_format(
                            result.exit_code, reason.empty() ? std::string{} : ": " + std::string{reason}));
        }

        std::vector<knowledge_snippet> snippets{};
        auto body = utils::trim_view(result.stdout_output);
        if (body.empty()) {
            return snippets;
        }
        if (body.front() == '[') {
            if (glz::read<glz::opts{.error_on_unknown_keys = false}>(snippets, std::string{body})) {
                throw std::runtime_error("malformed knowledge service response");
            }
            return snippets;
        }
        for (auto line : utils::split_lines(body)) {
            line = utils::trim_view(line);
            if (line.empty()) {
                continue;
            }
            knowledge_snippet snippet{};
            if (glz::read<glz::opts{.error_on_unknown_keys = false}>(snippet, std::string{line})) {
                throw std::runtime_error("malformed knowledge snippet: {}"_format(line));
            }
            snippets.push_back(std::move(snippet));
        }
        return snippets;
    }

}  // namespace quill
