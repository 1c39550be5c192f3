#pragma once

#include "quill.hpp"
#include "quill/cli.hpp"

#include <catch2/catch_test_macros.hpp>
#include <glaze/glaze.hpp>

#include "../src/internal/extractor.hpp"
#include "../src/internal/types.hpp"

extern "C" {
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>
}

#include <algorithm>
#include <array>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <ranges>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <vector>

namespace quill::test {
    using namespace std::chrono_literals;
    using namespace quill::literals;
}  // namespace quill::test

namespace quill::test::detail {
    namespace fs = std::filesystem;

    struct temp_dir {
        fs::path path{};

        explicit temp_dir(std::string_view prefix) {
            auto now = std::chrono::system_clock::now().time_since_epoch().count();
            std::ostringstream dir_name{};
            dir_name << prefix << "_" << static_cast<long>(::getpid()) << "_" << now;
            path = fs::temp_directory_path() / dir_name.str();
            fs::create_directories(path);
        }

        ~temp_dir() {
            std::error_code ec{};
            fs::remove_all(path, ec);
        }

        temp_dir(const temp_dir&) = delete;
        temp_dir& operator=(const temp_dir&) = delete;
    };

    inline void write_file(const fs::path& path, std::string_view content) {
        auto parent = path.parent_path();
        if (!parent.empty()) {
            fs::create_directories(parent);
        }
        std::ofstream out{path, std::ios::binary};
        REQUIRE(out.good());
        out << content;
        REQUIRE(out.good());
    }

    inline std::string read_file(const fs::path& path) {
        std::ifstream in{path, std::ios::binary};
        REQUIRE(in.good());
        std::ostringstream ss{};
        ss << in.rdbuf();
        return ss.str();
    }

    inline void make_executable_file(const fs::path& path, std::string_view content) {
        write_file(path, content);
        fs::permissions(
                path,
                fs::perms::owner_read | fs::perms::owner_write | fs::perms::owner_exec | fs::perms::group_read |
                        fs::perms::group_exec | fs::perms::others_read | fs::perms::others_exec,
                fs::perm_options::replace);
    }

    inline bool contains(std::string_view haystack, std::string_view needle) {
        return haystack.find(needle) != std::string_view::npos;
    }

    // ── backend chunks ──────────────────────────────────────────────

    inline backend_chunk text_chunk(std::string payload) {
        return backend_chunk{.kind = chunk_kind::text, .payload = std::move(payload)};
    }

    inline backend_chunk thinking_chunk(std::string payload) {
        return backend_chunk{.kind = chunk_kind::thinking, .payload = std::move(payload)};
    }

    inline backend_chunk code_chunk(std::string path, std::string content, std::string description = {}) {
        return backend_chunk{
                .kind = chunk_kind::code_block,
                .payload = std::move(content),
                .path = std::move(path),
                .description = std::move(description)};
    }

    inline backend_chunk diff_chunk(std::string path, std::string diff) {
        return backend_chunk{.kind = chunk_kind::diff_block, .payload = std::move(diff), .path = std::move(path)};
    }

    inline backend_chunk end_chunk() {
        return backend_chunk{.kind = chunk_kind::end};
    }

    inline backend_chunk disconnected_chunk() {
        return backend_chunk{.kind = chunk_kind::disconnected};
    }

    // ── fake reasoning backend ──────────────────────────────────────

    struct backend_script {
        std::mutex mutex{};
        std::condition_variable cv{};
        std::vector<backend_chunk> chunks{};
        // chunks from this index on are held back until release()
        std::optional<size_t> hold_at{};
        bool released{false};
        size_t closes{0U};
    };

    class fake_stream : public backend_stream {
      public:
        explicit fake_stream(std::shared_ptr<backend_script> script) : script_{std::move(script)} {}

        std::optional<backend_chunk> next(std::chrono::milliseconds wait) override {
            std::unique_lock lock{script_->mutex};
            auto held = [this] {
                return script_->hold_at && pos_ >= *script_->hold_at && !script_->released;
            };
            if (pos_ >= script_->chunks.size() || held()) {
                script_->cv.wait_for(lock, wait, [&] { return pos_ < script_->chunks.size() && !held(); });
                if (pos_ >= script_->chunks.size() || held()) {
                    return std::nullopt;
                }
            }
            return script_->chunks[pos_++];
        }

        void close() override {
            std::lock_guard lock{script_->mutex};
            ++script_->closes;
        }

      private:
        std::shared_ptr<backend_script> script_;
        size_t pos_{0U};
    };

    class fake_backend : public reasoning_backend {
      public:
        bool unreachable{false};

        void set_script(std::vector<backend_chunk> chunks, std::optional<size_t> hold_at = std::nullopt) {
            std::lock_guard lock{script_->mutex};
            script_->chunks = std::move(chunks);
            script_->hold_at = hold_at;
            script_->released = false;
        }

        void release() {
            {
                std::lock_guard lock{script_->mutex};
                script_->released = true;
            }
            script_->cv.notify_all();
        }

        std::unique_ptr<backend_stream> stream(const backend_request& request) override {
            std::lock_guard lock{mutex_};
            requests_.push_back(request);
            if (unreachable) {
                throw execution_error{execution_errc::backend_unreachable, "backend is down"};
            }
            return std::make_unique<fake_stream>(script_);
        }

        std::vector<backend_request> requests() const {
            std::lock_guard lock{mutex_};
            return requests_;
        }

        size_t closes() const {
            std::lock_guard lock{script_->mutex};
            return script_->closes;
        }

      private:
        mutable std::mutex mutex_{};
        std::vector<backend_request> requests_{};
        std::shared_ptr<backend_script> script_{std::make_shared<backend_script>()};
    };

    // ── fake knowledge service ──────────────────────────────────────

    class fake_knowledge : public knowledge_service {
      public:
        std::vector<knowledge_snippet> snippets{};
        std::optional<std::string> failure{};
        std::chrono::milliseconds delay{0};

        std::vector<knowledge_snippet> query(
                const std::vector<std::string>& terms,
                std::string_view scope,
                std::chrono::milliseconds /*timeout*/) override {
            {
                std::lock_guard lock{mutex_};
                last_terms = terms;
                last_scope = std::string{scope};
                ++calls;
            }
            if (delay.count() > 0) {
                std::this_thread::sleep_for(delay);
            }
            if (failure) {
                throw std::runtime_error(*failure);
            }
            return snippets;
        }

        std::vector<std::string> last_terms{};
        std::string last_scope{};
        size_t calls{0U};

      private:
        std::mutex mutex_{};
    };

    // ── fake sandbox ────────────────────────────────────────────────

    struct fake_channel_state {
        std::mutex mutex{};
        std::condition_variable cv{};
        std::string written{};
        std::string pending{};
        std::vector<terminal_size> resizes{};
        std::vector<session_signal> signals{};
        bool echo{true};
        bool hung_up{false};
        bool closed{false};
        bool fail_writes{false};
    };

    class fake_channel : public sandbox_channel {
      public:
        explicit fake_channel(std::shared_ptr<fake_channel_state> state) : state_{std::move(state)} {}

        void write(std::string_view bytes) override {
            std::lock_guard lock{state_->mutex};
            if (state_->fail_writes) {
                throw std::runtime_error("write failed");
            }
            state_->written.append(bytes);
            if (state_->echo) {
                state_->pending.append(bytes);
            }
            state_->cv.notify_all();
        }

        read_status read(std::string& out, std::chrono::milliseconds wait) override {
            std::unique_lock lock{state_->mutex};
            state_->cv.wait_for(
                    lock, wait, [this] { return !state_->pending.empty() || state_->hung_up || state_->closed; });
            if (!state_->pending.empty()) {
                out.append(state_->pending);
                state_->pending.clear();
                return read_status::data;
            }
            if (state_->hung_up || state_->closed) {
                return read_status::ended;
            }
            return read_status::idle;
        }

        void resize(terminal_size size) override {
            std::lock_guard lock{state_->mutex};
            state_->resizes.push_back(size);
        }

        void signal(session_signal sig) override {
            std::lock_guard lock{state_->mutex};
            state_->signals.push_back(sig);
        }

        void close() override {
            std::lock_guard lock{state_->mutex};
            state_->closed = true;
            state_->cv.notify_all();
        }

      private:
        std::shared_ptr<fake_channel_state> state_;
    };

    class fake_sandbox_provider : public sandbox_provider {
      public:
        std::unique_ptr<sandbox_channel> open(std::string_view target_id, terminal_size /*size*/) override {
            if (target_id == "missing"sv) {
                throw session_error{session_errc::target_unavailable, "no such target: missing"};
            }
            auto state = std::make_shared<fake_channel_state>();
            std::lock_guard lock{mutex_};
            channels_.push_back(state);
            return std::make_unique<fake_channel>(state);
        }

        std::shared_ptr<fake_channel_state> channel(size_t index) {
            std::lock_guard lock{mutex_};
            REQUIRE(index < channels_.size());
            return channels_[index];
        }

        // Simulates the target producing output on its own
        void emit(size_t index, std::string_view bytes) {
            auto state = channel(index);
            {
                std::lock_guard lock{state->mutex};
                state->pending.append(bytes);
            }
            state->cv.notify_all();
        }

        void hang_up(size_t index) {
            auto state = channel(index);
            {
                std::lock_guard lock{state->mutex};
                state->hung_up = true;
            }
            state->cv.notify_all();
        }

      private:
        std::mutex mutex_{};
        std::vector<std::shared_ptr<fake_channel_state>> channels_{};
    };

    // Concatenates session output until `needle` shows up or `timeout` elapses
    inline std::string read_until(session_output& output, std::string_view needle, std::chrono::milliseconds timeout) {
        std::string collected{};
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (!contains(collected, needle) && std::chrono::steady_clock::now() < deadline) {
            if (auto chunk = output.next(std::chrono::milliseconds{50})) {
                collected.append(chunk->data);
            }
            else if (output.ended()) {
                break;
            }
        }
        return collected;
    }

    // ── engine harness ──────────────────────────────────────────────

    struct engine_harness {
        temp_dir temp;
        workspace ws;
        fake_knowledge knowledge{};
        fake_backend backend{};
        context_builder builder;
        change_applier applier;
        execution_engine engine;

        explicit engine_harness(
                std::string_view prefix, engine_options opts = {}, context_options ctx_opts = {}, bool use_knowledge = true)
                : temp{prefix},
                  ws{temp.path},
                  builder{ws, use_knowledge ? &knowledge : nullptr, ctx_opts},
                  applier{ws, temp.path / ".quill" / "ledger.json"},
                  engine{ws, builder, backend, applier, std::move(opts)} {}

        fs::path path(std::string_view rel) const { return ws.root() / rel; }
    };

    // Consumes an execution's events until the channel is finished
    inline std::vector<execution_event> drain(
            execution_engine& engine, std::string_view execution_id, std::chrono::milliseconds timeout = 10s) {
        auto sub = engine.subscribe(execution_id);
        std::vector<execution_event> events{};
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            execution_event event{};
            auto state = sub.next(event, std::chrono::milliseconds{100});
            if (state == channel_state::finished) {
                return events;
            }
            if (state == channel_state::ready) {
                events.push_back(std::move(event));
            }
        }
        FAIL("event stream for " << execution_id << " did not finish");
        return events;
    }

    inline std::vector<event_kind> kinds_of(const std::vector<execution_event>& events) {
        std::vector<event_kind> out{};
        for (const auto& event : events) {
            out.push_back(event.kind);
        }
        return out;
    }

    // ── REPL harness ────────────────────────────────────────────────

    struct repl_output {
        std::string out{};
        std::string err{};
    };

    inline void write_all(int fd, std::string_view data) {
        while (!data.empty()) {
            auto n = ::write(fd, data.data(), data.size());
            if (n < 0 && errno == EINTR) {
                continue;
            }
            REQUIRE(n > 0);
            data.remove_prefix(static_cast<size_t>(n));
        }
    }

    inline repl_output run_repl_script_capture_output(startup_config& cfg, std::string_view script) {
        int pipe_fds[2]{-1, -1};
        REQUIRE(::pipe(pipe_fds) == 0);

        auto read_fd = pipe_fds[0];
        auto write_fd = pipe_fds[1];

        write_all(write_fd, script);
        REQUIRE(::close(write_fd) == 0);

        auto saved_stdin = ::dup(STDIN_FILENO);
        REQUIRE(saved_stdin >= 0);
        REQUIRE(::dup2(read_fd, STDIN_FILENO) >= 0);
        REQUIRE(::close(read_fd) == 0);

        std::ostringstream captured_out{};
        std::ostringstream captured_err{};
        auto* saved_out_buf = std::cout.rdbuf(captured_out.rdbuf());
        auto* saved_err_buf = std::cerr.rdbuf(captured_err.rdbuf());

        try {
            cli::run_repl(cfg);
        } catch (...) {
            std::cout.rdbuf(saved_out_buf);
            std::cerr.rdbuf(saved_err_buf);
            (void)::dup2(saved_stdin, STDIN_FILENO);
            (void)::close(saved_stdin);
            throw;
        }

        std::cout.flush();
        std::cerr.flush();

        std::cout.rdbuf(saved_out_buf);
        std::cerr.rdbuf(saved_err_buf);
        REQUIRE(::dup2(saved_stdin, STDIN_FILENO) >= 0);
        REQUIRE(::close(saved_stdin) == 0);

        return repl_output{.out = captured_out.str(), .err = captured_err.str()};
    }

    inline std::vector<char*> to_argv(std::vector<std::string>& args) {
        std::vector<char*> argv{};
        argv.reserve(args.size());
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        return argv;
    }

}  // namespace quill::test::detail
