#include "quill/sandbox.hpp"

#include "quill/config.hpp"
#include "quill/format.hpp"
#include "quill/utils.hpp"

#include "internal/platform.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/ioctl.h>
#include <sys/wait.h>
#include <termios.h>
#include <unistd.h>

#if QUILL_PLATFORM_MACOS
#include <util.h>
#else
#include <pty.h>
#endif

#include <array>
#include <cerrno>
#include <cstring>

extern char** environ;

using namespace quill::literals;

namespace quill {

    namespace fs = std::filesystem;

    bool try_parse_session_signal(std::string_view text, session_signal& out) {
        for (auto sig : {session_signal::interrupt, session_signal::terminate, session_signal::kill}) {
            if (utils::str_case_eq(text, to_string(sig))) {
                out = sig;
                return true;
            }
        }
        return false;
    }

    registry_options registry_options::from_config(const startup_config& cfg) {
        registry_options opts{};
        opts.retention = std::chrono::milliseconds{cfg.session_retention_ms};
        opts.idle_timeout = std::chrono::milliseconds{cfg.session_idle_timeout_ms};
        opts.max_buffered_bytes = cfg.session_max_buffered_bytes;
        return opts;
    }

    // ── local pty provider ──────────────────────────────────────────

    namespace detail {

        static constexpr int to_posix_signal(session_signal sig) {
            switch (sig) {
                case session_signal::interrupt:
                    return SIGINT;
                case session_signal::terminate:
                    return SIGTERM;
                case session_signal::kill:
                    return SIGKILL;
            }
            return SIGINT;
        }

        static winsize to_winsize(terminal_size size) {
            winsize ws{};
            ws.ws_col = size.cols;
            ws.ws_row = size.rows;
            return ws;
        }

        class pty_channel : public sandbox_channel {
          public:
            pty_channel(pid_t pid, int master_fd) : pid_{pid}, master_fd_{master_fd} {
                auto flags = ::fcntl(master_fd_, F_GETFL, 0);
                if (flags >= 0) {
                    ::fcntl(master_fd_, F_SETFL, flags | O_NONBLOCK);
                }
                auto fd_flags = ::fcntl(master_fd_, F_GETFD);
                if (fd_flags >= 0) {
                    ::fcntl(master_fd_, F_SETFD, fd_flags | FD_CLOEXEC);
                }
            }

            ~pty_channel() override { close(); }

            void write(std::string_view bytes) override {
                while (!bytes.empty()) {
                    if (master_fd_ < 0) {
                        throw session_error{session_errc::io_failure, "session terminal is closed"};
                    }
                    auto n = ::write(master_fd_, bytes.data(), bytes.size());
                    if (n < 0) {
                        if (errno == EINTR) {
                            continue;
                        }
                        if (errno == EAGAIN) {
                            pollfd pfd{.fd = master_fd_, .events = POLLOUT, .revents = 0};
                            ::poll(&pfd, 1, 100);
                            continue;
                        }
                        throw session_error{
                                session_errc::io_failure, "write to session terminal failed: {}"_format(
                                                                  std::strerror(errno))};
                    }
                    bytes.remove_prefix(static_cast<size_t>(n));
                }
            }

            read_status read(std::string& out, std::chrono::milliseconds wait) override {
                if (master_fd_ < 0) {
                    return read_status::ended;
                }
                pollfd pfd{.fd = master_fd_, .events = POLLIN, .revents = 0};
                int ret = ::poll(&pfd, 1, static_cast<int>(wait.count()));
                if (ret < 0) {
                    return errno == EINTR ? read_status::idle : read_status::ended;
                }
                if (ret == 0) {
                    return read_status::idle;
                }

                std::array<char, 4096> chunk{};
                auto n = ::read(master_fd_, chunk.data(), chunk.size());
                if (n > 0) {
                    out.append(chunk.data(), static_cast<size_t>(n));
                    return read_status::data;
                }
                if (n < 0 && (errno == EAGAIN || errno == EINTR)) {
                    return read_status::idle;
                }
                // EOF, or EIO once the slave side is gone
                return read_status::ended;
            }

            void resize(terminal_size size) override {
                if (master_fd_ < 0) {
                    return;
                }
                auto ws = to_winsize(size);
                if (::ioctl(master_fd_, TIOCSWINSZ, &ws) != 0) {
                    debug_log("TIOCSWINSZ failed: ", std::strerror(errno));
                }
            }

            void signal(session_signal sig) override {
                if (pid_ <= 0) {
                    return;
                }
                auto group = master_fd_ >= 0 ? ::tcgetpgrp(master_fd_) : -1;
                auto target = group > 0 ? -group : pid_;
                if (::kill(target, to_posix_signal(sig)) != 0) {
                    debug_log("signal ", to_string(sig), " failed: ", std::strerror(errno));
                }
            }

            void close() override {
                if (pid_ > 0) {
                    ::kill(pid_, SIGHUP);
                    int status = 0;
                    bool reaped = false;
                    for (int i = 0; i < 20 && !reaped; ++i) {
                        reaped = ::waitpid(pid_, &status, WNOHANG) == pid_;
                        if (!reaped) {
                            ::usleep(5'000);
                        }
                    }
                    if (!reaped) {
                        ::kill(pid_, SIGKILL);
                        ::waitpid(pid_, &status, 0);
                    }
                    pid_ = -1;
                }
                if (master_fd_ >= 0) {
                    ::close(master_fd_);
                    master_fd_ = -1;
                }
            }

          private:
            pid_t pid_;
            int master_fd_;
        };

    }  // namespace detail

    local_sandbox_provider::local_sandbox_provider(fs::path sandbox_root, std::string shell)
            : root_{std::move(sandbox_root)}, shell_{std::move(shell)} {}

    std::optional<fs::path> local_sandbox_provider::resolve_target(std::string_view target_id) const {
        if (target_id.empty()) {
            return std::nullopt;
        }
        fs::path target{target_id};
        if (target.is_absolute()) {
            return target.lexically_normal();
        }
        if (root_.empty()) {
            return std::nullopt;
        }
        auto rel = target.lexically_normal();
        if (rel.empty() || *rel.begin() == "..") {
            return std::nullopt;
        }
        return (root_ / rel).lexically_normal();
    }

    std::unique_ptr<sandbox_channel> local_sandbox_provider::open(std::string_view target_id, terminal_size size) {
        auto dir = resolve_target(target_id);
        std::error_code ec{};
        if (!dir || !fs::is_directory(*dir, ec)) {
            throw session_error{session_errc::target_unavailable, "sandbox target not found: {}"_format(target_id)};
        }
        if (::access(shell_.c_str(), X_OK) != 0) {
            throw session_error{
                    session_errc::target_unavailable, "sandbox shell is not executable: {}"_format(shell_)};
        }

        auto dir_str = dir->string();
        std::vector<std::string> env{};
        for (char** entry = environ; *entry != nullptr; ++entry) {
            if (!std::string_view{*entry}.starts_with("TERM="sv)) {
                env.emplace_back(*entry);
            }
        }
        env.push_back("TERM={}"_format(internal::platform::sandbox_term));
        std::vector<char*> envp{};
        envp.reserve(env.size() + 1U);
        for (auto& entry : env) {
            envp.push_back(entry.data());
        }
        envp.push_back(nullptr);
        auto ws = detail::to_winsize(size);
        int master_fd = -1;
        auto pid = ::forkpty(&master_fd, nullptr, nullptr, &ws);
        if (pid < 0) {
            throw session_error{
                    session_errc::target_unavailable, "cannot open a terminal for {}: {}"_format(
                                                              target_id, std::strerror(errno))};
        }

        if (pid == 0) {
            if (::chdir(dir_str.c_str()) != 0) {
                _exit(127);
            }
            ::signal(SIGPIPE, SIG_DFL);
            ::execle(shell_.c_str(), shell_.c_str(), static_cast<char*>(nullptr), envp.data());
            _exit(127);
        }

        debug_log("sandbox shell ", shell_, " (pid ", pid, ") in ", dir_str);
        return std::make_unique<detail::pty_channel>(pid, master_fd);
    }

    // ── session registry ────────────────────────────────────────────

    struct detail::session_buffer {
        std::mutex mutex;
        std::condition_variable ready;
        // the consumer took output or detached
        std::condition_variable_any drained;
        std::deque<output_chunk> chunks{};
        size_t buffered_bytes{};
        uint64_t next_sequence{};
        bool attached{false};
        std::chrono::steady_clock::time_point detached_at{std::chrono::steady_clock::now()};
        std::chrono::steady_clock::time_point last_activity{std::chrono::steady_clock::now()};
        std::chrono::system_clock::time_point last_activity_at{std::chrono::system_clock::now()};
        terminal_size dimensions{};
        bool ended{false};

        void touch_locked() {
            last_activity = std::chrono::steady_clock::now();
            last_activity_at = std::chrono::system_clock::now();
        }
    };

    struct session_registry::session {
        std::string id{};
        std::string target_id{};
        std::chrono::system_clock::time_point created_at{};
        std::unique_ptr<sandbox_channel> channel{};
        // serializes writes, resizes, signals and teardown
        std::mutex io_mutex;
        bool closed{false};
        std::shared_ptr<detail::session_buffer> output{std::make_shared<detail::session_buffer>()};
        std::jthread reader{};

        sandbox_session_info info() const {
            sandbox_session_info out{};
            out.session_id = id;
            out.target_id = target_id;
            out.created_at = created_at;
            std::lock_guard lock{output->mutex};
            out.last_activity_at = output->last_activity_at;
            out.dimensions = output->dimensions;
            out.attached = output->attached;
            out.ended = output->ended;
            return out;
        }
    };

    session_output::session_output(std::string session_id, std::shared_ptr<detail::session_buffer> buffer)
            : session_id_{std::move(session_id)}, state_{std::move(buffer)} {}

    session_output::session_output(session_output&& other) noexcept
            : session_id_{std::move(other.session_id_)}, state_{std::move(other.state_)}, ended_{other.ended_} {}

    session_output::~session_output() {
        if (!state_) {
            return;
        }
        std::lock_guard lock{state_->mutex};
        state_->attached = false;
        state_->detached_at = std::chrono::steady_clock::now();
        state_->drained.notify_all();
    }

    std::optional<output_chunk> session_output::next(std::chrono::milliseconds timeout) {
        if (!state_) {
            return std::nullopt;
        }
        std::unique_lock lock{state_->mutex};
        state_->ready.wait_for(lock, timeout, [this] { return !state_->chunks.empty() || state_->ended; });
        if (!state_->chunks.empty()) {
            auto chunk = std::move(state_->chunks.front());
            state_->chunks.pop_front();
            state_->buffered_bytes -= chunk.data.size();
            state_->drained.notify_all();
            return chunk;
        }
        if (state_->ended) {
            ended_ = true;
        }
        return std::nullopt;
    }

    session_registry::session_registry(sandbox_provider& provider, registry_options opts)
            : provider_{provider}, opts_{opts}, reaper_{[this](std::stop_token stop) { reap(stop); }} {}

    session_registry::~session_registry() {
        reaper_.request_stop();
        if (reaper_.joinable()) {
            reaper_.join();
        }
        std::map<std::string, std::shared_ptr<session>, std::less<>> remaining{};
        {
            std::lock_guard lock{mutex_};
            remaining.swap(sessions_);
        }
        for (auto& [id, s] : remaining) {
            teardown(*s);
        }
    }

    std::shared_ptr<session_registry::session> session_registry::lookup(std::string_view session_id) const {
        std::lock_guard lock{mutex_};
        auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            throw session_error{session_errc::not_found, "unknown session: {}"_format(session_id)};
        }
        return it->second;
    }

    std::string session_registry::create_session(std::string_view target_id, terminal_size size) {
        // may block on the provider; no registry lock held
        auto channel = provider_.open(target_id, size);

        auto s = std::make_shared<session>();
        s->target_id = std::string{target_id};
        s->created_at = std::chrono::system_clock::now();
        s->channel = std::move(channel);
        s->output->dimensions = size;
        {
            std::lock_guard lock{mutex_};
            s->id = "s-{}"_format(next_id_++);
            sessions_.emplace(s->id, s);
        }
        s->reader = std::jthread{[s, max = opts_.max_buffered_bytes](std::stop_token stop) {
            read_loop(s, max, stop);
        }};
        debug_log("created sandbox session ", s->id, " on ", target_id);
        return s->id;
    }

    void session_registry::read_loop(std::shared_ptr<session> s, size_t max_buffered_bytes, std::stop_token stop) {
        auto& out = *s->output;
        std::string data{};
        while (!stop.stop_requested()) {
            {
                // an attached consumer is never skipped over: stop reading until it catches up
                std::unique_lock lock{out.mutex};
                if (!out.drained.wait(lock, stop, [&out, max_buffered_bytes] {
                        return !out.attached || out.buffered_bytes < max_buffered_bytes;
                    })) {
                    return;
                }
            }
            data.clear();
            read_status status = read_status::ended;
            try {
                status = s->channel->read(data, std::chrono::milliseconds{100});
            } catch (const std::exception& e) {
                warn_log("session ", s->id, " read failed: ", e.what());
            }
            if (status == read_status::idle) {
                continue;
            }

            std::lock_guard lock{out.mutex};
            if (status == read_status::ended) {
                out.ended = true;
                out.ready.notify_all();
                debug_log("session ", s->id, " ended");
                return;
            }
            out.buffered_bytes += data.size();
            out.chunks.push_back(output_chunk{out.next_sequence++, data});
            out.touch_locked();
            size_t dropped = 0U;
            while (!out.attached && out.buffered_bytes > max_buffered_bytes && out.chunks.size() > 1U) {
                dropped += out.chunks.front().data.size();
                out.buffered_bytes -= out.chunks.front().data.size();
                out.chunks.pop_front();
            }
            if (dropped > 0U) {
                warn_log("session ", s->id, ": dropped ", dropped, " bytes of unconsumed output");
            }
            out.ready.notify_all();
        }
    }

    void session_registry::send_input(std::string_view session_id, std::string_view bytes) {
        auto s = lookup(session_id);
        std::lock_guard io{s->io_mutex};
        if (s->closed) {
            throw session_error{session_errc::not_found, "session {} is closed"_format(session_id)};
        }
        try {
            s->channel->write(bytes);
        } catch (const session_error&) {
            throw;
        } catch (const std::exception& e) {
            throw session_error{session_errc::io_failure, e.what()};
        }
        std::lock_guard lock{s->output->mutex};
        s->output->touch_locked();
    }

    session_output session_registry::attach(std::string_view session_id) {
        auto s = lookup(session_id);
        std::lock_guard lock{s->output->mutex};
        if (s->output->attached) {
            throw session_error{
                    session_errc::already_attached, "session {} already has a consumer"_format(session_id)};
        }
        s->output->attached = true;
        return session_output{s->id, s->output};
    }

    void session_registry::resize(std::string_view session_id, terminal_size size) {
        auto s = lookup(session_id);
        {
            std::lock_guard lock{s->output->mutex};
            if (s->output->dimensions == size) {
                return;
            }
            s->output->dimensions = size;
        }
        std::lock_guard io{s->io_mutex};
        if (!s->closed) {
            s->channel->resize(size);
        }
    }

    void session_registry::send_signal(std::string_view session_id, session_signal sig) {
        auto s = lookup(session_id);
        std::lock_guard io{s->io_mutex};
        if (!s->closed) {
            s->channel->signal(sig);
        }
    }

    void session_registry::close_session(std::string_view session_id) noexcept {
        std::shared_ptr<session> s{};
        {
            std::lock_guard lock{mutex_};
            auto it = sessions_.find(session_id);
            if (it == sessions_.end()) {
                return;
            }
            s = std::move(it->second);
            sessions_.erase(it);
        }
        teardown(*s);
        debug_log("closed sandbox session ", session_id);
    }

    void session_registry::teardown(session& s) noexcept {
        s.reader.request_stop();
        if (s.reader.joinable()) {
            s.reader.join();
        }
        {
            std::lock_guard io{s.io_mutex};
            if (!s.closed) {
                s.closed = true;
                try {
                    s.channel->close();
                } catch (const std::exception& e) {
                    warn_log("session ", s.id, " teardown failed: ", e.what());
                }
            }
        }
        std::lock_guard lock{s.output->mutex};
        s.output->ended = true;
        s.output->ready.notify_all();
    }

    std::vector<sandbox_session_info> session_registry::list_sessions() const {
        std::lock_guard lock{mutex_};
        std::vector<sandbox_session_info> out{};
        out.reserve(sessions_.size());
        for (const auto& [id, s] : sessions_) {
            out.push_back(s->info());
        }
        return out;
    }

    std::optional<sandbox_session_info> session_registry::find(std::string_view session_id) const {
        std::lock_guard lock{mutex_};
        auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            return std::nullopt;
        }
        return it->second->info();
    }

    void session_registry::reap(std::stop_token stop) {
        for (;;) {
            std::vector<std::string> idle{};
            {
                std::unique_lock lock{mutex_};
                reaper_wake_.wait_for(lock, stop, opts_.reap_interval, [] { return false; });
                if (stop.stop_requested()) {
                    return;
                }
                auto now = std::chrono::steady_clock::now();
                for (const auto& [id, s] : sessions_) {
                    std::lock_guard out_lock{s->output->mutex};
                    auto& out = *s->output;
                    if (!out.attached && !out.chunks.empty() && now - out.detached_at >= opts_.retention) {
                        warn_log("session ", id, ": discarding ", out.buffered_bytes, " bytes nobody consumed");
                        out.chunks.clear();
                        out.buffered_bytes = 0U;
                    }
                    if (opts_.idle_timeout.count() > 0 && now - out.last_activity >= opts_.idle_timeout) {
                        idle.push_back(id);
                    }
                }
            }
            for (const auto& id : idle) {
                debug_log("reaping idle session ", id);
                close_session(id);
            }
        }
    }

}  // namespace quill
