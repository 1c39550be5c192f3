#include "process.hpp"

#include "quill/format.hpp"
#include "quill/utils.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <stdexcept>

using namespace quill::literals;

namespace quill::internal {

    namespace detail {

        static void set_cloexec(int fd) {
            auto flags = ::fcntl(fd, F_GETFD);
            if (flags >= 0) {
                ::fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
            }
        }

        static bool make_pipe(int (&fds)[2]) {
            if (::pipe(fds) != 0) {
                return false;
            }
            set_cloexec(fds[0]);
            set_cloexec(fds[1]);
            return true;
        }

        static void close_fd(int& fd) {
            if (fd >= 0) {
                ::close(fd);
                fd = -1;
            }
        }

        // A child that dies while we write its stdin must not take the whole process down
        static void ignore_sigpipe() {
            static const bool ignored = [] {
                ::signal(SIGPIPE, SIG_IGN);
                return true;
            }();
            (void)ignored;
        }

        static int decode_status(int status) {
            if (WIFEXITED(status)) {
                return WEXITSTATUS(status);
            }
            if (WIFSIGNALED(status)) {
                return 128 + WTERMSIG(status);
            }
            return 1;
        }

    }  // namespace detail

    child_process::child_process(const std::vector<std::string>& args, const std::filesystem::path& cwd) {
        if (args.empty()) {
            throw std::runtime_error("cannot spawn a process without a program");
        }
        detail::ignore_sigpipe();

        int in_pipe[2]{-1, -1};
        int out_pipe[2]{-1, -1};
        int err_pipe[2]{-1, -1};
        int exec_pipe[2]{-1, -1};
        auto close_all = [&] {
            for (auto* p : {in_pipe, out_pipe, err_pipe, exec_pipe}) {
                detail::close_fd(p[0]);
                detail::close_fd(p[1]);
            }
        };
        if (!detail::make_pipe(in_pipe) || !detail::make_pipe(out_pipe) || !detail::make_pipe(err_pipe) ||
            !detail::make_pipe(exec_pipe)) {
            auto err = errno;
            close_all();
            throw std::runtime_error("pipe() failed: {}"_format(std::strerror(err)));
        }

        std::vector<char*> argv{};
        argv.reserve(args.size() + 1);
        for (const auto& arg : args) {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }
        argv.push_back(nullptr);
        auto cwd_str = cwd.string();

        auto pid = ::fork();
        if (pid < 0) {
            auto err = errno;
            close_all();
            throw std::runtime_error("fork() failed: {}"_format(std::strerror(err)));
        }

        if (pid == 0) {
            ::dup2(in_pipe[0], STDIN_FILENO);
            ::dup2(out_pipe[1], STDOUT_FILENO);
            ::dup2(err_pipe[1], STDERR_FILENO);
            ::signal(SIGPIPE, SIG_DFL);
            if (!cwd_str.empty() && ::chdir(cwd_str.c_str()) != 0) {
                int err = errno;
                (void)::write(exec_pipe[1], &err, sizeof(err));
                _exit(127);
            }
            ::execvp(argv[0], argv.data());
            int err = errno;
            (void)::write(exec_pipe[1], &err, sizeof(err));
            _exit(127);
        }

        // parent
        ::close(in_pipe[0]);
        ::close(out_pipe[1]);
        ::close(err_pipe[1]);
        ::close(exec_pipe[1]);

        int child_errno = 0;
        ssize_t n = 0;
        do {
            n = ::read(exec_pipe[0], &child_errno, sizeof(child_errno));
        } while (n < 0 && errno == EINTR);
        ::close(exec_pipe[0]);

        pid_ = pid;
        stdin_fd_ = in_pipe[1];
        stdout_fd_ = out_pipe[0];
        stderr_fd_ = err_pipe[0];

        if (n == static_cast<ssize_t>(sizeof(child_errno))) {
            wait();
            throw std::runtime_error("cannot execute {}: {}"_format(args.front(), std::strerror(child_errno)));
        }
        debug_log("spawned ", args.front(), " (pid ", pid_, ")");
    }

    child_process::~child_process() {
        if (pid_ > 0) {
            kill();
            wait();
        }
        close_fds();
    }

    void child_process::close_fds() {
        detail::close_fd(stdin_fd_);
        detail::close_fd(stdout_fd_);
        detail::close_fd(stderr_fd_);
    }

    void child_process::close_stdin() {
        detail::close_fd(stdin_fd_);
    }

    void child_process::terminate() {
        if (pid_ > 0) {
            ::kill(pid_, SIGTERM);
        }
    }

    void child_process::kill() {
        if (pid_ > 0) {
            ::kill(pid_, SIGKILL);
        }
    }

    int child_process::wait() {
        if (pid_ <= 0) {
            return 0;
        }
        int status = 0;
        while (::waitpid(pid_, &status, 0) < 0) {
            if (errno != EINTR) {
                status = 0;
                break;
            }
        }
        pid_ = -1;
        return detail::decode_status(status);
    }

    bool read_available(int fd, std::string& out) {
        std::array<char, 4096> chunk{};
        for (;;) {
            auto n = ::read(fd, chunk.data(), chunk.size());
            if (n > 0) {
                out.append(chunk.data(), static_cast<size_t>(n));
                return true;
            }
            if (n == 0) {
                return false;
            }
            if (errno == EINTR) {
                continue;
            }
            // EAGAIN on a non-blocking fd is "nothing yet", anything else ends the stream
            return errno == EAGAIN;
        }
    }

    process_result run_process(
            const std::vector<std::string>& args,
            std::string_view stdin_input,
            std::chrono::milliseconds timeout,
            const std::filesystem::path& cwd) {
        child_process child{args, cwd};

        if (stdin_input.empty()) {
            child.close_stdin();
        }
        else {
            auto flags = ::fcntl(child.stdin_fd(), F_GETFL);
            ::fcntl(child.stdin_fd(), F_SETFL, flags | O_NONBLOCK);
        }

        process_result result{};
        auto deadline = std::chrono::steady_clock::now() + timeout;

        std::array<pollfd, 3> fds{};
        fds[0] = {.fd = child.stdout_fd(), .events = POLLIN, .revents = 0};
        fds[1] = {.fd = child.stderr_fd(), .events = POLLIN, .revents = 0};
        fds[2] = {.fd = child.stdin_fd(), .events = POLLOUT, .revents = 0};
        int readers_open = 2;

        while (readers_open > 0) {
            auto remaining =
                    std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now())
                            .count();
            if (remaining <= 0) {
                result.timed_out = true;
                break;
            }

            int ret = ::poll(fds.data(), fds.size(), static_cast<int>(remaining));
            if (ret < 0) {
                if (errno == EINTR) {
                    continue;
                }
                break;
            }
            if (ret == 0) {
                result.timed_out = true;
                break;
            }

            for (int i = 0; i < 2; ++i) {
                if (fds[i].fd < 0 || (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
                    continue;
                }
                if (!read_available(fds[i].fd, i == 0 ? result.stdout_output : result.stderr_output)) {
                    fds[i].fd = -1;
                    --readers_open;
                }
            }

            if (fds[2].fd >= 0 && (fds[2].revents & (POLLOUT | POLLERR | POLLHUP)) != 0) {
                auto n = ::write(fds[2].fd, stdin_input.data(), stdin_input.size());
                if (n > 0) {
                    stdin_input.remove_prefix(static_cast<size_t>(n));
                }
                if ((n < 0 && errno != EAGAIN && errno != EINTR) || stdin_input.empty()) {
                    child.close_stdin();
                    fds[2].fd = -1;
                }
            }
        }

        if (result.timed_out) {
            child.kill();
            debug_log(args.front(), " timed out after ", timeout.count(), "ms");
        }
        result.exit_code = child.wait();
        if (result.timed_out) {
            result.exit_code = 1;
        }
        return result;
    }

}  // namespace quill::internal
