#pragma once

#include <sys/types.h>

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace quill::internal {

    struct process_result {
        int exit_code{0};
        std::string stdout_output{};
        std::string stderr_output{};
        bool timed_out{false};
    };

    /*
     * A child process wired to three pipes. Spawning fails with std::runtime_error when the
     * program cannot be executed (exec errors are reported back through a close-on-exec pipe).
     * The destructor kills and reaps a child that is still running.
     */
    class child_process {
      public:
        explicit child_process(const std::vector<std::string>& args, const std::filesystem::path& cwd = {});
        ~child_process();

        child_process(const child_process&) = delete;
        child_process& operator=(const child_process&) = delete;

        pid_t pid() const { return pid_; }
        int stdin_fd() const { return stdin_fd_; }
        int stdout_fd() const { return stdout_fd_; }
        int stderr_fd() const { return stderr_fd_; }

        void close_stdin();

        void terminate();
        void kill();

        // Reaps the child; exit status, or 128 + signal number
        int wait();
        bool running() const { return pid_ > 0; }

      private:
        pid_t pid_{-1};
        int stdin_fd_{-1};
        int stdout_fd_{-1};
        int stderr_fd_{-1};

        void close_fds();
    };

    // Appends what is readable on `fd` to `out`; false once the writer has closed its end
    bool read_available(int fd, std::string& out);

    // Runs `args` to completion, feeding `stdin_input`; the child is killed after `timeout`
    process_result run_process(
            const std::vector<std::string>& args,
            std::string_view stdin_input,
            std::chrono::milliseconds timeout,
            const std::filesystem::path& cwd = {});

}  // namespace quill::internal
