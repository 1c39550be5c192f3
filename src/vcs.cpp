#include "quill/vcs.hpp"

#include "quill/format.hpp"
#include "quill/utils.hpp"

#include "internal/platform.hpp"
#include "internal/process.hpp"

using namespace quill::literals;

namespace quill {

    git_service::git_service(std::filesystem::path root, std::chrono::milliseconds timeout)
            : root_{std::move(root)}, timeout_{timeout} {}

    std::string git_service::run(std::vector<std::string> args) {
        std::vector<std::string> argv{std::string{internal::platform::tool::git}, "-C", root_.string()};
        argv.insert(argv.end(), std::make_move_iterator(args.begin()), std::make_move_iterator(args.end()));

        internal::process_result result{};
        try {
            result = internal::run_process(argv, {}, timeout_);
        } catch (const std::runtime_error& e) {
            throw vcs_error{"git unavailable: {}"_format(e.what())};
        }
        if (result.timed_out) {
            throw vcs_error{"git {} timed out"_format(argv[3])};
        }
        if (result.exit_code != 0) {
            throw vcs_error{
                    "git {} failed ({}): {}"_format(argv[3], result.exit_code, utils::trim_view(result.stderr_output))};
        }
        return std::move(result.stdout_output);
    }

    bool git_service::available() {
        try {
            return utils::trim_view(run({"rev-parse", "--is-inside-work-tree"})) == "true"sv;
        } catch (const vcs_error& e) {
            debug_log("no git work tree at ", root_.string(), ": ", e.what());
            return false;
        }
    }

    void git_service::stage(const std::vector<std::string>& paths) {
        if (paths.empty()) {
            return;
        }
        std::vector<std::string> args{"add", "--all", "--"};
        args.insert(args.end(), paths.begin(), paths.end());
        run(std::move(args));
    }

    std::string git_service::commit(std::string_view message) {
        run({"commit", "--quiet", "-m", std::string{message}});
        return std::string{utils::trim_view(run({"rev-parse", "HEAD"}))};
    }

    std::string git_service::diff(std::optional<std::string_view> path) {
        std::vector<std::string> args{"diff", "--no-color"};
        if (path) {
            args.emplace_back("--");
            args.emplace_back(*path);
        }
        return run(std::move(args));
    }

    std::string sync_with_vcs(vcs_service& vcs, const apply_result& result, std::string_view message) {
        vcs.stage(result.written_paths);
        return vcs.commit(message);
    }

}  // namespace quill
