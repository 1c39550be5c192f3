#pragma once

#include "applier.hpp"
#include "services.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace quill {

    class vcs_error : public std::runtime_error {
      public:
        using std::runtime_error::runtime_error;
    };

    // Version-Control Service backed by the `git` executable, run in `root`
    class git_service : public vcs_service {
      public:
        explicit git_service(std::filesystem::path root, std::chrono::milliseconds timeout = std::chrono::seconds{30});

        void stage(const std::vector<std::string>& paths) override;
        std::string commit(std::string_view message) override;
        std::string diff(std::optional<std::string_view> path = std::nullopt) override;

        // true when `root` is inside a git work tree
        bool available();

      private:
        std::filesystem::path root_;
        std::chrono::milliseconds timeout_;

        std::string run(std::vector<std::string> args);
    };

    // Stages the paths written by an apply and commits them; returns the commit id
    std::string sync_with_vcs(vcs_service& vcs, const apply_result& result, std::string_view message);

}  // namespace quill
