#pragma once

#include "config.hpp"

#include <optional>

namespace quill::cli {

    // nullopt: continue into the REPL; otherwise the process exit code
    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg);

    void run_repl(startup_config& cfg);

}  // namespace quill::cli
