#pragma once
#include "Output.hpp"
#include "TaskFile.hpp"
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>

namespace rnr {
    inline constexpr const char *VERSION = "0.3.0";

    struct RunOptions {
        std::optional<std::string> task;
        std::optional<std::filesystem::path> task_file; // skips discovery when set
        OutputMode output = OutputMode::Prefix;
        std::string shell = "/bin/sh";
        bool continue_on_error = false;
        bool list = false;
        bool dry_run = false;
        bool quiet = false;
        bool help = false;
        bool version = false;
    };

    // RNR_CONTINUE_ON_ERROR, RNR_OUTPUT, RNR_SHELL, RNR_FILE.
    // Throws std::invalid_argument on a bad value.
    void apply_environment(RunOptions &opts, const EnvMap &env);

    // Command-line flags win over everything else. Throws std::invalid_argument.
    void apply_arguments(RunOptions &opts, int argc, const char *const *argv);

    // Defaults, then the process environment, then argv.
    RunOptions load_options(int argc, const char *const *argv);

    void print_usage(std::ostream &os);
} // namespace rnr
