#pragma once
#include "Output.hpp"
#include "TaskFile.hpp"
#include <filesystem>
#include <string>

namespace rnr {
    class Spawner {
    public:
        virtual ~Spawner() = default;

        // Runs `command` through the shell in `cwd` with exactly `env`, feeding
        // its output to `out`, and blocks until it exits. Returns the exit code
        // (128 + signal for a killed process). Throws SpawnFailed if the process
        // could not be started.
        virtual int spawn(const std::string &command, const std::filesystem::path &cwd, const EnvMap &env,
                          OutputChannel &out) = 0;
    };

    class PosixSpawner final : public Spawner {
    public:
        explicit PosixSpawner(std::string shell = "/bin/sh");

        int spawn(const std::string &command, const std::filesystem::path &cwd, const EnvMap &env,
                  OutputChannel &out) override;

    private:
        std::string shell;
    };
} // namespace rnr
