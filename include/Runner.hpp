#pragma once
#include "Executor.hpp"
#include "Options.hpp"
#include "Plan.hpp"
#include "Registry.hpp"
#include <iosfwd>
#include <string>
#include <utility>
#include <vector>

namespace rnr {
    // Entry points used by the command line.
    //
    // run() resolves and validates the whole plan before the first process is
    // started, so a missing task, a delegation cycle or a bad parallel group
    // surfaces as an exception with nothing executed.
    class Runner {
    public:
        Runner(TaskRegistry &registry, Spawner &spawner, OutputSink &sink, const RunOptions &options,
               std::ostream &log);

        // Process exit code of the task: 0 when every command succeeded.
        int run(const std::string &task_name);

        // Like run() but keeps the per-node results.
        ExecutionResult execute(const std::string &task_name);

        [[nodiscard]] Plan plan(const std::string &task_name);

        void print_plan(const std::string &task_name, std::ostream &os);

        [[nodiscard]] std::vector<std::pair<std::string, std::string> > list_tasks() const;

        void print_task_list(std::ostream &os) const;

    private:
        void report(const ExecutionResult &result) const;

        TaskRegistry &registry;
        Spawner &spawner;
        OutputSink &sink;
        RunOptions options;
        std::ostream &log;
        PlanBuilder builder;
    };

    // Maps a task result to something a process can exit with.
    int exit_status(int code);
} // namespace rnr
