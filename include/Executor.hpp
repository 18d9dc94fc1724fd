#pragma once
#include "Output.hpp"
#include "Plan.hpp"
#include "Result.hpp"
#include "Spawner.hpp"

namespace rnr {
    struct ExecutorOptions {
        FailurePolicy policy = FailurePolicy::FailFast;
        bool echo = true; // print "$ <cmd>" before each command
    };

    // Walks a plan. Sequences run in order on the calling thread; the members
    // of a parallel group each get their own thread and are all joined before
    // the group completes, whatever their outcome.
    class Executor {
    public:
        Executor(Spawner &spawner, OutputSink &sink, ExecutorOptions options = {});

        ExecutionResult execute(const Plan &plan);

    private:
        ExecutionResult run_node(const PlanNode &node, bool concurrent);

        ExecutionResult run_command(const PlanNode &node, bool concurrent);

        ExecutionResult run_sequence(const PlanNode &node, bool concurrent);

        ExecutionResult run_parallel(const PlanNode &node);

        Spawner &spawner;
        OutputSink &sink;
        ExecutorOptions options;
    };
} // namespace rnr
