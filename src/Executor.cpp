#include "../include/Executor.hpp"
#include "../include/Errors.hpp"
#include <future>
#include <vector>

using namespace rnr;

Executor::Executor(Spawner &spawner, OutputSink &sink, const ExecutorOptions options)
    : spawner(spawner), sink(sink), options(options) {
}

ExecutionResult Executor::execute(const Plan &plan) {
    return run_node(plan.root, false);
}

ExecutionResult Executor::run_node(const PlanNode &node, const bool concurrent) {
    switch (node.kind) {
        case PlanNode::Kind::Command: return run_command(node, concurrent);
        case PlanNode::Kind::Sequence: return run_sequence(node, concurrent);
        case PlanNode::Kind::Parallel: return run_parallel(node);
    }
    return {};
}

ExecutionResult Executor::run_command(const PlanNode &node, const bool concurrent) {
    ExecutionResult result;
    result.kind = PlanNode::Kind::Command;
    result.label = node.label;
    result.command = node.command;

    const auto channel = sink.open(node.label, concurrent);
    if (options.echo) channel->line(Stream::Out, "$ " + node.command);
    try {
        result.exit_code = spawner.spawn(node.command, node.cwd, node.env, *channel);
    } catch (const SpawnFailed &e) {
        // a broken leaf is a failure like any other; siblings keep going
        result.exit_code = SPAWN_FAILED_CODE;
        result.error = e.what();
        channel->line(Stream::Err, e.what());
    }
    channel->finish();
    return result;
}

ExecutionResult Executor::run_sequence(const PlanNode &node, const bool concurrent) {
    ExecutionResult result;
    result.kind = PlanNode::Kind::Sequence;
    result.label = node.label;
    result.children.reserve(node.children.size());
    for (const auto &child: node.children) {
        result.children.push_back(run_node(child, concurrent));
        if (!result.children.back().ok() && options.policy == FailurePolicy::FailFast) break;
    }
    result.exit_code = reduce_sequence(result.children, options.policy);
    return result;
}

ExecutionResult Executor::run_parallel(const PlanNode &node) {
    ExecutionResult result;
    result.kind = PlanNode::Kind::Parallel;
    result.label = node.label;

    std::vector<std::future<ExecutionResult> > futures;
    futures.reserve(node.children.size());
    for (const auto &child: node.children) {
        futures.emplace_back(std::async(std::launch::async, [this, &child] {
            return run_node(child, true);
        }));
    }
    // join every member before looking at any outcome
    for (auto &f: futures) f.wait();
    result.children.reserve(futures.size());
    for (auto &f: futures) result.children.push_back(f.get());
    result.exit_code = reduce_parallel(result.children);
    return result;
}
