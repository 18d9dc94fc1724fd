#include "../include/Result.hpp"

using namespace rnr;

int rnr::reduce_sequence(const std::vector<ExecutionResult> &children, const FailurePolicy policy) {
    int code = 0;
    for (const auto &c: children) {
        if (c.ok()) continue;
        if (policy == FailurePolicy::FailFast) return c.exit_code;
        code = c.exit_code;
    }
    return code;
}

int rnr::reduce_parallel(const std::vector<ExecutionResult> &children) {
    for (const auto &c: children) if (!c.ok()) return c.exit_code;
    return 0;
}

static void collect(const ExecutionResult &r, std::vector<const ExecutionResult *> &out) {
    if (r.kind == PlanNode::Kind::Command) {
        if (!r.ok()) out.push_back(&r);
        return;
    }
    for (const auto &c: r.children) collect(c, out);
}

std::vector<const ExecutionResult *> rnr::failed_leaves(const ExecutionResult &result) {
    std::vector<const ExecutionResult *> out;
    collect(result, out);
    return out;
}
