#pragma once
#include "Plan.hpp"
#include <string>
#include <vector>

namespace rnr {
    // Exit code recorded for a leaf whose process could not be started.
    inline constexpr int SPAWN_FAILED_CODE = -1;

    enum class FailurePolicy {
        FailFast, // a sequence stops at its first failing child
        Continue // every child runs; the last failure wins
    };

    struct ExecutionResult {
        PlanNode::Kind kind = PlanNode::Kind::Command;
        std::string label;
        std::string command;
        int exit_code = 0;
        std::string error; // set when the leaf failed to spawn
        std::vector<ExecutionResult> children;

        [[nodiscard]] bool ok() const { return exit_code == 0; }
    };

    // First failing child under FailFast, last one under Continue, 0 if none.
    int reduce_sequence(const std::vector<ExecutionResult> &children, FailurePolicy policy);

    // 0 only if every member succeeded, else the code of the first failing member
    // in declaration order.
    int reduce_parallel(const std::vector<ExecutionResult> &children);

    // Failing Command leaves, depth first.
    std::vector<const ExecutionResult *> failed_leaves(const ExecutionResult &result);
} // namespace rnr
