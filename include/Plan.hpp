#pragma once
#include "Resolver.hpp"
#include "TaskFile.hpp"
#include <filesystem>
#include <iosfwd>
#include <string>
#include <vector>

namespace rnr {
    // Executable plan node. Task references are gone; every Command leaf holds
    // the complete environment and absolute cwd its process gets.
    struct PlanNode {
        enum class Kind { Command, Sequence, Parallel };

        Kind kind = Kind::Command;
        std::string label;
        std::string command;
        std::filesystem::path cwd;
        EnvMap env;
        std::vector<PlanNode> children;

        bool operator==(const PlanNode &) const = default;
    };

    struct Plan {
        PlanNode root;

        [[nodiscard]] size_t leaf_count() const;
    };

    class PlanBuilder {
    public:
        // `base_env` is the invocation's environment; declared variables are laid over it.
        explicit PlanBuilder(EnvMap base_env);

        // Throws InvalidParallelNesting.
        [[nodiscard]] Plan build(const ResolvedNode &root) const;

        // Snapshot of the current process environment.
        static EnvMap ambient_environment();

    private:
        [[nodiscard]] PlanNode lower(const ResolvedNode &node, const std::string *enclosing_parallel) const;

        EnvMap base_env;
    };

    // Dry-run rendering of the plan tree.
    void print_plan(const Plan &plan, std::ostream &os);
} // namespace rnr
