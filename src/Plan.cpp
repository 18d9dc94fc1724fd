#include "../include/Plan.hpp"
#include "../include/Errors.hpp"
#include <ostream>
#include <utility>
#include <unistd.h>

extern char **environ;

using namespace rnr;

static size_t count_leaves(const PlanNode &n) {
    if (n.kind == PlanNode::Kind::Command) return 1;
    size_t total = 0;
    for (const auto &c: n.children) total += count_leaves(c);
    return total;
}

size_t Plan::leaf_count() const {
    return count_leaves(root);
}

PlanBuilder::PlanBuilder(EnvMap base_env) : base_env(std::move(base_env)) {
}

EnvMap PlanBuilder::ambient_environment() {
    EnvMap env;
    for (char **e = environ; e != nullptr && *e != nullptr; ++e) {
        const std::string entry(*e);
        if (const auto eq = entry.find('='); eq != std::string::npos && eq > 0) {
            env.emplace(entry.substr(0, eq), entry.substr(eq + 1));
        }
    }
    return env;
}

Plan PlanBuilder::build(const ResolvedNode &root) const {
    return Plan{lower(root, nullptr)};
}

PlanNode PlanBuilder::lower(const ResolvedNode &node, const std::string *enclosing_parallel) const {
    switch (node.kind) {
        case ResolvedNode::Kind::TaskRef:
            return lower(node.children.front(), enclosing_parallel);
        case ResolvedNode::Kind::Command: {
            PlanNode leaf;
            leaf.kind = PlanNode::Kind::Command;
            leaf.label = node.label;
            leaf.command = node.command;
            leaf.cwd = node.dir;
            leaf.env = base_env;
            for (const auto &[k, v]: node.env) leaf.env[k] = v;
            return leaf;
        }
        case ResolvedNode::Kind::Sequence:
        case ResolvedNode::Kind::Parallel:
            break;
    }
    const bool parallel = node.kind == ResolvedNode::Kind::Parallel;
    if (parallel && enclosing_parallel != nullptr) {
        throw InvalidParallelNesting(node.label + " (inside " + *enclosing_parallel + ")");
    }
    PlanNode group;
    group.kind = parallel ? PlanNode::Kind::Parallel : PlanNode::Kind::Sequence;
    group.label = node.label;
    group.cwd = node.dir;
    group.children.reserve(node.children.size());
    for (const auto &c: node.children) {
        group.children.push_back(lower(c, parallel ? &node.label : enclosing_parallel));
    }
    return group;
}

static void print_node(const PlanNode &n, std::ostream &os, const int depth) {
    const std::string indent(static_cast<size_t>(depth) * 2 + 2, ' ');
    switch (n.kind) {
        case PlanNode::Kind::Command:
            os << indent << "• " << n.label << " | $ " << n.command << " | cwd=" << n.cwd.string() << "\n";
            return;
        case PlanNode::Kind::Sequence:
            os << indent << "steps " << n.label << "\n";
            break;
        case PlanNode::Kind::Parallel:
            os << indent << "parallel " << n.label << "\n";
            break;
    }
    for (const auto &c: n.children) print_node(c, os, depth + 1);
}

void rnr::print_plan(const Plan &plan, std::ostream &os) {
    os << "[rnr] Plan: " << plan.root.label << "; " << plan.leaf_count() << " command(s)\n";
    print_node(plan.root, os, 0);
    os << std::flush;
}
