#include "../include/Resolver.hpp"
#include "../include/Errors.hpp"
#include <algorithm>

using namespace rnr;
namespace fs = std::filesystem;

namespace {
    // Pushes a (file, task) pair on the delegation path for the lifetime of the guard.
    struct VisitGuard {
        std::vector<VisitKey> &visited;

        VisitGuard(std::vector<VisitKey> &v, VisitKey key) : visited(v) {
            visited.push_back(std::move(key));
        }

        ~VisitGuard() { visited.pop_back(); }

        VisitGuard(const VisitGuard &) = delete;

        VisitGuard &operator=(const VisitGuard &) = delete;
    };
} // namespace

Resolver::Resolver(TaskRegistry &registry) : registry(registry) {
}

ResolvedNode Resolver::resolve(const std::string &task_name, const fs::path &start_dir) {
    std::vector<VisitKey> visited;
    return resolve(task_name, start_dir, visited);
}

ResolvedNode Resolver::resolve(const std::string &task_name, const fs::path &start_dir,
                               std::vector<VisitKey> &visited) {
    const TaskFile &file = registry.load_nested(start_dir);
    return enter(file, task_name, Scope{file.dir, {}}, visited);
}

std::string Resolver::qualified(const TaskFile &file, const std::string &name) const {
    const TaskFile &root = registry.root();
    if (&file == &root) return name;
    const fs::path rel = file.dir.lexically_relative(root.dir);
    if (rel.empty() || rel.native().starts_with("..")) return file.dir.string() + ":" + name;
    return rel.string() + ":" + name;
}

Resolver::Scope Resolver::narrow(const TaskFile &file, const Scope &outer, const std::optional<std::string> &dir,
                                 const std::optional<EnvMap> &env) const {
    Scope s = outer;
    // an explicit dir replaces the inherited one, anchored at the declaring file
    if (dir) {
        s.dir = (file.dir / *dir).lexically_normal();
        if (!s.dir.has_filename() && s.dir.has_relative_path()) s.dir = s.dir.parent_path();
    }
    if (env) {
        for (const auto &[k, v]: *env) s.env[k] = v;
    }
    return s;
}

ResolvedNode Resolver::enter(const TaskFile &file, const std::string &name, const Scope &scope,
                             std::vector<VisitKey> &visited) {
    VisitKey key{file.path.string(), name};
    if (std::ranges::find(visited, key) != visited.end()) {
        std::vector<std::string> chain;
        chain.reserve(visited.size() + 1);
        for (const auto &[path, task]: visited) {
            const auto *owner = &registry.load_nested(fs::path(path).parent_path());
            chain.push_back(qualified(*owner, task));
        }
        chain.push_back(qualified(file, name));
        throw CyclicDelegation(std::move(chain));
    }
    const TaskDefinition &def = registry.lookup(name, file.dir);
    VisitGuard guard(visited, std::move(key));
    return resolve_definition(file, def, scope, visited);
}

ResolvedNode Resolver::resolve_reference(const TaskFile &from, const std::string &name,
                                         const std::optional<std::string> &dir, const Scope &scope,
                                         std::vector<VisitKey> &visited) {
    // With a dir the name is looked up in the task file living there.
    const TaskFile &target = dir ? registry.load_nested(scope.dir) : from;
    ResolvedNode node;
    node.kind = ResolvedNode::Kind::TaskRef;
    node.label = qualified(target, name);
    node.dir = scope.dir;
    node.env = scope.env;
    node.children.push_back(enter(target, name, scope, visited));
    return node;
}

ResolvedNode Resolver::resolve_definition(const TaskFile &file, const TaskDefinition &def, const Scope &inherited,
                                          std::vector<VisitKey> &visited) {
    const Scope scope = narrow(file, inherited, def.dir, def.env);
    const std::string label = qualified(file, def.name);

    if (def.task) return resolve_reference(file, *def.task, def.dir, scope, visited);

    ResolvedNode node;
    node.label = label;
    node.dir = scope.dir;
    node.env = scope.env;
    if (def.cmd) {
        node.kind = ResolvedNode::Kind::Command;
        node.command = *def.cmd;
        return node;
    }
    node.kind = ResolvedNode::Kind::Sequence;
    node.children.reserve(def.steps->size());
    for (size_t i = 0; i < def.steps->size(); ++i) {
        node.children.push_back(resolve_step(file, (*def.steps)[i], scope, label + "." + std::to_string(i + 1),
                                             visited));
    }
    return node;
}

ResolvedNode Resolver::resolve_step(const TaskFile &file, const StepSpec &step, const Scope &inherited,
                                    const std::string &label, std::vector<VisitKey> &visited) {
    const Scope scope = narrow(file, inherited, step.dir, step.env);
    switch (step.kind) {
        case StepSpec::Kind::TaskRef:
            return resolve_reference(file, step.task, step.dir, scope, visited);
        case StepSpec::Kind::Parallel: {
            ResolvedNode node;
            node.kind = ResolvedNode::Kind::Parallel;
            node.label = label;
            node.dir = scope.dir;
            node.env = scope.env;
            node.children.reserve(step.parallel.size());
            for (size_t i = 0; i < step.parallel.size(); ++i) {
                node.children.push_back(resolve_step(file, step.parallel[i], scope,
                                                     label + "." + std::to_string(i + 1), visited));
            }
            return node;
        }
        case StepSpec::Kind::Command:
            break;
    }
    ResolvedNode node;
    node.kind = ResolvedNode::Kind::Command;
    node.label = label;
    node.command = step.cmd;
    node.dir = scope.dir;
    node.env = scope.env;
    return node;
}
