#include "../include/TaskFile.hpp"
#include "../include/Errors.hpp"
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <sstream>
#include <unordered_set>
#include <utility>

using namespace rnr;
namespace fs = std::filesystem;

namespace {
    class TaskFileParser {
    public:
        explicit TaskFileParser(fs::path p) : path(std::move(p)) {
        }

        void parse(const YAML::Node &root, TaskFile &out) const {
            if (!root.IsDefined() || root.IsNull()) return; // empty document
            if (!root.IsMap()) bad(root, _("top level must be a mapping of task names"));
            std::unordered_set<std::string> seen;
            for (const auto &kv: root) {
                const std::string name = scalar(kv.first, "task name");
                if (name.empty()) bad(kv.first, _("empty task name"));
                if (!seen.insert(name).second) bad(kv.first, std::string(_("duplicate task: ")) + name);
                out.tasks.push_back(parse_task(name, kv.second, line_of(kv.first)));
            }
        }

    private:
        static int line_of(const YAML::Node &node) {
            const int l = node.Mark().line;
            return l >= 0 ? l + 1 : 0;
        }

        [[noreturn]] void bad(const YAML::Node &node, const std::string &msg) const {
            throw MalformedTaskFile(path.string(), line_of(node), msg);
        }

        std::string scalar(const YAML::Node &node, const std::string &what) const {
            if (!node.IsScalar()) bad(node, what + _(" must be a string"));
            return node.Scalar();
        }

        EnvMap parse_env(const YAML::Node &node) const {
            EnvMap env;
            if (node.IsNull()) return env;
            if (!node.IsMap()) bad(node, _("env must be a mapping"));
            for (const auto &kv: node) {
                const std::string key = scalar(kv.first, "env key");
                if (key.empty() || key.find('=') != std::string::npos) {
                    bad(kv.first, std::string(_("invalid env name: ")) + key);
                }
                if (!env.emplace(key, scalar(kv.second, "env " + key)).second) {
                    bad(kv.first, std::string(_("duplicate env key: ")) + key);
                }
            }
            return env;
        }

        TaskDefinition parse_task(const std::string &name, const YAML::Node &node, const int line) const {
            TaskDefinition def;
            def.name = name;
            def.line = line;
            if (node.IsScalar()) {
                // shorthand: `build: cargo build`
                def.cmd = node.Scalar();
                return def;
            }
            if (!node.IsMap()) bad(node, "'" + name + "': " + _("has no cmd, task, or steps defined"));
            for (const auto &kv: node) {
                const std::string key = scalar(kv.first, "key");
                const YAML::Node &v = kv.second;
                if (key == "description") def.description = scalar(v, key);
                else if (key == "dir") def.dir = scalar(v, key);
                else if (key == "env") def.env = parse_env(v);
                else if (key == "cmd") def.cmd = scalar(v, key);
                else if (key == "task") def.task = scalar(v, key);
                else if (key == "steps") {
                    if (!v.IsSequence()) bad(v, _("steps must be a sequence"));
                    if (v.size() == 0) bad(v, "'" + name + "': " + _("steps is empty"));
                    std::vector<StepSpec> steps;
                    for (const auto &s: v) steps.push_back(parse_step(s));
                    def.steps = std::move(steps);
                } else bad(kv.first, "'" + name + "': " + _("unknown key: ") + key);
            }
            const int kinds = (def.cmd ? 1 : 0) + (def.task ? 1 : 0) + (def.steps ? 1 : 0);
            if (kinds == 0) bad(node, "'" + name + "': " + _("has no cmd, task, or steps defined"));
            if (kinds > 1) bad(node, "'" + name + "': " + _("only one of cmd, task, steps is allowed"));
            return def;
        }

        StepSpec parse_step(const YAML::Node &node) const {
            StepSpec step;
            step.line = line_of(node);
            if (node.IsScalar()) {
                step.cmd = node.Scalar();
                return step;
            }
            if (!node.IsMap()) bad(node, _("step must be a mapping"));
            bool has_cmd = false, has_task = false, has_parallel = false;
            for (const auto &kv: node) {
                const std::string key = scalar(kv.first, "key");
                const YAML::Node &v = kv.second;
                if (key == "cmd") {
                    step.cmd = scalar(v, key);
                    has_cmd = true;
                } else if (key == "task") {
                    step.task = scalar(v, key);
                    has_task = true;
                } else if (key == "dir") step.dir = scalar(v, key);
                else if (key == "env") step.env = parse_env(v);
                else if (key == "parallel") {
                    if (!v.IsSequence()) bad(v, _("parallel must be a sequence"));
                    if (v.size() == 0) bad(v, _("parallel group is empty"));
                    for (const auto &m: v) step.parallel.push_back(parse_step(m));
                    has_parallel = true;
                } else bad(kv.first, std::string(_("unknown step key: ")) + key);
            }
            const int kinds = (has_cmd ? 1 : 0) + (has_task ? 1 : 0) + (has_parallel ? 1 : 0);
            if (kinds != 1) bad(node, _("step needs exactly one of cmd, task, parallel"));
            if (has_parallel) {
                if (step.dir || step.env) bad(node, _("parallel group takes no dir or env"));
                step.kind = StepSpec::Kind::Parallel;
            } else if (has_task) {
                step.kind = StepSpec::Kind::TaskRef;
            }
            return step;
        }

        fs::path path;
    };
} // namespace

const TaskDefinition *TaskFile::find(const std::string &name) const {
    for (const auto &t: tasks) if (t.name == name) return &t;
    return nullptr;
}

TaskFile rnr::parse_task_text(const std::string &text, const fs::path &path) {
    TaskFile out;
    out.path = fs::absolute(path).lexically_normal();
    out.dir = out.path.parent_path();
    YAML::Node root;
    try {
        root = YAML::Load(text);
    } catch (const YAML::Exception &e) {
        throw MalformedTaskFile(out.path.string(), e.mark.line >= 0 ? e.mark.line + 1 : 0, e.msg);
    }
    TaskFileParser(out.path).parse(root, out);
    return out;
}

TaskFile rnr::parse_task_file(const fs::path &path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw MissingTaskFile(std::string(_("Failed to read task file: ")) + path.string());
    }
    std::stringstream ss;
    ss << in.rdbuf();
    return parse_task_text(ss.str(), path);
}

fs::path rnr::find_task_file(const fs::path &start) {
    fs::path dir = fs::absolute(start).lexically_normal();
    while (true) {
        if (const fs::path candidate = dir / TASK_FILE_NAME; fs::is_regular_file(candidate)) return candidate;
        const fs::path parent = dir.parent_path();
        if (parent == dir || parent.empty()) break;
        dir = parent;
    }
    throw MissingTaskFile(std::string(_("No rnr.yaml found in current directory or any parent directory")) +
                          " (" + start.string() + ")");
}
