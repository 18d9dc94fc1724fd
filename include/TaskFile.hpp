#pragma once
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace rnr {
    inline constexpr const char *TASK_FILE_NAME = "rnr.yaml";

    using EnvMap = std::map<std::string, std::string>;

    // One entry of a `steps` sequence (or a member of a `parallel` group).
    struct StepSpec {
        enum class Kind { Command, TaskRef, Parallel };

        Kind kind = Kind::Command;
        std::string cmd; // Kind::Command
        std::string task; // Kind::TaskRef
        std::optional<std::string> dir; // relative to the declaring file's directory
        std::optional<EnvMap> env;
        std::vector<StepSpec> parallel; // Kind::Parallel, kept as written (nesting is checked later)
        int line = 0;
    };

    struct TaskDefinition {
        std::string name;
        std::string description;
        std::optional<std::string> dir;
        std::optional<EnvMap> env;
        // Exactly one of the three is set.
        std::optional<std::string> cmd;
        std::optional<std::string> task;
        std::optional<std::vector<StepSpec> > steps;
        int line = 0;
    };

    // The parsed content of one rnr.yaml.
    struct TaskFile {
        std::filesystem::path path; // absolute
        std::filesystem::path dir; // directory holding the file; anchor of every relative `dir`
        std::vector<TaskDefinition> tasks; // declaration order

        [[nodiscard]] const TaskDefinition *find(const std::string &name) const;
    };

    // Throws MissingTaskFile if the file can't be read, MalformedTaskFile on
    // YAML errors or definitions that break the task/step invariants.
    TaskFile parse_task_file(const std::filesystem::path &path);

    // Same rules on in-memory text; `path` is only used for anchoring and messages.
    TaskFile parse_task_text(const std::string &text, const std::filesystem::path &path);

    // Walks from `start` up to the filesystem root and returns the first rnr.yaml.
    std::filesystem::path find_task_file(const std::filesystem::path &start);
} // namespace rnr
