#pragma once
#include "Registry.hpp"
#include "TaskFile.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace rnr {
    /**
     * @brief A node of the resolved task tree.
     *
     * Every node carries the working directory and environment overlay that
     * apply to it, computed while walking the definitions. TaskRef nodes have
     * exactly one child: the definition they point to.
     */
    struct ResolvedNode {
        enum class Kind { Command, TaskRef, Sequence, Parallel };

        Kind kind = Kind::Command;
        /// Qualified task name, or task name plus step index for step entries.
        std::string label;
        /// Shell command line, Kind::Command only.
        std::string command;
        /// Effective working directory (absolute).
        std::filesystem::path dir;
        /// Declared variables in effect (inherited then overlaid); not the ambient environment.
        EnvMap env;
        std::vector<ResolvedNode> children;
    };

    // (absolute task file path, task name)
    using VisitKey = std::pair<std::string, std::string>;

    class Resolver {
    public:
        explicit Resolver(TaskRegistry &registry);

        // Resolves `task_name` as declared in the task file located in `start_dir`.
        // Throws UnknownTask, MissingTaskFile, MalformedTaskFile, CyclicDelegation.
        ResolvedNode resolve(const std::string &task_name, const std::filesystem::path &start_dir);

        // `visited` is the delegation path already entered; it is restored on return.
        ResolvedNode resolve(const std::string &task_name, const std::filesystem::path &start_dir,
                             std::vector<VisitKey> &visited);

    private:
        struct Scope {
            std::filesystem::path dir;
            EnvMap env;
        };

        [[nodiscard]] Scope narrow(const TaskFile &file, const Scope &outer, const std::optional<std::string> &dir,
                                   const std::optional<EnvMap> &env) const;

        [[nodiscard]] std::string qualified(const TaskFile &file, const std::string &name) const;

        ResolvedNode enter(const TaskFile &file, const std::string &name, const Scope &scope,
                           std::vector<VisitKey> &visited);

        ResolvedNode resolve_definition(const TaskFile &file, const TaskDefinition &def, const Scope &inherited,
                                        std::vector<VisitKey> &visited);

        ResolvedNode resolve_step(const TaskFile &file, const StepSpec &step, const Scope &inherited,
                                  const std::string &label, std::vector<VisitKey> &visited);

        ResolvedNode resolve_reference(const TaskFile &from, const std::string &name,
                                       const std::optional<std::string> &dir, const Scope &scope,
                                       std::vector<VisitKey> &visited);

        TaskRegistry &registry;
    };
} // namespace rnr
