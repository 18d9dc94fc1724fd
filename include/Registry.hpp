#pragma once
#include "TaskFile.hpp"
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace rnr {
    // All task files reachable from the root for one invocation. The root file
    // is loaded up front; nested files are loaded the first time a `dir`+`task`
    // delegation points at them, and each is parsed at most once.
    //
    // Loading happens on the coordinating thread during resolution. Once the
    // plan is built nothing touches the registry again.
    class TaskRegistry {
    public:
        explicit TaskRegistry(const std::filesystem::path &root_file);

        // Registry built from an already parsed root file (tests, --file).
        explicit TaskRegistry(TaskFile root_file);

        [[nodiscard]] const TaskFile &root() const { return *root_; }

        // Looks `name` up in the task file declared in `from_dir`.
        // Throws UnknownTask.
        const TaskDefinition &lookup(const std::string &name, const std::filesystem::path &from_dir);

        // Task file located in `dir` (absolute). Throws MissingTaskFile or MalformedTaskFile.
        const TaskFile &load_nested(const std::filesystem::path &dir);

        // Root tasks only, sorted by name.
        [[nodiscard]] std::vector<std::pair<std::string, std::string> > list_tasks() const;

        [[nodiscard]] size_t loaded_files() const { return files.size(); }

    private:
        static std::string key_for(const std::filesystem::path &dir);

        const TaskFile *root_ = nullptr;
        std::map<std::string, std::unique_ptr<TaskFile> > files; // keyed by normalized absolute dir
    };
} // namespace rnr
