#include "../include/Registry.hpp"
#include "../include/Errors.hpp"
#include <algorithm>

using namespace rnr;
namespace fs = std::filesystem;

std::string TaskRegistry::key_for(const fs::path &dir) {
    fs::path p = fs::weakly_canonical(fs::absolute(dir));
    std::string key = p.lexically_normal().string();
    while (key.size() > 1 && key.back() == '/') key.pop_back();
    return key;
}

TaskRegistry::TaskRegistry(const fs::path &root_file) : TaskRegistry(parse_task_file(root_file)) {
}

TaskRegistry::TaskRegistry(TaskFile root_file) {
    auto owned = std::make_unique<TaskFile>(std::move(root_file));
    root_ = owned.get();
    files.emplace(key_for(owned->dir), std::move(owned));
}

const TaskFile &TaskRegistry::load_nested(const fs::path &dir) {
    const std::string key = key_for(dir);
    if (const auto it = files.find(key); it != files.end()) return *it->second;
    const fs::path file = fs::absolute(dir).lexically_normal() / TASK_FILE_NAME;
    if (!fs::is_regular_file(file)) {
        throw MissingTaskFile(std::string(_("No task file at delegation target: ")) + file.string());
    }
    auto parsed = std::make_unique<TaskFile>(parse_task_file(file));
    const TaskFile &ref = *parsed;
    files.emplace(key, std::move(parsed));
    return ref;
}

const TaskDefinition &TaskRegistry::lookup(const std::string &name, const fs::path &from_dir) {
    const TaskFile &file = load_nested(from_dir);
    const TaskDefinition *def = file.find(name);
    if (def == nullptr) throw UnknownTask(name, file.path.string());
    return *def;
}

std::vector<std::pair<std::string, std::string> > TaskRegistry::list_tasks() const {
    std::vector<std::pair<std::string, std::string> > out;
    out.reserve(root_->tasks.size());
    for (const auto &t: root_->tasks) out.emplace_back(t.name, t.description);
    std::ranges::sort(out, {}, &std::pair<std::string, std::string>::first);
    return out;
}
