#include "../include/Errors.hpp"
#include <utility>

using namespace rnr;

const char *rnr::kind_name(const ErrorKind kind) {
    switch (kind) {
        case ErrorKind::UnknownTask: return "UnknownTask";
        case ErrorKind::MissingTaskFile: return "MissingTaskFile";
        case ErrorKind::MalformedTaskFile: return "MalformedTaskFile";
        case ErrorKind::CyclicDelegation: return "CyclicDelegation";
        case ErrorKind::InvalidParallelNesting: return "InvalidParallelNesting";
        case ErrorKind::SpawnFailed: return "SpawnFailed";
    }
    return "Unknown";
}

Error::Error(const ErrorKind kind, const std::string &msg) : std::runtime_error(msg), kind_(kind) {
}

UnknownTask::UnknownTask(const std::string &name, const std::string &task_file)
    : Error(ErrorKind::UnknownTask,
            std::string(_("Task not found: ")) + "'" + name + "' (" + task_file + ")"),
      name_(name) {
}

MalformedTaskFile::MalformedTaskFile(const std::string &path, const int line, const std::string &msg)
    : Error(ErrorKind::MalformedTaskFile,
            "[" + path + (line > 0 ? ":" + std::to_string(line) : std::string()) + "] " + msg) {
}

static std::string join_chain(const std::vector<std::string> &chain) {
    std::string out;
    for (size_t i = 0; i < chain.size(); ++i) {
        if (i) out += " -> ";
        out += chain[i];
    }
    return out;
}

CyclicDelegation::CyclicDelegation(std::vector<std::string> chain)
    : Error(ErrorKind::CyclicDelegation, std::string(_("Cyclic task delegation: ")) + join_chain(chain)),
      chain_(std::move(chain)) {
}

InvalidParallelNesting::InvalidParallelNesting(const std::string &where)
    : Error(ErrorKind::InvalidParallelNesting,
            std::string(_("Parallel group nested inside another parallel group: ")) + where) {
}
