#pragma once
#include <libintl.h>
#include <stdexcept>
#include <string>
#include <vector>

#ifndef I18N_GETTEXT_DEFINED
#define _(String) gettext(String)
#define I18N_GETTEXT_DEFINED
#endif

namespace rnr {
    enum class ErrorKind {
        UnknownTask,
        MissingTaskFile,
        MalformedTaskFile,
        CyclicDelegation,
        InvalidParallelNesting,
        SpawnFailed
    };

    // Stable identifier used in diagnostics, e.g. "CyclicDelegation".
    const char *kind_name(ErrorKind kind);

    class Error : public std::runtime_error {
    public:
        Error(ErrorKind kind, const std::string &msg);

        [[nodiscard]] ErrorKind kind() const { return kind_; }

    private:
        ErrorKind kind_;
    };

    class UnknownTask : public Error {
    public:
        UnknownTask(const std::string &name, const std::string &task_file);

        [[nodiscard]] const std::string &name() const { return name_; }

    private:
        std::string name_;
    };

    class MissingTaskFile : public Error {
    public:
        explicit MissingTaskFile(const std::string &msg) : Error(ErrorKind::MissingTaskFile, msg) {}
    };

    class MalformedTaskFile : public Error {
    public:
        // line is 1-based; 0 when unknown
        MalformedTaskFile(const std::string &path, int line, const std::string &msg);
    };

    class CyclicDelegation : public Error {
    public:
        explicit CyclicDelegation(std::vector<std::string> chain);

        // Every task entered on the path, the repeated one last.
        [[nodiscard]] const std::vector<std::string> &chain() const { return chain_; }

    private:
        std::vector<std::string> chain_;
    };

    class InvalidParallelNesting : public Error {
    public:
        explicit InvalidParallelNesting(const std::string &where);
    };

    class SpawnFailed : public Error {
    public:
        explicit SpawnFailed(const std::string &msg) : Error(ErrorKind::SpawnFailed, msg) {}
    };
} // namespace rnr
