#include "../include/Spawner.hpp"
#include "../include/Errors.hpp"
#include <array>
#include <cerrno>
#include <cstring>
#include <optional>
#include <utility>
#include <vector>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

using namespace rnr;

namespace {
    struct Fd {
        int fd = -1;

        Fd() = default;

        Fd(const Fd &) = delete;

        Fd &operator=(const Fd &) = delete;

        ~Fd() { reset(); }

        void reset() {
            if (fd >= 0) ::close(fd);
            fd = -1;
        }
    };

    struct Pipe {
        Fd read;
        Fd write;

        bool open() {
            int fds[2];
            if (::pipe2(fds, O_CLOEXEC) != 0) return false;
            read.fd = fds[0];
            write.fd = fds[1];
            return true;
        }
    };

    // What the child reports through the status pipe when it can't exec.
    struct ChildFailure {
        int stage; // 0 = chdir, 1 = execve
        int err;
    };

    // Splits a byte stream into lines for one output stream.
    class LineSplitter {
    public:
        LineSplitter(OutputChannel &out, const Stream stream) : out(out), stream(stream) {
        }

        void feed(const char *data, const size_t n) {
            pending.append(data, n);
            size_t start = 0;
            for (size_t nl = pending.find('\n'); nl != std::string::npos; nl = pending.find('\n', start)) {
                out.line(stream, pending.substr(start, nl - start));
                start = nl + 1;
            }
            pending.erase(0, start);
        }

        void close() {
            if (!pending.empty()) out.line(stream, pending);
            pending.clear();
        }

    private:
        OutputChannel &out;
        Stream stream;
        std::string pending;
    };

    // How long drain() sleeps in poll() before checking whether the shell exited.
    constexpr int EXIT_CHECK_MS = 50;

    int exit_code(const int status) {
        if (WIFEXITED(status)) return WEXITSTATUS(status);
        if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
        return -1;
    }

    // Non-blocking reap. True once `pid` has terminated.
    bool reaped(const pid_t pid, int &status) {
        pid_t r;
        do {
            r = ::waitpid(pid, &status, WNOHANG);
        } while (r < 0 && errno == EINTR);
        if (r < 0) throw SpawnFailed(std::string(_("failed to wait for process: ")) + std::strerror(errno));
        return r == pid;
    }

    int wait_exit(const pid_t pid) {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0) {
            if (errno != EINTR) {
                throw SpawnFailed(std::string(_("failed to wait for process: ")) + std::strerror(errno));
            }
        }
        return exit_code(status);
    }

    // Reads what is already in the pipe without waiting for its writers.
    void read_available(Fd &src, LineSplitter &lines, std::array<char, 4096> &buf) {
        if (src.fd < 0) return;
        if (const int flags = ::fcntl(src.fd, F_GETFL); flags >= 0) ::fcntl(src.fd, F_SETFL, flags | O_NONBLOCK);
        while (true) {
            const ssize_t got = ::read(src.fd, buf.data(), buf.size());
            if (got > 0) {
                lines.feed(buf.data(), static_cast<size_t>(got));
                continue;
            }
            if (got < 0 && errno == EINTR) continue;
            break;
        }
        src.reset();
    }

    // Feeds the child's output to `out` until the shell exits and returns its
    // exit code. Background processes the command started may still hold the
    // pipes open; whatever they have written by then is kept, the rest is dropped.
    int drain(const pid_t pid, Fd &out_fd, Fd &err_fd, OutputChannel &out) {
        LineSplitter out_lines(out, Stream::Out);
        LineSplitter err_lines(out, Stream::Err);
        std::array<char, 4096> buf{};
        int status = 0;
        bool exited = false;
        while ((out_fd.fd >= 0 || err_fd.fd >= 0) && !exited) {
            pollfd fds[2];
            nfds_t n = 0;
            if (out_fd.fd >= 0) fds[n++] = pollfd{out_fd.fd, POLLIN, 0};
            if (err_fd.fd >= 0) fds[n++] = pollfd{err_fd.fd, POLLIN, 0};
            const int ready = ::poll(fds, n, EXIT_CHECK_MS);
            if (ready < 0 && errno != EINTR) break;
            for (nfds_t i = 0; ready > 0 && i < n; ++i) {
                if (fds[i].revents == 0) continue;
                const bool is_out = fds[i].fd == out_fd.fd;
                Fd &src = is_out ? out_fd : err_fd;
                const ssize_t got = ::read(src.fd, buf.data(), buf.size());
                if (got > 0) {
                    (is_out ? out_lines : err_lines).feed(buf.data(), static_cast<size_t>(got));
                } else if (got == 0 || errno != EINTR) {
                    src.reset();
                }
            }
            exited = reaped(pid, status);
        }
        read_available(out_fd, out_lines, buf);
        read_available(err_fd, err_lines, buf);
        out_lines.close();
        err_lines.close();
        return exited ? exit_code(status) : wait_exit(pid);
    }
} // namespace

PosixSpawner::PosixSpawner(std::string shell) : shell(std::move(shell)) {
}

int PosixSpawner::spawn(const std::string &command, const std::filesystem::path &cwd, const EnvMap &env,
                        OutputChannel &out) {
    // A command running alone writes to the terminal itself, so prompts
    // without a newline show up and tools still see a tty.
    const std::optional<Passthrough> direct = out.passthrough();

    Pipe out_pipe, err_pipe, status_pipe;
    if ((!direct && (!out_pipe.open() || !err_pipe.open())) || !status_pipe.open()) {
        throw SpawnFailed(std::string(_("failed to create pipe: ")) + std::strerror(errno));
    }
    const int child_out = direct ? direct->out_fd : out_pipe.write.fd;
    const int child_err = direct ? direct->err_fd : err_pipe.write.fd;

    // Everything the child needs is built before fork: other threads may be
    // spawning at the same time, so the child only makes async-signal-safe calls.
    std::vector<std::string> env_strings;
    env_strings.reserve(env.size());
    for (const auto &[k, v]: env) env_strings.push_back(k + "=" + v);
    std::vector<char *> envp;
    envp.reserve(env_strings.size() + 1);
    for (auto &s: env_strings) envp.push_back(s.data());
    envp.push_back(nullptr);

    std::string arg0 = shell;
    std::string arg1 = "-c";
    std::string arg2 = command;
    char *argv[] = {arg0.data(), arg1.data(), arg2.data(), nullptr};
    const std::string dir = cwd.string();

    const pid_t pid = ::fork();
    if (pid < 0) {
        throw SpawnFailed(std::string(_("failed to fork: ")) + std::strerror(errno));
    }
    if (pid == 0) {
        if (child_out != STDOUT_FILENO) ::dup2(child_out, STDOUT_FILENO);
        if (child_err != STDERR_FILENO) ::dup2(child_err, STDERR_FILENO);
        ChildFailure failure{0, 0};
        if (!dir.empty() && ::chdir(dir.c_str()) != 0) {
            failure = ChildFailure{0, errno};
        } else {
            ::execve(shell.c_str(), argv, envp.data());
            failure = ChildFailure{1, errno};
        }
        ssize_t ignored = ::write(status_pipe.write.fd, &failure, sizeof(failure));
        (void) ignored;
        ::_exit(127);
    }

    out_pipe.write.reset();
    err_pipe.write.reset();
    status_pipe.write.reset();

    // Closed on a successful exec, so this returns 0 bytes once the shell is running.
    ChildFailure failure{};
    ssize_t got;
    do {
        got = ::read(status_pipe.read.fd, &failure, sizeof(failure));
    } while (got < 0 && errno == EINTR);
    if (got == static_cast<ssize_t>(sizeof(failure))) {
        wait_exit(pid);
        const std::string what = failure.stage == 0
                                     ? std::string(_("cannot enter directory ")) + dir
                                     : std::string(_("cannot execute ")) + shell;
        throw SpawnFailed(what + ": " + std::strerror(failure.err));
    }

    if (direct) return wait_exit(pid);
    return drain(pid, out_pipe.read, err_pipe.read, out);
}
