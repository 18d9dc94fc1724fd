#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include <poll.h>
#include <unistd.h>
#include "../include/Errors.hpp"
#include "../include/Spawner.hpp"
#include "TmpProject.hpp"

using namespace rnr;

namespace
{
    struct Collect final : OutputChannel
    {
        std::vector<std::pair<Stream, std::string> > lines;
        bool finished = false;

        void line(const Stream stream, const std::string &text) override { lines.emplace_back(stream, text); }

        void finish() override { finished = true; }

        std::vector<std::string> of(const Stream s) const
        {
            std::vector<std::string> r;
            for (const auto &[st, text]: lines)
                if (st == s) r.push_back(text);
            return r;
        }
    };

    const EnvMap BASIC_ENV{{"PATH", "/usr/bin:/bin"}};
} // namespace

TEST(PosixSpawner, ExitCode)
{
    TmpProject p;
    PosixSpawner sh;
    Collect c;
    EXPECT_EQ(sh.spawn("true", p.root, BASIC_ENV, c), 0);
    EXPECT_EQ(sh.spawn("exit 3", p.root, BASIC_ENV, c), 3);
    EXPECT_EQ(sh.spawn("exit 255", p.root, BASIC_ENV, c), 255);
}

TEST(PosixSpawner, CapturesBothStreamsByLine)
{
    TmpProject p;
    PosixSpawner sh;
    Collect c;
    ASSERT_EQ(sh.spawn("echo one; echo two; echo bad >&2; printf tail", p.root, BASIC_ENV, c), 0);
    EXPECT_EQ(c.of(Stream::Out), (std::vector<std::string>{"one", "two", "tail"}));
    EXPECT_EQ(c.of(Stream::Err), (std::vector<std::string>{"bad"}));
}

TEST(PosixSpawner, RunsInGivenDirectory)
{
    TmpProject p;
    p.mkdir("services/api");
    PosixSpawner sh;
    Collect c;
    ASSERT_EQ(sh.spawn("pwd -P", p.path("services/api"), BASIC_ENV, c), 0);
    ASSERT_EQ(c.of(Stream::Out).size(), 1u);
    EXPECT_EQ(c.of(Stream::Out)[0], std::filesystem::canonical(p.path("services/api")).string());
}

TEST(PosixSpawner, EnvironmentIsExactlyWhatWasGiven)
{
    TmpProject p;
    PosixSpawner sh;
    Collect c;
    const EnvMap env{{"ONLY", "x y"}};
    ASSERT_EQ(sh.spawn("echo \"${HOME-unset}|$ONLY\"", p.root, env, c), 0);
    EXPECT_EQ(c.of(Stream::Out), (std::vector<std::string>{"unset|x y"}));
}

TEST(PosixSpawner, MissingDirectoryIsSpawnFailure)
{
    TmpProject p;
    PosixSpawner sh;
    Collect c;
    EXPECT_THROW(sh.spawn("true", p.path("nope"), BASIC_ENV, c), SpawnFailed);
}

TEST(PosixSpawner, MissingShellIsSpawnFailure)
{
    TmpProject p;
    PosixSpawner sh("/nonexistent/bin/sh");
    Collect c;
    try
    {
        sh.spawn("true", p.root, BASIC_ENV, c);
        FAIL() << "expected SpawnFailed";
    }
    catch (const SpawnFailed &e)
    {
        EXPECT_EQ(e.kind(), ErrorKind::SpawnFailed);
        EXPECT_NE(std::string(e.what()).find("/nonexistent/bin/sh"), std::string::npos);
    }
}

TEST(PosixSpawner, CommandNotFoundIsAnExitCode)
{
    TmpProject p;
    PosixSpawner sh;
    Collect c;
    EXPECT_EQ(sh.spawn("definitely-not-a-command-rnr", p.root, BASIC_ENV, c), 127);
}

TEST(PosixSpawner, KilledBySignal)
{
    TmpProject p;
    PosixSpawner sh;
    Collect c;
    EXPECT_EQ(sh.spawn("kill -TERM $$", p.root, BASIC_ENV, c), 128 + 15);
}

TEST(PosixSpawner, ReturnsWhenShellExitsDespiteBackgroundChild)
{
    TmpProject p;
    PosixSpawner sh;
    Collect c;
    const auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(sh.spawn("sleep 3 & echo started", p.root, BASIC_ENV, c), 0);
    const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_LT(elapsed.count(), 2.0);
    EXPECT_EQ(c.of(Stream::Out), (std::vector<std::string>{"started"}));
}

TEST(PosixSpawner, OutputAfterForegroundStillCollected)
{
    TmpProject p;
    PosixSpawner sh;
    Collect c;
    EXPECT_EQ(sh.spawn("sleep 2 & printf 'a\\nb\\n'; echo err >&2; exit 4", p.root, BASIC_ENV, c), 4);
    EXPECT_EQ(c.of(Stream::Out), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(c.of(Stream::Err), (std::vector<std::string>{"err"}));
}

namespace
{
    // Hands the child a pipe of the test's own as stdout/stderr.
    struct Inherit final : OutputChannel
    {
        explicit Inherit(const int fd) : fd(fd)
        {
        }

        void line(Stream, const std::string &text) override { captured.push_back(text); }

        void finish() override
        {
        }

        std::optional<Passthrough> passthrough() const override { return Passthrough{fd, fd}; }

        int fd;
        std::vector<std::string> captured;
    };
} // namespace

TEST(PosixSpawner, InheritedOutputShowsPartialLinesWhileRunning)
{
    TmpProject p;
    int fds[2];
    ASSERT_EQ(::pipe(fds), 0);
    PosixSpawner sh;
    Inherit ch(fds[1]);
    std::atomic<bool> done{false};
    int rc = -1;
    std::thread runner([&] {
        rc = sh.spawn("printf 'Continue? '; sleep 1", p.root, BASIC_ENV, ch);
        done = true;
    });

    pollfd pfd{fds[0], POLLIN, 0};
    ASSERT_EQ(::poll(&pfd, 1, 900), 1);
    char buf[64] = {};
    const ssize_t got = ::read(fds[0], buf, sizeof(buf) - 1);
    EXPECT_FALSE(done.load());
    runner.join();

    EXPECT_EQ(std::string(buf, got > 0 ? static_cast<size_t>(got) : 0), "Continue? ");
    EXPECT_EQ(rc, 0);
    EXPECT_TRUE(ch.captured.empty());
    ::close(fds[0]);
    ::close(fds[1]);
}
