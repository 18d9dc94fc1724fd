#include <gtest/gtest.h>
#include <string>
#include "../include/Errors.hpp"
#include "../include/TaskFile.hpp"
#include "TmpProject.hpp"

using namespace rnr;

namespace
{
    TaskFile parse(const std::string &yaml)
    {
        return parse_task_text(yaml, "/project/rnr.yaml");
    }

    ErrorKind kind_of(const std::string &yaml)
    {
        try
        {
            parse(yaml);
        }
        catch (const Error &e)
        {
            return e.kind();
        }
        ADD_FAILURE() << "expected a task file error";
        return ErrorKind::UnknownTask;
    }
} // namespace

TEST(TaskFile, ShorthandIsCommand)
{
    const auto f = parse("build: cargo build --release\n");
    ASSERT_EQ(f.tasks.size(), 1u);
    EXPECT_EQ(f.tasks[0].name, "build");
    ASSERT_TRUE(f.tasks[0].cmd.has_value());
    EXPECT_EQ(*f.tasks[0].cmd, "cargo build --release");
    EXPECT_FALSE(f.tasks[0].task.has_value());
    EXPECT_FALSE(f.tasks[0].steps.has_value());
    EXPECT_EQ(f.dir.string(), "/project");
}

TEST(TaskFile, FullTaskFields)
{
    const auto f = parse(
        "build:\n"
        "  description: Build the project for production\n"
        "  dir: src/subproject\n"
        "  env:\n"
        "    NODE_ENV: production\n"
        "    DEBUG: \"false\"\n"
        "    PORT: 8080\n"
        "  cmd: npm run build\n");
    const auto *t = f.find("build");
    ASSERT_NE(t, nullptr);
    EXPECT_EQ(t->description, "Build the project for production");
    EXPECT_EQ(t->dir.value_or(""), "src/subproject");
    ASSERT_TRUE(t->env.has_value());
    EXPECT_EQ(t->env->at("NODE_ENV"), "production");
    EXPECT_EQ(t->env->at("DEBUG"), "false");
    EXPECT_EQ(t->env->at("PORT"), "8080");
    EXPECT_EQ(t->cmd.value_or(""), "npm run build");
    EXPECT_EQ(t->line, 1);
}

TEST(TaskFile, DelegationWithDir)
{
    const auto f = parse(
        "build:\n"
        "  dir: services/api\n"
        "  task: build\n");
    const auto *t = f.find("build");
    ASSERT_NE(t, nullptr);
    EXPECT_EQ(t->task.value_or(""), "build");
    EXPECT_EQ(t->dir.value_or(""), "services/api");
    EXPECT_FALSE(t->cmd.has_value());
}

TEST(TaskFile, MixedSequentialAndParallel)
{
    const auto f = parse(
        "deploy:\n"
        "  steps:\n"
        "    - cmd: echo \"Starting\"\n"
        "    - parallel:\n"
        "        - task: build-api\n"
        "        - dir: web\n"
        "          cmd: npm run build\n"
        "    - echo Done\n");
    const auto *t = f.find("deploy");
    ASSERT_NE(t, nullptr);
    ASSERT_TRUE(t->steps.has_value());
    const auto &steps = *t->steps;
    ASSERT_EQ(steps.size(), 3u);
    EXPECT_EQ(steps[0].kind, StepSpec::Kind::Command);
    EXPECT_EQ(steps[0].cmd, "echo \"Starting\"");
    EXPECT_EQ(steps[1].kind, StepSpec::Kind::Parallel);
    ASSERT_EQ(steps[1].parallel.size(), 2u);
    EXPECT_EQ(steps[1].parallel[0].kind, StepSpec::Kind::TaskRef);
    EXPECT_EQ(steps[1].parallel[0].task, "build-api");
    EXPECT_EQ(steps[1].parallel[1].dir.value_or(""), "web");
    EXPECT_EQ(steps[2].kind, StepSpec::Kind::Command);
    EXPECT_EQ(steps[2].cmd, "echo Done");
}

TEST(TaskFile, DeclarationOrderKept)
{
    const auto f = parse("zebra: echo zebra\nalpha: echo alpha\nmiddle: echo middle\n");
    ASSERT_EQ(f.tasks.size(), 3u);
    EXPECT_EQ(f.tasks[0].name, "zebra");
    EXPECT_EQ(f.tasks[1].name, "alpha");
    EXPECT_EQ(f.tasks[2].name, "middle");
}

TEST(TaskFile, NamespacedNamesAreOpaqueKeys)
{
    const auto f = parse("\"api:build\": cargo build\n\"web:build\": npm run build\nbuild: make\n");
    EXPECT_NE(f.find("api:build"), nullptr);
    EXPECT_NE(f.find("web:build"), nullptr);
    EXPECT_NE(f.find("build"), nullptr);
    EXPECT_EQ(f.find("api"), nullptr);
}

TEST(TaskFile, EmptyEnvAllowed)
{
    const auto f = parse("build:\n  env: {}\n  cmd: cargo build\n");
    ASSERT_TRUE(f.tasks[0].env.has_value());
    EXPECT_TRUE(f.tasks[0].env->empty());
}

TEST(TaskFile, EmptyDocuments)
{
    EXPECT_TRUE(parse("").tasks.empty());
    EXPECT_TRUE(parse("{}").tasks.empty());
    EXPECT_TRUE(parse("# only a comment\n").tasks.empty());
}

TEST(TaskFile, InvariantViolationsAreMalformed)
{
    EXPECT_EQ(kind_of("build:\n  description: nothing to do\n"), ErrorKind::MalformedTaskFile);
    EXPECT_EQ(kind_of("build:\n  cmd: make\n  task: other\n"), ErrorKind::MalformedTaskFile);
    EXPECT_EQ(kind_of("build:\n  cmd: make\n  steps:\n    - cmd: x\n"), ErrorKind::MalformedTaskFile);
    EXPECT_EQ(kind_of("build:\n  steps: []\n"), ErrorKind::MalformedTaskFile);
    EXPECT_EQ(kind_of("build:\n  steps:\n    - cmd: a\n      task: b\n"), ErrorKind::MalformedTaskFile);
    EXPECT_EQ(kind_of("build:\n  steps:\n    - dir: x\n"), ErrorKind::MalformedTaskFile);
    EXPECT_EQ(kind_of("build:\n  steps:\n    - parallel: []\n"), ErrorKind::MalformedTaskFile);
    EXPECT_EQ(kind_of("build:\n  steps:\n    - parallel:\n        - cmd: a\n      dir: x\n"),
              ErrorKind::MalformedTaskFile);
    EXPECT_EQ(kind_of("build:\n  cmdd: make\n"), ErrorKind::MalformedTaskFile);
    EXPECT_EQ(kind_of("build:\n  cmd: [a, b]\n"), ErrorKind::MalformedTaskFile);
    EXPECT_EQ(kind_of("build:\n  env: [A]\n  cmd: make\n"), ErrorKind::MalformedTaskFile);
    EXPECT_EQ(kind_of("- build\n- test\n"), ErrorKind::MalformedTaskFile);
    EXPECT_EQ(kind_of("build:\n"), ErrorKind::MalformedTaskFile);
}

TEST(TaskFile, SyntaxErrorIsMalformed)
{
    EXPECT_EQ(kind_of("build: [unterminated\n"), ErrorKind::MalformedTaskFile);
}

TEST(TaskFile, ErrorMentionsFileAndLine)
{
    try
    {
        parse("lint: cargo clippy\ntest: cargo test\nbuild:\n  cmd: make\n  task: other\n");
        FAIL() << "expected MalformedTaskFile";
    }
    catch (const MalformedTaskFile &e)
    {
        const std::string msg = e.what();
        EXPECT_NE(msg.find("/project/rnr.yaml:"), std::string::npos) << msg;
        EXPECT_NE(msg.find("build"), std::string::npos) << msg;
    }
}

TEST(TaskFile, NestedParallelIsKeptForPlanning)
{
    const auto f = parse(
        "build:\n"
        "  steps:\n"
        "    - parallel:\n"
        "        - parallel:\n"
        "            - cmd: a\n"
        "        - cmd: b\n");
    const auto &outer = (*f.tasks[0].steps)[0];
    ASSERT_EQ(outer.kind, StepSpec::Kind::Parallel);
    EXPECT_EQ(outer.parallel[0].kind, StepSpec::Kind::Parallel);
}

TEST(TaskFile, MissingFileThrows)
{
    TmpProject p;
    EXPECT_THROW(parse_task_file(p.path("rnr.yaml")), MissingTaskFile);
}

TEST(TaskFile, ParseFromDisk)
{
    TmpProject p;
    const auto file = p.write("rnr.yaml", "build: make\n");
    const auto f = parse_task_file(file);
    EXPECT_EQ(f.path.string(), file.string());
    EXPECT_EQ(f.dir.string(), p.root.lexically_normal().string());
    EXPECT_NE(f.find("build"), nullptr);
}

TEST(TaskFile, FindWalksUpToParent)
{
    TmpProject p;
    const auto file = p.write("rnr.yaml", "build: make\n");
    p.mkdir("a/b/c");
    EXPECT_EQ(find_task_file(p.path("a/b/c")).string(), file.string());
    EXPECT_EQ(find_task_file(p.root).string(), file.string());
}

TEST(TaskFile, FindPrefersNearest)
{
    TmpProject p;
    p.write("rnr.yaml", "build: make\n");
    const auto nested = p.write("services/api/rnr.yaml", "build: cargo build\n");
    p.mkdir("services/api/src");
    EXPECT_EQ(find_task_file(p.path("services/api/src")).string(), nested.string());
}
