//===----------------------------------------------------------------------===//
//
// Part of the Rosella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Tests for the rosella command line: argument parsing in-process, and the
// built binary driven through a subprocess for exit codes and output files.
//
//===----------------------------------------------------------------------===//

#include "common/RunProcess.hpp"
#include "tools/rosella/cli.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using rosella::frontends::script::Target;
using namespace rosella::tools;

namespace
{

namespace fs = std::filesystem;

/// Keeps argv strings alive for a parseCommandLine call.
class Argv
{
  public:
    explicit Argv(const std::vector<const char *> &args)
    {
        storage_.emplace_back("rosella");
        for (const char *arg : args)
            storage_.emplace_back(arg);
        for (auto &s : storage_)
            pointers_.push_back(s.data());
    }

    int argc() const
    {
        return static_cast<int>(pointers_.size());
    }

    char **argv()
    {
        return pointers_.data();
    }

  private:
    std::vector<std::string> storage_;
    std::vector<char *> pointers_;
};

rosella::support::Expected<CliCommand> parse(const std::vector<const char *> &args)
{
    Argv argv(args);
    return parseCommandLine(argv.argc(), argv.argv());
}

std::string readFile(const fs::path &path)
{
    std::ifstream in(path, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace

TEST(RosellaCli, CompileDefaults)
{
    auto parsed = parse({"compile", "-i", "demo.rsl"});
    ASSERT_TRUE(parsed) << parsed.error().message;
    const CliCommand &cmd = parsed.value();
    EXPECT_EQ(cmd.action, CliAction::Compile);
    EXPECT_EQ(cmd.compile.inputPath, "demo.rsl");
    EXPECT_TRUE(cmd.compile.outputPath.empty());
    ASSERT_EQ(cmd.compile.targets.size(), 2u);
    EXPECT_EQ(cmd.compile.targets[0], Target::Shell);
    EXPECT_EQ(cmd.compile.targets[1], Target::Batch);
    EXPECT_TRUE(cmd.compile.options.normalizePaths);
    EXPECT_TRUE(cmd.compile.options.batchCrlf);
}

TEST(RosellaCli, CompileFlags)
{
    auto parsed = parse({"compile",
                         "--input",
                         "a.rsl",
                         "--target",
                         "windows",
                         "-o",
                         "out.bat",
                         "--no-normalize-paths",
                         "--lf",
                         "--dump-tokens",
                         "--dump-ast"});
    ASSERT_TRUE(parsed) << parsed.error().message;
    const CompileConfig &config = parsed.value().compile;
    ASSERT_EQ(config.targets.size(), 1u);
    EXPECT_EQ(config.targets[0], Target::Batch);
    EXPECT_EQ(config.outputPath, "out.bat");
    EXPECT_FALSE(config.options.normalizePaths);
    EXPECT_FALSE(config.options.batchCrlf);
    EXPECT_TRUE(config.options.dumpTokens);
    EXPECT_TRUE(config.options.dumpAst);
}

TEST(RosellaCli, HelpAndVersion)
{
    auto help = parse({"--help"});
    ASSERT_TRUE(help);
    EXPECT_EQ(help.value().action, CliAction::Help);

    auto compileHelp = parse({"compile", "-h"});
    ASSERT_TRUE(compileHelp);
    EXPECT_EQ(compileHelp.value().action, CliAction::Help);

    auto version = parse({"--version"});
    ASSERT_TRUE(version);
    EXPECT_EQ(version.value().action, CliAction::Version);
}

TEST(RosellaCli, UsageErrors)
{
    struct Case
    {
        std::vector<const char *> args;
        const char *message;
    };
    const std::vector<Case> cases = {
        {{}, "no command given"},
        {{"build"}, "unknown command: build"},
        {{"compile"}, "no input file specified (use -i <file>)"},
        {{"compile", "-i"}, "-i requires an argument"},
        {{"compile", "-i", "a.rsl", "-i", "b.rsl"}, "multiple input files not supported"},
        {{"compile", "-i", "a.rsl", "--target", "ps1"},
         "unknown target 'ps1'; expected shell, batch or both"},
        {{"compile", "-i", "a.rsl", "--target", "sh", "--target", "bat"},
         "--target given more than once"},
        {{"compile", "-i", "a.rsl", "-o", "out"}, "-o requires a single --target"},
        {{"compile", "-i", "a.rsl", "--verbose"}, "unknown argument: --verbose"},
    };

    for (const Case &c : cases)
    {
        auto parsed = parse(c.args);
        ASSERT_FALSE(parsed) << c.message;
        EXPECT_EQ(parsed.error().message, c.message);
    }
}

TEST(RosellaCli, DefaultOutputPathReplacesExtension)
{
    EXPECT_EQ(defaultOutputPath("dir/demo.rsl", Target::Shell), "dir/demo.sh");
    EXPECT_EQ(defaultOutputPath("demo.rsl", Target::Batch), "demo.bat");
    EXPECT_EQ(defaultOutputPath("noext", Target::Shell), "noext.sh");
}

#ifdef ROSELLA_CLI_PATH

namespace
{

class RosellaCliBinary : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        const ::testing::TestInfo *info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = fs::temp_directory_path() / (std::string("rosella-cli-") + info->name());
        fs::remove_all(dir_);
        fs::create_directories(dir_);
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    void writeSource(const std::string &name, const std::string &text)
    {
        std::ofstream out(dir_ / name, std::ios::binary);
        out << text;
    }

    rosella::common::RunResult run(std::vector<std::string> args)
    {
        args.insert(args.begin(), ROSELLA_CLI_PATH);
        return rosella::common::run_process(args, dir_.string());
    }

    fs::path dir_;
};

} // namespace

TEST_F(RosellaCliBinary, WritesBothTargets)
{
    writeSource("hello.rsl", "print(\"hello\");\n");
    auto result = run({"compile", "-i", "hello.rsl"});
    ASSERT_EQ(result.exit_code, 0) << result.err;
    EXPECT_EQ(readFile(dir_ / "hello.sh"), "#!/bin/sh\n\nprintf '%s\\n' \"hello\"\n");
    EXPECT_EQ(readFile(dir_ / "hello.bat"),
              "@echo off\r\nsetlocal EnableExtensions EnableDelayedExpansion\r\necho(hello\r\n");

    const auto perms = fs::status(dir_ / "hello.sh").permissions();
    EXPECT_NE(perms & fs::perms::owner_exec, fs::perms::none);
}

TEST_F(RosellaCliBinary, ExplicitOutputAndTarget)
{
    writeSource("a.rsl", "print(\"x\");\n");
    auto result = run({"compile", "-i", "a.rsl", "--target", "batch", "--lf", "-o", "run.cmd"});
    ASSERT_EQ(result.exit_code, 0) << result.err;
    EXPECT_TRUE(fs::exists(dir_ / "run.cmd"));
    EXPECT_FALSE(fs::exists(dir_ / "a.sh"));
    EXPECT_EQ(readFile(dir_ / "run.cmd").find('\r'), std::string::npos);
}

TEST_F(RosellaCliBinary, CompileErrorExitsOneAndWritesNothing)
{
    writeSource("bad.rsl", "let a = 1;\nprint(b);\n");
    auto result = run({"compile", "-i", "bad.rsl"});
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_EQ(result.err,
              "bad.rsl:2:7: error[R3001]: NameError: use of undeclared identifier 'b'\n");
    EXPECT_FALSE(fs::exists(dir_ / "bad.sh"));
    EXPECT_FALSE(fs::exists(dir_ / "bad.bat"));
}

TEST_F(RosellaCliBinary, MissingInputFile)
{
    auto result = run({"compile", "-i", "missing.rsl"});
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_EQ(result.err, "error[R0001]: unable to open missing.rsl\n");
}

TEST_F(RosellaCliBinary, UsageErrorExitsTwo)
{
    auto result = run({"compile", "--bogus"});
    EXPECT_EQ(result.exit_code, 2);
    EXPECT_EQ(result.err.rfind("error: unknown argument: --bogus\n", 0), 0u) << result.err;
    EXPECT_NE(result.err.find("Usage: rosella compile"), std::string::npos);
}

TEST_F(RosellaCliBinary, HelpAndVersionGoToStdout)
{
    auto help = run({"--help"});
    EXPECT_EQ(help.exit_code, 0);
    EXPECT_NE(help.out.find("Usage: rosella compile"), std::string::npos);

    auto version = run({"--version"});
    EXPECT_EQ(version.exit_code, 0);
    EXPECT_EQ(version.out.rfind("rosella v", 0), 0u);
}

TEST_F(RosellaCliBinary, DebugTimingsOnRequest)
{
    writeSource("t.rsl", "print(\"t\");\n");
    auto result = rosella::common::run_process(
        {ROSELLA_CLI_PATH, "compile", "-i", "t.rsl", "--target", "sh"},
        dir_.string(),
        {{"ROSELLA_DEBUG_COMPILE", "1"}});
    ASSERT_EQ(result.exit_code, 0) << result.err;
    EXPECT_NE(result.err.find("[rosella] lex: "), std::string::npos);
    EXPECT_NE(result.err.find("[rosella] emit: "), std::string::npos);
}

#endif // ROSELLA_CLI_PATH
