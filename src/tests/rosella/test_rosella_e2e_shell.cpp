//===----------------------------------------------------------------------===//
//
// Part of the Rosella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// End-to-end tests: compile Rosella programs to sh, run them with the host
// /bin/sh and compare stdout. Skipped when no POSIX shell is available.
//
//===----------------------------------------------------------------------===//

#include "common/RunProcess.hpp"
#include "frontends/script/Compiler.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

using namespace rosella::frontends::script;
using rosella::common::run_process;
using rosella::common::RunResult;

namespace
{

namespace fs = std::filesystem;

/// Compile @p source for sh, write it to a scratch file and run it.
RunResult runShell(const std::string &source)
{
    CompilerResult result = compile(source, Target::Shell);
    EXPECT_TRUE(result.succeeded()) << (result.error ? result.error->describe() : "");

    const fs::path dir = fs::temp_directory_path() / "rosella-e2e";
    fs::create_directories(dir);
    const ::testing::TestInfo *info = ::testing::UnitTest::GetInstance()->current_test_info();
    const fs::path script = dir / (std::string(info->name()) + ".sh");
    {
        std::ofstream out(script, std::ios::binary | std::ios::trunc);
        out << result.script;
    }

    RunResult run = run_process({"/bin/sh", script.string()});
    fs::remove(script);
    return run;
}

class RosellaShellE2E : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        if (!fs::exists("/bin/sh"))
            GTEST_SKIP() << "/bin/sh not available";
    }
};

} // namespace

TEST_F(RosellaShellE2E, WorkedExample)
{
    RunResult run = runShell("fn add(x, y) { print(\"Result: \", x + y); }\n"
                             "add(1, 2);\n"
                             "add(3, 4);\n"
                             "add(5, 6);\n"
                             "let int x = 0;\n"
                             "while int(x < 100) {\n"
                             "    print(\"Current value of x: \", x);\n"
                             "    let int x = x + 1;\n"
                             "}\n");
    ASSERT_EQ(run.exit_code, 0) << run.err;

    std::ostringstream expected;
    expected << "Result: 3\nResult: 7\nResult: 11\n";
    for (int i = 0; i < 100; ++i)
        expected << "Current value of x: " << i << "\n";
    EXPECT_EQ(run.out, expected.str());
}

TEST_F(RosellaShellE2E, NestedBlockRedeclarationShadows)
{
    RunResult run = runShell("{ let int x = 0; { let int x = x + 1; print(x); } print(x); }\n");
    ASSERT_EQ(run.exit_code, 0) << run.err;
    EXPECT_EQ(run.out, "1\n0\n");
}

TEST_F(RosellaShellE2E, LoopRedeclarationInsideFunctionUpdatesGlobal)
{
    RunResult run = runShell("let int n = 0;\n"
                             "fn bump(limit) {\n"
                             "    while int(n < limit) { let int n = n + 2; }\n"
                             "}\n"
                             "bump(5);\n"
                             "print(\"n=\", n);\n");
    ASSERT_EQ(run.exit_code, 0) << run.err;
    EXPECT_EQ(run.out, "n=6\n");
}

TEST_F(RosellaShellE2E, StringArgumentsKeepConcatenation)
{
    RunResult run = runShell("fn join(a, b) { print(a + b); }\n"
                             "join(\"1\", \"2\");\n"
                             "join(3, 4);\n");
    ASSERT_EQ(run.exit_code, 0) << run.err;
    EXPECT_EQ(run.out, "12\n34\n");
}

TEST_F(RosellaShellE2E, ShadowedBindingIsRestored)
{
    RunResult run = runShell("let v = \"outer\";\n"
                             "{ let v = \"inner\"; print(v); }\n"
                             "print(v);\n");
    ASSERT_EQ(run.exit_code, 0) << run.err;
    EXPECT_EQ(run.out, "inner\nouter\n");
}

TEST_F(RosellaShellE2E, RecursionKeepsLocalsPerCall)
{
    RunResult run = runShell("let int total = 0;\n"
                             "fn sum(int n) {\n"
                             "    if int(n > 0) {\n"
                             "        total = total + n;\n"
                             "        sum(n - 1);\n"
                             "        print(\"after \", n);\n"
                             "    }\n"
                             "}\n"
                             "sum(3);\n"
                             "print(\"total \", total);\n");
    ASSERT_EQ(run.exit_code, 0) << run.err;
    EXPECT_EQ(run.out, "after 1\nafter 2\nafter 3\ntotal 6\n");
}

TEST_F(RosellaShellE2E, BranchesAndStringTests)
{
    RunResult run = runShell("fn classify(int n) {\n"
                             "    if int(n < 0) { print(\"neg\"); }\n"
                             "    else if int(n == 0) { print(\"zero\"); }\n"
                             "    else { print(\"pos\"); }\n"
                             "}\n"
                             "classify(-4); classify(0); classify(9);\n"
                             "let s = \"\";\n"
                             "if str(s) { print(\"full\"); } else { print(\"empty\"); }\n"
                             "s = s + \"x\";\n"
                             "if str(s == \"x\") { print(\"match\"); }\n");
    ASSERT_EQ(run.exit_code, 0) << run.err;
    EXPECT_EQ(run.out, "neg\nzero\npos\nempty\nmatch\n");
}

TEST_F(RosellaShellE2E, SpecialCharactersPrintLiterally)
{
    RunResult run = runShell("let price = \"$5\";\n"
                             "print(\"cost `\", price, \"` \\\"ok\\\" 100%\");\n");
    ASSERT_EQ(run.exit_code, 0) << run.err;
    EXPECT_EQ(run.out, "cost `$5` \"ok\" 100%\n");
}

TEST_F(RosellaShellE2E, IntegerDivisionTruncates)
{
    RunResult run = runShell("let int a = 17;\nlet int b = a / 5 * 2 - -1;\nprint(b);\n");
    ASSERT_EQ(run.exit_code, 0) << run.err;
    EXPECT_EQ(run.out, "7\n");
}
