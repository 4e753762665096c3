//===----------------------------------------------------------------------===//
//
// Part of the Rosella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Golden-text tests for the POSIX sh emitter. Each case runs the full
// front end and compares the exact script text.
//
//===----------------------------------------------------------------------===//

#include "codegen/script/ScriptEmitter.hpp"
#include "frontends/script/Lexer.hpp"
#include "frontends/script/Parser.hpp"
#include "frontends/script/Sema.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace rosella::frontends::script;
using rosella::codegen::script::EmitOptions;
using rosella::codegen::script::ScriptEmitter;

namespace
{

std::string emitShell(const std::string &source, bool normalizePaths = true)
{
    Lexer lexer(source, 1);
    Parser parser(lexer.tokenize());
    EXPECT_FALSE(lexer.hasError());
    Program program = parser.parseProgram();
    EXPECT_FALSE(parser.hasError());
    Sema sema(program);
    EXPECT_TRUE(sema.analyze()) << (sema.hasError() ? sema.error().describe() : "");

    EmitOptions options;
    options.target = Target::Shell;
    options.normalizePaths = normalizePaths;
    ScriptEmitter emitter(program, sema.result(), options);
    auto script = emitter.emit();
    EXPECT_TRUE(script.has_value()) << (emitter.hasError() ? emitter.error().describe() : "");
    return script.value_or("");
}

} // namespace

TEST(RosellaEmitShell, EmptyProgramIsJustTheShebang)
{
    EXPECT_EQ(emitShell(""), "#!/bin/sh\n\n");
}

TEST(RosellaEmitShell, WorkedExample)
{
    const char *source = "fn add(x, y) { print(\"Result: \", x + y); }\n"
                         "add(1, 2);\n"
                         "add(3, 4);\n"
                         "add(5, 6);\n"
                         "let int x = 0;\n"
                         "while int(x < 100) {\n"
                         "    print(\"Current value of x: \", x);\n"
                         "    let int x = x + 1;\n"
                         "}\n";
    EXPECT_EQ(emitShell(source),
              "#!/bin/sh\n"
              "\n"
              "fn_add() {\n"
              "    local x=\"$1\"\n"
              "    local y=\"$2\"\n"
              "    printf '%s\\n' \"Result: $((x + y))\"\n"
              "}\n"
              "\n"
              "fn_add 1 2\n"
              "fn_add 3 4\n"
              "fn_add 5 6\n"
              "x_1=0\n"
              "while [ \"${x_1}\" -lt 100 ]; do\n"
              "    printf '%s\\n' \"Current value of x: ${x_1}\"\n"
              "    x_1=$((x_1 + 1))\n"
              "done\n");
}

TEST(RosellaEmitShell, ConcatenationBecomesOneWord)
{
    EXPECT_EQ(emitShell("let name = \"World\";\nprint(\"Hello, \", name, \"!\");"),
              "#!/bin/sh\n"
              "\n"
              "name=\"World\"\n"
              "printf '%s\\n' \"Hello, ${name}!\"\n");
}

TEST(RosellaEmitShell, SpecialCharactersAreEscaped)
{
    EXPECT_EQ(emitShell("print(\"cost: $5 \\\"q\\\" `x`\");"),
              "#!/bin/sh\n"
              "\n"
              "printf '%s\\n' \"cost: \\$5 \\\"q\\\" \\`x\\`\"\n");
}

TEST(RosellaEmitShell, ArithmeticKeepsPrecedence)
{
    EXPECT_EQ(emitShell("let int a = 2;\n"
                        "let int b = (a + 3) * 4 - a / 2;\n"
                        "let int c = a - (b - 1);\n"
                        "let int d = -a;\n"),
              "#!/bin/sh\n"
              "\n"
              "a=2\n"
              "b=$(((a + 3) * 4 - a / 2))\n"
              "c=$((a - (b - 1)))\n"
              "d=$((-a))\n");
}

TEST(RosellaEmitShell, UntypedReadInIntegerContext)
{
    EXPECT_EQ(emitShell("let s = \"5\";\nlet int n = s * 2;\nif int(s) { print(n); }"),
              "#!/bin/sh\n"
              "\n"
              "s=\"5\"\n"
              "n=$((s * 2))\n"
              "if [ \"$((s))\" -ne 0 ]; then\n"
              "    printf '%s\\n' \"${n}\"\n"
              "fi\n");
}

TEST(RosellaEmitShell, ElseIfChainUsesElif)
{
    EXPECT_EQ(emitShell("let int n = 3;\n"
                        "if int(n < 0) { print(\"neg\"); }\n"
                        "else if int(n == 0) { print(\"zero\"); }\n"
                        "else { print(\"pos\"); }\n"),
              "#!/bin/sh\n"
              "\n"
              "n=3\n"
              "if [ \"${n}\" -lt 0 ]; then\n"
              "    printf '%s\\n' \"neg\"\n"
              "elif [ \"${n}\" -eq 0 ]; then\n"
              "    printf '%s\\n' \"zero\"\n"
              "else\n"
              "    printf '%s\\n' \"pos\"\n"
              "fi\n");
}

TEST(RosellaEmitShell, StringConditions)
{
    EXPECT_EQ(emitShell("let s = \"a\";\n"
                        "if str(s == \"a\") { }\n"
                        "if str(s != \"b\") { }\n"
                        "while str(s) { s = \"\"; }\n"),
              "#!/bin/sh\n"
              "\n"
              "s=\"a\"\n"
              "if [ \"${s}\" = \"a\" ]; then\n"
              "    :\n"
              "fi\n"
              "if [ \"${s}\" != \"b\" ]; then\n"
              "    :\n"
              "fi\n"
              "while [ -n \"${s}\" ]; do\n"
              "    s=\"\"\n"
              "done\n");
}

TEST(RosellaEmitShell, WithBlocksSelectByTarget)
{
    EXPECT_EQ(emitShell("with shell { print(\"sh\"); }\nwith batch { print(\"bat\"); }"),
              "#!/bin/sh\n"
              "\n"
              "printf '%s\\n' \"sh\"\n");
}

TEST(RosellaEmitShell, RawLinesAreVerbatim)
{
    EXPECT_EQ(emitShell("while int(0) { |> \"echo \\\"raw\\\" $HOME\", \"ls\"; }"),
              "#!/bin/sh\n"
              "\n"
              "while [ 0 -ne 0 ]; do\n"
              "echo \"raw\" $HOME\n"
              "ls\n"
              "done\n");
}

TEST(RosellaEmitShell, FunctionLocalsAndGlobalWrites)
{
    EXPECT_EQ(emitShell("let int count = 0;\n"
                        "fn bump(by) { let int step = by; count = count + step; }\n"
                        "bump(\"2\");\n"
                        "print(count);\n"),
              "#!/bin/sh\n"
              "\n"
              "fn_bump() {\n"
              "    local by=\"$1\"\n"
              "    local step=$((by))\n"
              "    count=$((count + step))\n"
              "}\n"
              "\n"
              "count=0\n"
              "fn_bump \"2\"\n"
              "printf '%s\\n' \"${count}\"\n");
}

TEST(RosellaEmitShell, EmptyFunctionGetsNoOp)
{
    EXPECT_EQ(emitShell("fn noop() { }\nnoop();"),
              "#!/bin/sh\n"
              "\n"
              "fn_noop() {\n"
              "    :\n"
              "}\n"
              "\n"
              "fn_noop\n");
}

TEST(RosellaEmitShell, IntegerArguments)
{
    EXPECT_EQ(emitShell("fn f(int a) { }\nlet int v = 1;\nf(v + 1);\nf(v);\nf(7);\nf(-v);"),
              "#!/bin/sh\n"
              "\n"
              "fn_f() {\n"
              "    local a=\"$1\"\n"
              "}\n"
              "\n"
              "v=1\n"
              "fn_f \"$((v + 1))\"\n"
              "fn_f \"${v}\"\n"
              "fn_f 7\n"
              "fn_f \"$((-v))\"\n");
}

TEST(RosellaEmitShell, TenthParameterIsBraced)
{
    std::string script = emitShell("fn many(a, b, c, d, e, f, g, h, i, j) { }");
    EXPECT_NE(script.find("    local i=\"$9\"\n"), std::string::npos);
    EXPECT_NE(script.find("    local j=\"${10}\"\n"), std::string::npos);
}

TEST(RosellaEmitShell, PathSeparatorsNormalized)
{
    EXPECT_EQ(emitShell("print(\"C:\\dir\\file\");"),
              "#!/bin/sh\n"
              "\n"
              "printf '%s\\n' \"C:/dir/file\"\n");
    EXPECT_EQ(emitShell("print(\"C:\\dir\\file\");", false),
              "#!/bin/sh\n"
              "\n"
              "printf '%s\\n' \"C:\\\\dir\\\\file\"\n");
}

TEST(RosellaEmitShell, EmptyPrintEmitsNewline)
{
    EXPECT_EQ(emitShell("print();"), "#!/bin/sh\n\nprintf '\\n'\n");
}

TEST(RosellaEmitShell, NestedFunctionCallsAndBlocks)
{
    EXPECT_EQ(emitShell("fn inner(msg) { print(msg); }\n"
                        "fn outer() { { let m = \"hi\"; inner(m); } }\n"
                        "outer();\n"),
              "#!/bin/sh\n"
              "\n"
              "fn_inner() {\n"
              "    local msg=\"$1\"\n"
              "    printf '%s\\n' \"${msg}\"\n"
              "}\n"
              "\n"
              "fn_outer() {\n"
              "    local m=\"hi\"\n"
              "    fn_inner \"${m}\"\n"
              "}\n"
              "\n"
              "fn_outer\n");
}
