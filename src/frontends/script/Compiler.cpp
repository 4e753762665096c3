//===----------------------------------------------------------------------===//
//
// Part of the Rosella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Compiler.cpp
/// @brief Implementation of the Rosella compiler driver.
///
/// @details compile() runs the phases in order and returns as soon as one of
/// them records an error. The token and AST dumps are written to stderr
/// before the next phase runs, so they are available even when a later
/// phase fails.
///
/// @see Compiler.hpp for the public API
///
//===----------------------------------------------------------------------===//

#include "frontends/script/Compiler.hpp"
#include "codegen/script/ScriptEmitter.hpp"
#include "frontends/script/AstPrinter.hpp"
#include "frontends/script/Lexer.hpp"
#include "frontends/script/Parser.hpp"
#include "frontends/script/Sema.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>

namespace rosella::frontends::script
{

namespace
{

/// @brief Print every token to stderr, one per line.
void dumpTokenStream(const std::vector<Token> &tokens)
{
    std::cerr << "=== Rosella Token Stream ===\n";
    for (const Token &tok : tokens)
    {
        std::cerr << tok.loc.line << ':' << tok.loc.column << '\t'
                  << tokenKindToString(tok.kind);
        if (!tok.text.empty())
            std::cerr << "\t\"" << tok.text << '"';
        if (tok.kind == TokenKind::IntegerLiteral)
            std::cerr << "\tvalue=" << tok.intValue;
        std::cerr << '\n';
    }
    std::cerr << "=== End Token Stream ===\n";
}

/// @brief Phase timer printing `[rosella] <phase>: <ms>` when enabled.
class PhaseTimer
{
  public:
    PhaseTimer() : enabled_(std::getenv("ROSELLA_DEBUG_COMPILE") != nullptr) {}

    void start()
    {
        begin_ = std::chrono::steady_clock::now();
    }

    void stop(const char *phase)
    {
        if (!enabled_)
            return;
        const auto elapsed = std::chrono::steady_clock::now() - begin_;
        const double ms = std::chrono::duration<double, std::milli>(elapsed).count();
        std::cerr << "[rosella] " << phase << ": " << ms << "ms" << std::endl;
    }

  private:
    bool enabled_;
    std::chrono::steady_clock::time_point begin_{};
};

void fail(CompilerResult &result, const CompileError &error)
{
    result.error = error;
    result.diagnostics.report(error.toDiagnostic());
}

} // namespace

bool CompilerResult::succeeded() const
{
    return diagnostics.errorCount() == 0;
}

CompilerResult compile(const CompilerInput &input,
                       const CompilerOptions &options,
                       support::SourceManager &sm)
{
    CompilerResult result{};

    // Register source file if not already registered
    if (input.fileId.has_value())
        result.fileId = *input.fileId;
    else
        result.fileId = sm.addFile(std::string(input.path));

    PhaseTimer timer;

    // Phase 1: Lexing
    timer.start();
    Lexer lexer(std::string(input.source), result.fileId);
    std::vector<Token> tokens = lexer.tokenize();
    timer.stop("lex");
    if (options.dumpTokens)
        dumpTokenStream(tokens);
    if (lexer.hasError())
    {
        fail(result, lexer.error());
        return result;
    }

    // Phase 2: Parsing
    timer.start();
    Parser parser(std::move(tokens));
    Program program = parser.parseProgram();
    timer.stop("parse");
    if (parser.hasError())
    {
        fail(result, parser.error());
        return result;
    }
    if (options.dumpAst)
    {
        AstPrinter printer;
        std::cerr << "=== AST after parsing ===\n"
                  << printer.dump(program) << "=== End AST ===\n";
    }

    // Phase 3: Semantic Analysis
    timer.start();
    Sema sema(program);
    const bool semanticOk = sema.analyze();
    timer.stop("sema");
    if (!semanticOk)
    {
        fail(result, sema.error());
        return result;
    }

    // Phase 4: Emission
    timer.start();
    codegen::script::EmitOptions emitOptions;
    emitOptions.target = options.target;
    emitOptions.normalizePaths = options.normalizePaths;
    emitOptions.batchCrlf = options.batchCrlf;
    codegen::script::ScriptEmitter emitter(program, sema.result(), emitOptions);
    std::optional<std::string> script = emitter.emit();
    timer.stop("emit");
    if (!script)
    {
        fail(result, emitter.error());
        return result;
    }

    result.script = std::move(*script);
    return result;
}

CompilerResult compile(std::string_view source, Target target)
{
    support::SourceManager sm;
    CompilerOptions options;
    options.target = target;
    CompilerInput input;
    input.source = source;
    return compile(input, options, sm);
}

} // namespace rosella::frontends::script
