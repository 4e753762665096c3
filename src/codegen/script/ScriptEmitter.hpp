//===----------------------------------------------------------------------===//
//
// Part of the Rosella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/script/ScriptEmitter.hpp
// Purpose: Render a checked Program as a POSIX sh or Windows batch script.
// Key invariants: The AST walk is shared; the target is consulted only at the
//                 points where the dialects diverge (stores, arithmetic,
//                 conditions, control flow, functions, print, quoting).
//                 Output is a deterministic function of the input.
// Ownership/Lifetime: Borrows the Program and SemaResult for the duration of
//                     emit(); owns only its output buffers.
// Links: Emitter.cpp (traversal), Emitter_Shell.cpp, Emitter_Batch.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/common/NameMangler.hpp"
#include "frontends/script/AST.hpp"
#include "frontends/script/CompileError.hpp"
#include "frontends/script/Options.hpp"
#include "frontends/script/Sema.hpp"

#include <optional>
#include <string>
#include <vector>

namespace rosella::codegen::script
{

using frontends::script::BinaryOp;
using frontends::script::CompileError;
using frontends::script::ExprId;
using frontends::script::Program;
using frontends::script::SemaResult;
using frontends::script::StmtId;
using frontends::script::Target;

/// @brief Emission settings derived from CompilerOptions.
struct EmitOptions
{
    Target target{Target::Shell};
    bool normalizePaths{true};
    /// Only consulted for Batch.
    bool batchCrlf{true};
};

/// @brief Single back end for both dialects.
class ScriptEmitter
{
  public:
    ScriptEmitter(const Program &program, const SemaResult &sema, EmitOptions options);

    /// @brief Emit the whole script.
    /// @return The script text, or std::nullopt after a CodegenError.
    std::optional<std::string> emit();

    bool hasError() const
    {
        return error_.has_value();
    }

    const CompileError &error() const
    {
        return *error_;
    }

  private:
    /// @brief One piece of a concatenated value.
    struct ValuePart
    {
        enum class Kind
        {
            Text,  ///< Decoded literal text.
            Var,   ///< Storage name of a binding, read as a string.
            Arith, ///< Integer expression rendered with arithText().
        };

        Kind kind;
        std::string text;
    };

    using Parts = std::vector<ValuePart>;

    /// @name Shared traversal (Emitter.cpp)
    /// @{
    void emitTopLevel();
    void emitStmt(StmtId id);
    void emitBlock(StmtId id);
    void emitWith(StmtId id);
    void emitRaw(StmtId id);
    /// @brief Emit a statement list; returns the number of lines produced.
    size_t emitBody(StmtId block);

    void collectParts(ExprId id, Parts &parts);
    Parts valueParts(ExprId id);
    std::string arithText(ExprId id);
    std::string literalText(const std::string &raw) const;
    bool isIntLiteral(ExprId id) const;

    void line(const std::string &text);
    void rawLine(const std::string &text);
    void fail(ExprId id, std::string message);
    void failAt(frontends::script::SourceLoc loc, std::string message);
    /// @}

    /// @name Shell (Emitter_Shell.cpp)
    /// @{
    void shellFunction(StmtId id);
    void shellVarDecl(StmtId id);
    void shellAssign(StmtId id);
    void shellStore(frontends::script::SymbolId symbol, ExprId value, bool declare);
    void shellPrint(StmtId id);
    void shellCall(ExprId id);
    void shellWhile(StmtId id);
    void shellIf(StmtId id, bool isElif);
    std::string shellCondition(const frontends::script::Condition &cond);
    std::string shellNumeric(ExprId id);
    std::string shellQuoted(const Parts &parts) const;
    /// @}

    /// @name Batch (Emitter_Batch.cpp)
    /// @{
    void batchFunction(StmtId id);
    void batchVarDecl(StmtId id);
    void batchAssign(StmtId id);
    void batchStore(const std::string &storage, frontends::script::TypeTag type, ExprId value);
    void batchPrint(StmtId id);
    void batchCall(ExprId id);
    void batchWhile(StmtId id);
    void batchIf(StmtId id);
    /// @brief Emit `if <negated cond> goto :<label>`, preceded by any temps.
    void batchBranchUnless(const frontends::script::Condition &cond, const std::string &label);
    std::string batchNumeric(ExprId id);
    std::string batchStrOperand(ExprId id);
    std::string batchText(const Parts &parts);
    std::string batchEscape(const std::string &text);
    static bool batchSafeText(const std::string &text);
    std::string batchHeader() const;
    /// @}

    const Program &program_;
    const SemaResult &sema_;
    EmitOptions options_;
    std::optional<CompileError> error_;

    /// Buffer the next line is appended to (main_ or functions_).
    std::string *out_ = nullptr;
    std::string main_;
    std::string functions_;
    unsigned indent_ = 0;
    size_t lineCount_ = 0;

    /// Temporaries and control-flow labels.
    frontends::common::NameMangler names_;

    /// Batch helper variables referenced by the body.
    bool usesCaret_ = false;
    bool usesQuote_ = false;
};

} // namespace rosella::codegen::script
