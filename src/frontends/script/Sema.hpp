//===----------------------------------------------------------------------===//
//
// Part of the Rosella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Sema.hpp
/// @brief Scope and type checker for Rosella programs.
///
/// @details Sema walks the AST once, in source order, after a pre-pass
/// that registers every function. That pre-pass makes calls legal before
/// the callee's declaration.
///
/// ## Scopes
///
/// A ScopeTracker frame is pushed for every block, function body and
/// while/if/with body. `let` binds into the innermost frame and shadows any
/// earlier binding of the same name, including one in that same frame.
/// Variables must be declared textually before use.
///
/// A `let` placed directly in a while body that redeclares a binding made
/// outside the loop still creates a new binding, but that binding shares
/// the outer storage. The loop condition then observes the write:
///
/// ```
/// let int x = 0;
/// while int(x < 3) { let int x = x + 1; }   // writes the outer x
/// ```
///
/// ## Storage names
///
/// Every binding receives a unique target-level name. The first binding
/// of a name keeps it. Later bindings, and names that collide
/// case-insensitively with an earlier storage name or with an environment
/// variable the target shells own, receive a `_N` suffix.
///
/// ## Types
///
/// Expressions are typed Int or Untyped. In an integer context (a `let
/// int` initializer, an assignment to an Int binding, an argument for an
/// `int` parameter, the inside of `int(...)`) all arithmetic is integer and
/// untyped identifiers are coerced. Elsewhere `+` with an untyped operand
/// concatenates and the other operators demand Int operands.
///
/// An untyped parameter is promoted to Int when its function is called at
/// least once, every call passes an Int argument and the body never
/// assigns the parameter. Promotion can make
/// further arguments Int, so the walk is repeated until nothing changes.
///
/// Results are stored in SemaResult, a side table indexed by the AST ids;
/// the Program itself is never modified.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/common/NameMangler.hpp"
#include "frontends/common/ScopeTracker.hpp"
#include "frontends/script/AST.hpp"
#include "frontends/script/CompileError.hpp"
#include "frontends/script/Options.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace rosella::frontends::script
{

using SymbolId = uint32_t;
using FunctionId = uint32_t;

/// @brief One variable binding (a `let` or a parameter).
struct VarSymbol
{
    std::string name;    ///< Source name.
    std::string storage; ///< Unique name used in the generated script.
    TypeTag type = TypeTag::Untyped;
    SourceLoc loc{};
    FunctionId owner = kInvalidId; ///< Enclosing function; kInvalidId for globals.
    bool isParam = false;
    unsigned paramIndex = 0; ///< 1-based position when isParam.

    /// Binding whose storage a loop-body redeclaration writes; kInvalidId
    /// for a binding with storage of its own.
    SymbolId rebinds = kInvalidId;

    bool isGlobal() const
    {
        return owner == kInvalidId;
    }
};

/// @brief One user function.
struct FunctionSymbol
{
    std::string name;
    std::string label; ///< Target-level name, `fn_<name>` made unique.
    StmtId decl = kInvalidId;
    std::vector<SymbolId> params;

    /// Global bindings assigned by this function or anything it calls,
    /// sorted by SymbolId.
    std::vector<SymbolId> escapingWrites;

    /// Functions called directly from the body, sorted, without duplicates.
    std::vector<FunctionId> callees;
};

/// @brief Per-expression annotations.
struct ExprInfo
{
    TypeTag type = TypeTag::Untyped;
    SymbolId symbol = kInvalidId;   ///< Resolved binding for IdentExpr.
    FunctionId callee = kInvalidId; ///< Resolved function for CallExpr.
    bool coerced = false;           ///< Untyped binding read in integer context.
};

/// @brief Per-statement annotations.
struct StmtInfo
{
    SymbolId symbol = kInvalidId;     ///< Binding created (VarDecl) or written (Assign).
    FunctionId function = kInvalidId; ///< Function declared by a FunctionDecl.
    std::optional<Target> target;     ///< Dialect named by a WithStmt.
};

/// @brief Everything the emitter needs beyond the Program itself.
struct SemaResult
{
    std::vector<VarSymbol> vars;
    std::vector<FunctionSymbol> functions; ///< Declaration order.
    std::vector<ExprInfo> exprs;           ///< Indexed by ExprId.
    std::vector<StmtInfo> stmts;           ///< Indexed by StmtId.

    const VarSymbol &var(SymbolId id) const
    {
        return vars[id];
    }

    const FunctionSymbol &function(FunctionId id) const
    {
        return functions[id];
    }

    const ExprInfo &expr(ExprId id) const
    {
        return exprs[id];
    }

    const StmtInfo &stmt(StmtId id) const
    {
        return stmts[id];
    }
};

/// @brief Semantic analyzer; one instance per Program.
class Sema
{
  public:
    explicit Sema(const Program &program);

    /// @brief Run the analysis.
    /// @return True when the program is well formed.
    bool analyze();

    bool hasError() const
    {
        return error_.has_value();
    }

    /// @brief The first NameError or TypeError; requires hasError().
    const CompileError &error() const
    {
        return *error_;
    }

    const SemaResult &result() const
    {
        return result_;
    }

    /// @brief Environment names no binding may use as storage.
    static const std::vector<std::string_view> &reservedStorageNames();

  private:
    /// Whether arithmetic is integer-only or may concatenate.
    enum class ExprContext
    {
        Integer,
        Value,
    };

    /// @name Declarations
    /// @{
    void resetState();
    void registerFunctions();
    bool promoteIntParams();
    SymbolId declareVar(const std::string &name, TypeTag type, SourceLoc loc, unsigned paramIndex);
    SymbolId rebindVar(SymbolId outer, TypeTag type, SourceLoc loc);
    bool checkReservedName(const std::string &name, SourceLoc loc);
    void computeEscapingWrites();
    /// @}

    /// @name Statements
    /// @{
    void analyzeStmt(StmtId id);
    void analyzeBlock(StmtId id);
    void analyzeBlockContents(StmtId id);
    void analyzeFunctionDecl(StmtId id);
    void analyzeVarDecl(StmtId id);
    void analyzeAssign(StmtId id);
    void analyzeWhile(StmtId id);
    void analyzeIf(StmtId id);
    void analyzeWith(StmtId id);
    void analyzeCondition(const Condition &cond);
    /// @}

    /// @name Expressions
    /// @{
    TypeTag analyzeExpr(ExprId id, ExprContext ctx);
    TypeTag analyzeIdent(ExprId id, ExprContext ctx);
    TypeTag analyzeBinary(ExprId id, ExprContext ctx);
    void analyzeCall(ExprId id);
    /// @}

    /// @brief Record the first error; later calls are ignored.
    void error(ErrorKind kind, SourceLoc loc, std::string message, std::string_view code,
               std::string subject = {});

    const Program &program_;
    SemaResult result_;
    std::optional<CompileError> error_;

    common::ScopeTracker scopes_;
    common::NameMangler storageNames_;
    common::NameMangler labels_;
    std::unordered_map<std::string, FunctionId> functionIndex_;
    FunctionId currentFunction_ = kInvalidId;

    /// Globals assigned directly inside each function, indexed by FunctionId.
    std::vector<std::vector<SymbolId>> directWrites_;

    /// Parameter types by FunctionId: declared, or Int once promoted.
    /// Survives resetState().
    std::vector<std::vector<TypeTag>> paramTypes_;

    /// Per FunctionId and parameter: every call so far passed an Int
    /// argument and the body never assigns the parameter.
    std::vector<std::vector<bool>> promotable_;
    std::vector<bool> called_;

    /// Frame depth owning each binding's storage, indexed by SymbolId.
    std::vector<size_t> storageDepth_;

    /// Frame depth of every enclosing while body, innermost last.
    std::vector<size_t> loopBodies_;
};

} // namespace rosella::frontends::script
