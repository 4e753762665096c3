//===----------------------------------------------------------------------===//
//
// Part of the Rosella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AST.hpp
/// @brief Arena-allocated AST for Rosella scripts.
///
/// @details All nodes of one compilation live in two vectors owned by
/// Program and refer to their children by index. The parser appends nodes
/// while building the tree. After parsing, nothing mutates the Program. The
/// semantic pass records its results in a side table indexed by the same
/// ids (see Sema.hpp).
///
/// @invariant Child ids always refer to nodes created before their parent,
///            except kInvalidId for an absent optional child.
/// @invariant The variant alternative order matches the ExprKind/StmtKind
///            enumerator order so kind() is a plain index conversion.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <cstdint>
#include <limits>
#include <string>
#include <variant>
#include <vector>

namespace rosella::frontends::script
{

using SourceLoc = support::SourceLoc;

/// @brief Index of an expression node in Program::exprs.
using ExprId = uint32_t;

/// @brief Index of a statement node in Program::stmts.
using StmtId = uint32_t;

/// @brief Marker for an absent child.
inline constexpr uint32_t kInvalidId = std::numeric_limits<uint32_t>::max();

/// @brief Declared type of a binding.
enum class TypeTag
{
    Untyped, ///< String-like; the default for `let` and `str`.
    Int,     ///< Declared with `int`.
};

/// @brief Boolean-context marker introducing a condition.
enum class ConditionKind
{
    Int, ///< `int(...)`: numeric comparison or non-zero test.
    Str, ///< `str(...)`: string equality or non-empty test.
};

enum class BinaryOp
{
    Add,
    Sub,
    Mul,
    Div,
    Lt,
    Gt,
    Le,
    Ge,
    Eq,
    Ne,
};

enum class UnaryOp
{
    Neg,
};

/// @brief Source spelling of @p op ("+", "<=", ...).
const char *binaryOpSpelling(BinaryOp op);

/// @brief True for `< > <= >= == !=`.
bool isComparison(BinaryOp op);

/// @brief Binding strength; higher binds tighter (equality 1 ... multiplicative 4).
int binaryPrecedence(BinaryOp op);

/// @brief Spelling of a type tag as written in source ("int" or "str").
const char *typeTagName(TypeTag tag);

//===----------------------------------------------------------------------===//
/// @name Expression Nodes
/// @{
//===----------------------------------------------------------------------===//

enum class ExprKind
{
    IntLiteral,
    StringLiteral,
    Ident,
    Unary,
    Binary,
    Call,
};

struct IntLiteralExpr
{
    int64_t value = 0;
};

/// @brief String literal; @ref raw is the body with escapes undecoded.
struct StringLiteralExpr
{
    std::string raw;
};

struct IdentExpr
{
    std::string name;
};

struct UnaryExpr
{
    UnaryOp op = UnaryOp::Neg;
    ExprId operand = kInvalidId;
};

struct BinaryExpr
{
    BinaryOp op = BinaryOp::Add;
    ExprId lhs = kInvalidId;
    ExprId rhs = kInvalidId;
};

/// @brief Call of a user function by name.
struct CallExpr
{
    std::string callee;
    std::vector<ExprId> args;
};

struct Expr
{
    SourceLoc loc{};
    std::variant<IntLiteralExpr, StringLiteralExpr, IdentExpr, UnaryExpr, BinaryExpr, CallExpr>
        node;

    ExprKind kind() const
    {
        return static_cast<ExprKind>(node.index());
    }

    template <typename T> const T &as() const
    {
        return std::get<T>(node);
    }
};

/// @}

//===----------------------------------------------------------------------===//
/// @name Statement Nodes
/// @{
//===----------------------------------------------------------------------===//

enum class StmtKind
{
    Block,
    FunctionDecl,
    VarDecl,
    Assign,
    Expr,
    Print,
    While,
    If,
    With,
    Raw,
};

/// @brief `{ ... }`; introduces a lexical scope.
struct BlockStmt
{
    std::vector<StmtId> stmts;
};

struct Param
{
    std::string name;
    TypeTag type = TypeTag::Untyped;
    SourceLoc loc{};
};

/// @brief `fn name(params) { body }`; only legal at top level.
struct FunctionDecl
{
    std::string name;
    std::vector<Param> params;
    StmtId body = kInvalidId; ///< Always a BlockStmt.
};

/// @brief `let [int|str] name = init;`
struct VarDeclStmt
{
    TypeTag type = TypeTag::Untyped;
    std::string name;
    ExprId init = kInvalidId;
};

/// @brief `name = value;`
struct AssignStmt
{
    std::string name;
    ExprId value = kInvalidId;
};

/// @brief Expression evaluated for effect; the parser only produces calls.
struct ExprStmt
{
    ExprId expr = kInvalidId;
};

/// @brief `print(a, b, ...);` writes the concatenation of its arguments and a newline.
struct PrintStmt
{
    std::vector<ExprId> args;
};

/// @brief Expression wrapped in a boolean-context marker.
struct Condition
{
    ConditionKind marker = ConditionKind::Int;
    ExprId expr = kInvalidId;
};

struct WhileStmt
{
    Condition cond;
    StmtId body = kInvalidId;
};

/// @brief `if cond { } else { }`; elseBody is a BlockStmt, an IfStmt, or absent.
struct IfStmt
{
    Condition cond;
    StmtId thenBody = kInvalidId;
    StmtId elseBody = kInvalidId;
};

/// @brief `with <target> { }`; the body is emitted only for the named dialect.
struct WithStmt
{
    std::string target;
    StmtId body = kInvalidId;
};

/// @brief `|> "line", ...;` lines copied verbatim into the output.
struct RawStmt
{
    std::vector<std::string> lines; ///< Raw literal bodies.
};

struct Stmt
{
    SourceLoc loc{};
    std::variant<BlockStmt,
                 FunctionDecl,
                 VarDeclStmt,
                 AssignStmt,
                 ExprStmt,
                 PrintStmt,
                 WhileStmt,
                 IfStmt,
                 WithStmt,
                 RawStmt>
        node;

    StmtKind kind() const
    {
        return static_cast<StmtKind>(node.index());
    }

    template <typename T> const T &as() const
    {
        return std::get<T>(node);
    }
};

/// @}

/// @brief Root of one compilation unit; owns every node.
struct Program
{
    std::vector<Expr> exprs;
    std::vector<Stmt> stmts;
    std::vector<StmtId> topLevel; ///< Source order.

    template <typename T> ExprId addExpr(SourceLoc loc, T node)
    {
        exprs.push_back(Expr{loc, std::move(node)});
        return static_cast<ExprId>(exprs.size() - 1);
    }

    template <typename T> StmtId addStmt(SourceLoc loc, T node)
    {
        stmts.push_back(Stmt{loc, std::move(node)});
        return static_cast<StmtId>(stmts.size() - 1);
    }

    const Expr &expr(ExprId id) const
    {
        return exprs[id];
    }

    const Stmt &stmt(StmtId id) const
    {
        return stmts[id];
    }
};

} // namespace rosella::frontends::script
