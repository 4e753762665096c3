//===----------------------------------------------------------------------===//
//
// Part of the Rosella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Sema_Expr.cpp
/// @brief Expression typing and call resolution for Sema.
///
/// @details Typing rules by context:
///
/// | Expression | Integer context | Value context |
/// |------------|-----------------|---------------|
/// | integer literal | Int | Int |
/// | string literal | TypeError | Untyped |
/// | Int binding | Int | Int |
/// | Untyped binding | Int (coerced) | Untyped |
/// | `a + b` | Int | Int if both Int, else Untyped (concatenation) |
/// | `a - b`, `*`, `/`, unary `-` | Int | Int; TypeError on an Untyped operand |
/// | comparison | TypeError | TypeError |
/// | call | TypeError | TypeError |
///
/// Comparisons are typed by analyzeCondition, the only place they are legal.
///
//===----------------------------------------------------------------------===//

#include "frontends/script/DiagnosticCodes.hpp"
#include "frontends/script/Sema.hpp"

#include <algorithm>

namespace rosella::frontends::script
{

TypeTag Sema::analyzeExpr(ExprId id, ExprContext ctx)
{
    if (hasError())
        return TypeTag::Untyped;

    const Expr &expr = program_.expr(id);
    TypeTag type = TypeTag::Untyped;

    switch (expr.kind())
    {
        case ExprKind::IntLiteral:
            type = TypeTag::Int;
            break;

        case ExprKind::StringLiteral:
            if (ctx == ExprContext::Integer)
            {
                error(ErrorKind::Type,
                      expr.loc,
                      "string literal \"" + expr.as<StringLiteralExpr>().raw +
                          "\" used where an integer is required",
                      diag::StringInIntegerContext);
            }
            type = TypeTag::Untyped;
            break;

        case ExprKind::Ident:
            type = analyzeIdent(id, ctx);
            break;

        case ExprKind::Unary:
        {
            TypeTag operand = analyzeExpr(expr.as<UnaryExpr>().operand, ctx);
            if (hasError())
                break;
            if (ctx == ExprContext::Value && operand != TypeTag::Int)
            {
                error(ErrorKind::Type,
                      expr.loc,
                      "unary '-' requires an int operand; declare it with 'let int' or use it "
                      "inside int(...)",
                      diag::ArithmeticOnUntyped);
            }
            type = TypeTag::Int;
            break;
        }

        case ExprKind::Binary:
            type = analyzeBinary(id, ctx);
            break;

        case ExprKind::Call:
            analyzeCall(id);
            if (!hasError())
            {
                error(ErrorKind::Type,
                      expr.loc,
                      "call to '" + expr.as<CallExpr>().callee +
                          "' used as a value; functions do not return values",
                      diag::CallUsedAsValue,
                      expr.as<CallExpr>().callee);
            }
            break;
    }

    result_.exprs[id].type = type;
    return type;
}

TypeTag Sema::analyzeIdent(ExprId id, ExprContext ctx)
{
    const Expr &expr = program_.expr(id);
    const std::string &name = expr.as<IdentExpr>().name;

    auto sym = scopes_.resolve(name);
    if (!sym)
    {
        if (functionIndex_.contains(name))
        {
            error(ErrorKind::Type,
                  expr.loc,
                  "function '" + name + "' cannot be used as a value",
                  diag::FunctionUsedAsValue,
                  name);
        }
        else
        {
            error(ErrorKind::Name,
                  expr.loc,
                  "use of undeclared identifier '" + name + "'",
                  diag::UndeclaredIdentifier,
                  name);
        }
        return TypeTag::Untyped;
    }

    ExprInfo &info = result_.exprs[id];
    info.symbol = *sym;

    const TypeTag declared = result_.vars[*sym].type;
    if (ctx == ExprContext::Integer && declared == TypeTag::Untyped)
    {
        info.coerced = true;
        return TypeTag::Int;
    }
    return declared;
}

TypeTag Sema::analyzeBinary(ExprId id, ExprContext ctx)
{
    const Expr &expr = program_.expr(id);
    const auto &bin = expr.as<BinaryExpr>();

    if (isComparison(bin.op))
    {
        error(ErrorKind::Type,
              expr.loc,
              std::string("comparison '") + binaryOpSpelling(bin.op) +
                  "' is only allowed as the outermost operator of an int(...) or str(...) "
                  "condition",
              diag::ComparisonOutsideCondition);
        return TypeTag::Untyped;
    }

    const TypeTag lhs = analyzeExpr(bin.lhs, ctx);
    if (hasError())
        return TypeTag::Untyped;
    const TypeTag rhs = analyzeExpr(bin.rhs, ctx);
    if (hasError())
        return TypeTag::Untyped;

    if (ctx == ExprContext::Integer)
        return TypeTag::Int;

    if (lhs == TypeTag::Int && rhs == TypeTag::Int)
        return TypeTag::Int;

    if (bin.op == BinaryOp::Add)
        return TypeTag::Untyped; // concatenation

    error(ErrorKind::Type,
          expr.loc,
          std::string("operator '") + binaryOpSpelling(bin.op) +
              "' requires int operands; declare them with 'let int' or use int(...)",
          diag::ArithmeticOnUntyped);
    return TypeTag::Untyped;
}

/// @brief Resolve a call, check its arity and type its arguments.
///
/// Arguments for `int` parameters are integer contexts. Argument types feed
/// parameter promotion. Every call made inside a function body is recorded
/// as a call-graph edge.
void Sema::analyzeCall(ExprId id)
{
    const Expr &expr = program_.expr(id);
    const auto &call = expr.as<CallExpr>();

    auto it = functionIndex_.find(call.callee);
    if (it == functionIndex_.end())
    {
        error(ErrorKind::Name,
              expr.loc,
              "call to undeclared function '" + call.callee + "'",
              diag::UndeclaredFunction,
              call.callee);
        return;
    }

    const FunctionId fnId = it->second;
    const auto &decl = program_.stmt(result_.functions[fnId].decl).as<FunctionDecl>();
    if (call.args.size() != decl.params.size())
    {
        error(ErrorKind::Type,
              expr.loc,
              "function '" + call.callee + "' expects " + std::to_string(decl.params.size()) +
                  " argument(s), got " + std::to_string(call.args.size()),
              diag::WrongNumberOfArguments,
              call.callee);
        return;
    }

    for (size_t i = 0; i < call.args.size(); ++i)
    {
        const TypeTag arg = analyzeExpr(call.args[i],
                                        paramTypes_[fnId][i] == TypeTag::Int ? ExprContext::Integer
                                                                             : ExprContext::Value);
        if (hasError())
            return;
        if (arg != TypeTag::Int)
            promotable_[fnId][i] = false;
    }

    result_.exprs[id].callee = fnId;
    called_[fnId] = true;

    if (currentFunction_ != kInvalidId)
    {
        auto &callees = result_.functions[currentFunction_].callees;
        auto pos = std::lower_bound(callees.begin(), callees.end(), fnId);
        if (pos == callees.end() || *pos != fnId)
            callees.insert(pos, fnId);
    }
}

} // namespace rosella::frontends::script
