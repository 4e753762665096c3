//===----------------------------------------------------------------------===//
//
// Part of the Rosella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Sema_Stmt.cpp
/// @brief Statement analysis for Sema.
///
//===----------------------------------------------------------------------===//

#include "frontends/script/DiagnosticCodes.hpp"
#include "frontends/script/Sema.hpp"

namespace rosella::frontends::script
{

void Sema::analyzeStmt(StmtId id)
{
    if (hasError())
        return;

    const Stmt &stmt = program_.stmt(id);
    switch (stmt.kind())
    {
        case StmtKind::Block:
            analyzeBlock(id);
            break;
        case StmtKind::FunctionDecl:
            analyzeFunctionDecl(id);
            break;
        case StmtKind::VarDecl:
            analyzeVarDecl(id);
            break;
        case StmtKind::Assign:
            analyzeAssign(id);
            break;
        case StmtKind::Expr:
        {
            ExprId expr = stmt.as<ExprStmt>().expr;
            if (program_.expr(expr).kind() == ExprKind::Call)
                analyzeCall(expr);
            else
                analyzeExpr(expr, ExprContext::Value);
            break;
        }
        case StmtKind::Print:
            for (ExprId arg : stmt.as<PrintStmt>().args)
            {
                analyzeExpr(arg, ExprContext::Value);
                if (hasError())
                    return;
            }
            break;
        case StmtKind::While:
            analyzeWhile(id);
            break;
        case StmtKind::If:
            analyzeIf(id);
            break;
        case StmtKind::With:
            analyzeWith(id);
            break;
        case StmtKind::Raw:
            break;
    }
}

void Sema::analyzeBlock(StmtId id)
{
    common::ScopeTracker::ScopedScope scope(scopes_);
    analyzeBlockContents(id);
}

void Sema::analyzeBlockContents(StmtId id)
{
    for (StmtId child : program_.stmt(id).as<BlockStmt>().stmts)
    {
        analyzeStmt(child);
        if (hasError())
            return;
    }
}

/// @brief Analyze a function body in a fresh frame holding its parameters.
///
/// The body sees the globals declared before the function and its own
/// parameters. Bindings made inside are owned by the function.
void Sema::analyzeFunctionDecl(StmtId id)
{
    const Stmt &stmt = program_.stmt(id);
    const auto &decl = stmt.as<FunctionDecl>();
    const FunctionId fnId = result_.stmts[id].function;

    currentFunction_ = fnId;
    {
        common::ScopeTracker::ScopedScope scope(scopes_);

        unsigned index = 0;
        for (const auto &param : decl.params)
        {
            ++index;
            if (!checkReservedName(param.name, param.loc))
                break;
            if (scopes_.isDeclaredInCurrentScope(param.name))
            {
                error(ErrorKind::Name,
                      param.loc,
                      "duplicate parameter '" + param.name + "' in function '" + decl.name + "'",
                      diag::DuplicateParameter,
                      param.name);
                break;
            }
            SymbolId sym = declareVar(param.name, paramTypes_[fnId][index - 1], param.loc, index);
            result_.functions[fnId].params.push_back(sym);
        }

        if (!hasError())
            analyzeBlockContents(decl.body);
    }
    currentFunction_ = kInvalidId;
}

void Sema::analyzeVarDecl(StmtId id)
{
    const Stmt &stmt = program_.stmt(id);
    const auto &decl = stmt.as<VarDeclStmt>();

    // The initializer sees the bindings in effect before this declaration,
    // so `let int x = x + 1;` reads the outer x.
    analyzeExpr(decl.init, decl.type == TypeTag::Int ? ExprContext::Integer : ExprContext::Value);
    if (hasError())
        return;

    if (!checkReservedName(decl.name, stmt.loc))
        return;

    // Directly in a loop body, redeclaring a name from outside the loop
    // updates that variable for the next iteration's condition.
    if (!loopBodies_.empty() && scopes_.depth() == loopBodies_.back())
    {
        auto outer = scopes_.resolve(decl.name);
        if (outer && storageDepth_[*outer] < loopBodies_.back())
        {
            result_.stmts[id].symbol = rebindVar(*outer, decl.type, stmt.loc);
            return;
        }
    }

    result_.stmts[id].symbol = declareVar(decl.name, decl.type, stmt.loc, 0);
}

void Sema::analyzeAssign(StmtId id)
{
    const Stmt &stmt = program_.stmt(id);
    const auto &assign = stmt.as<AssignStmt>();

    auto sym = scopes_.resolve(assign.name);
    if (!sym)
    {
        error(ErrorKind::Name,
              stmt.loc,
              "assignment to undeclared variable '" + assign.name + "'",
              diag::UndeclaredIdentifier,
              assign.name);
        return;
    }

    const VarSymbol &target = result_.vars[*sym];
    analyzeExpr(assign.value,
                target.type == TypeTag::Int ? ExprContext::Integer : ExprContext::Value);
    if (hasError())
        return;

    if (target.isParam)
        promotable_[target.owner][target.paramIndex - 1] = false;

    if (currentFunction_ != kInvalidId && target.isGlobal())
        directWrites_[currentFunction_].push_back(target.rebinds != kInvalidId ? target.rebinds
                                                                               : *sym);

    result_.stmts[id].symbol = *sym;
}

/// @brief Type a condition according to its marker.
///
/// A comparison may only appear as the root. `int(...)` compares both sides
/// as integers. `str(...)` compares strings and only supports equality.
/// A bare expression tests for non-zero (int) or non-empty (str).
void Sema::analyzeCondition(const Condition &cond)
{
    const Expr &root = program_.expr(cond.expr);
    if (root.kind() == ExprKind::Binary && isComparison(root.as<BinaryExpr>().op))
    {
        const auto &cmp = root.as<BinaryExpr>();
        if (cond.marker == ConditionKind::Str && cmp.op != BinaryOp::Eq && cmp.op != BinaryOp::Ne)
        {
            error(ErrorKind::Type,
                  root.loc,
                  std::string("operator '") + binaryOpSpelling(cmp.op) +
                      "' is not supported in a str(...) condition; use '==' or '!='",
                  diag::OrderedStringComparison);
            return;
        }

        const ExprContext ctx =
            cond.marker == ConditionKind::Int ? ExprContext::Integer : ExprContext::Value;
        analyzeExpr(cmp.lhs, ctx);
        if (hasError())
            return;
        analyzeExpr(cmp.rhs, ctx);
        result_.exprs[cond.expr].type = TypeTag::Int;
        return;
    }

    analyzeExpr(cond.expr,
                cond.marker == ConditionKind::Int ? ExprContext::Integer : ExprContext::Value);
}

void Sema::analyzeWhile(StmtId id)
{
    const auto &loop = program_.stmt(id).as<WhileStmt>();
    analyzeCondition(loop.cond);
    if (hasError())
        return;

    common::ScopeTracker::ScopedScope scope(scopes_);
    loopBodies_.push_back(scopes_.depth());
    analyzeBlockContents(loop.body);
    loopBodies_.pop_back();
}

void Sema::analyzeIf(StmtId id)
{
    const auto &branch = program_.stmt(id).as<IfStmt>();
    analyzeCondition(branch.cond);
    if (hasError())
        return;
    analyzeBlock(branch.thenBody);
    if (hasError() || branch.elseBody == kInvalidId)
        return;

    // `else if` chains recurse through analyzeStmt; plain else is a block.
    analyzeStmt(branch.elseBody);
}

/// @brief Resolve the dialect of a `with` block and check its body.
///
/// The body is checked for every target, so a program that compiles for
/// one dialect compiles for both.
void Sema::analyzeWith(StmtId id)
{
    const Stmt &stmt = program_.stmt(id);
    const auto &with = stmt.as<WithStmt>();

    auto target = parseTargetName(with.target);
    if (!target)
    {
        error(ErrorKind::Name,
              stmt.loc,
              "unknown target '" + with.target + "'; expected 'shell' or 'batch'",
              diag::UnknownTarget,
              with.target);
        return;
    }
    result_.stmts[id].target = *target;
    analyzeBlock(with.body);
}

} // namespace rosella::frontends::script
