//===----------------------------------------------------------------------===//
//
// Part of the Rosella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/script/Emitter_Batch.cpp
// Purpose: Windows batch rendering for ScriptEmitter.
// Key invariants: The script runs under `setlocal EnableDelayedExpansion`;
//                 variables are read as `!name!` so their values are never
//                 reparsed. Control flow uses labels and `goto` only, so no
//                 parenthesized block ever needs escaping.
//
// Functions are labelled subroutines entered with `call :label`. Arguments
// travel in `__arg_N` variables. Each body runs inside its own `setlocal`
// and carries its escaping writes out through `endlocal & set "g=%g%"`,
// which expands before the scope is dropped.
//
//===----------------------------------------------------------------------===//

#include "codegen/script/ScriptEmitter.hpp"

namespace rosella::codegen::script
{

using namespace frontends::script;

namespace
{

const char *batchCompareOperator(BinaryOp op)
{
    switch (op)
    {
        case BinaryOp::Lt:
            return "LSS";
        case BinaryOp::Gt:
            return "GTR";
        case BinaryOp::Le:
            return "LEQ";
        case BinaryOp::Ge:
            return "GEQ";
        case BinaryOp::Eq:
            return "EQU";
        case BinaryOp::Ne:
            return "NEQ";
        default:
            return "";
    }
}

std::string argName(size_t index)
{
    return "__arg_" + std::to_string(index);
}

std::string labelSuffix(const std::string &label)
{
    return label.substr(label.rfind('_'));
}

} // namespace

std::string ScriptEmitter::batchHeader() const
{
    std::string header = "@echo off\n"
                         "setlocal EnableExtensions EnableDelayedExpansion\n";
    if (usesCaret_)
        header += "set \"__caret=^\"\n";
    if (usesQuote_)
        header += "set \"__quote=\"\"\n";
    return header;
}

void ScriptEmitter::batchFunction(StmtId id)
{
    const auto &decl = program_.stmt(id).as<FunctionDecl>();
    const FunctionSymbol &fn = sema_.function(sema_.stmt(id).function);

    line("");
    line(":" + fn.label);
    line("setlocal");
    for (SymbolId param : fn.params)
    {
        const VarSymbol &var = sema_.var(param);
        line("set \"" + var.storage + "=!" + argName(var.paramIndex) + "!\"");
    }
    emitBody(decl.body);

    std::string exit = "endlocal";
    for (SymbolId global : fn.escapingWrites)
    {
        const std::string &name = sema_.var(global).storage;
        exit += " & set \"" + name + "=%" + name + "%\"";
    }
    line(exit);
    line("goto :eof");
}

void ScriptEmitter::batchVarDecl(StmtId id)
{
    const VarSymbol &var = sema_.var(sema_.stmt(id).symbol);
    batchStore(var.storage, var.type, program_.stmt(id).as<VarDeclStmt>().init);
}

void ScriptEmitter::batchAssign(StmtId id)
{
    const VarSymbol &var = sema_.var(sema_.stmt(id).symbol);
    batchStore(var.storage, var.type, program_.stmt(id).as<AssignStmt>().value);
}

void ScriptEmitter::batchStore(const std::string &storage, TypeTag type, ExprId value)
{
    if (type == TypeTag::Int)
    {
        std::string arith = arithText(value);
        if (!hasError())
            line("set /a \"" + storage + "=" + arith + "\"");
        return;
    }

    std::string text = batchText(valueParts(value));
    if (!hasError())
        line("set \"" + storage + "=" + text + "\"");
}

/// Literal text free of characters cmd.exe treats specially is echoed in
/// place; anything else is assembled in `__out` first.
void ScriptEmitter::batchPrint(StmtId id)
{
    const auto &print = program_.stmt(id).as<PrintStmt>();

    Parts parts;
    for (ExprId arg : print.args)
        collectParts(arg, parts);
    if (hasError())
        return;

    bool direct = true;
    for (const ValuePart &part : parts)
    {
        if (part.kind == ValuePart::Kind::Text && !batchSafeText(part.text))
            direct = false;
    }

    std::string text = batchText(parts);
    if (hasError())
        return;
    if (direct)
    {
        line("echo(" + text);
        return;
    }
    line("set \"__out=" + text + "\"");
    line("echo(!__out!");
}

void ScriptEmitter::batchCall(ExprId id)
{
    const auto &call = program_.expr(id).as<CallExpr>();
    const FunctionSymbol &fn = sema_.function(sema_.expr(id).callee);

    for (size_t i = 0; i < call.args.size(); ++i)
    {
        const std::string name = argName(i + 1);
        if (sema_.var(fn.params[i]).type == TypeTag::Int)
        {
            std::string arith = arithText(call.args[i]);
            if (hasError())
                return;
            line("set /a \"" + name + "=" + arith + "\"");
            continue;
        }
        std::string text = batchText(valueParts(call.args[i]));
        if (hasError())
            return;
        line("set \"" + name + "=" + text + "\"");
    }
    line("call :" + fn.label);
}

void ScriptEmitter::batchWhile(StmtId id)
{
    const auto &loop = program_.stmt(id).as<WhileStmt>();
    const std::string head = names_.block("while");
    const std::string end = "endwhile" + labelSuffix(head);

    line(":" + head);
    batchBranchUnless(loop.cond, end);
    if (hasError())
        return;
    emitBody(loop.body);
    line("goto :" + head);
    line(":" + end);
}

void ScriptEmitter::batchIf(StmtId id)
{
    const auto &branch = program_.stmt(id).as<IfStmt>();
    const std::string suffix = labelSuffix(names_.block("if"));
    const std::string elseLabel = "else" + suffix;
    const std::string endLabel = "endif" + suffix;

    if (branch.elseBody == kInvalidId)
    {
        batchBranchUnless(branch.cond, endLabel);
        if (hasError())
            return;
        emitBody(branch.thenBody);
        line(":" + endLabel);
        return;
    }

    batchBranchUnless(branch.cond, elseLabel);
    if (hasError())
        return;
    emitBody(branch.thenBody);
    line("goto :" + endLabel);
    line(":" + elseLabel);
    if (program_.stmt(branch.elseBody).kind() == StmtKind::If)
        batchIf(branch.elseBody);
    else
        emitBody(branch.elseBody);
    line(":" + endLabel);
}

void ScriptEmitter::batchBranchUnless(const Condition &cond, const std::string &label)
{
    const Expr &root = program_.expr(cond.expr);
    const bool isInt = cond.marker == ConditionKind::Int;
    const std::string jump = " goto :" + label;

    if (root.kind() == ExprKind::Binary && isComparison(root.as<BinaryExpr>().op))
    {
        const auto &cmp = root.as<BinaryExpr>();
        if (isInt)
        {
            std::string lhs = batchNumeric(cmp.lhs);
            std::string rhs = batchNumeric(cmp.rhs);
            if (hasError())
                return;
            line("if not " + lhs + " " + batchCompareOperator(cmp.op) + " " + rhs + jump);
            return;
        }

        std::string lhs = batchStrOperand(cmp.lhs);
        std::string rhs = batchStrOperand(cmp.rhs);
        if (hasError())
            return;
        const char *prefix = cmp.op == BinaryOp::Eq ? "if not " : "if ";
        line(prefix + lhs + "==" + rhs + jump);
        return;
    }

    if (isInt)
    {
        std::string value = batchNumeric(cond.expr);
        if (!hasError())
            line("if " + value + " EQU 0" + jump);
        return;
    }
    std::string value = batchStrOperand(cond.expr);
    if (!hasError())
        line("if " + value + "==\"\"" + jump);
}

/// Operand of a numeric `if`: a literal, an Int variable, or a temporary
/// computed with `set /a` just before the test.
std::string ScriptEmitter::batchNumeric(ExprId id)
{
    const Expr &expr = program_.expr(id);
    const ExprInfo &info = sema_.expr(id);

    if (expr.kind() == ExprKind::IntLiteral)
        return arithText(id);
    if (expr.kind() == ExprKind::Ident && !info.coerced)
        return "!" + sema_.var(info.symbol).storage + "!";

    std::string arith = arithText(id);
    if (hasError())
        return {};
    const std::string temp = names_.nextTemp();
    line("set /a \"" + temp + "=" + arith + "\"");
    return "!" + temp + "!";
}

/// Quoted operand of a string `if`.
std::string ScriptEmitter::batchStrOperand(ExprId id)
{
    Parts parts = valueParts(id);
    if (hasError())
        return {};

    if (parts.size() == 1 && parts[0].kind == ValuePart::Kind::Var)
        return "\"!" + parts[0].text + "!\"";
    if (parts.size() == 1 && parts[0].kind == ValuePart::Kind::Text &&
        batchSafeText(parts[0].text))
        return "\"" + parts[0].text + "\"";

    std::string text = batchText(parts);
    const std::string temp = names_.nextTemp();
    line("set \"" + temp + "=" + text + "\"");
    return "\"!" + temp + "!\"";
}

/// @brief Render parts for use inside `set "name=..."` or after `echo(`.
/// @details Integer parts are computed into temporaries first.
std::string ScriptEmitter::batchText(const Parts &parts)
{
    std::string out;
    for (const ValuePart &part : parts)
    {
        switch (part.kind)
        {
            case ValuePart::Kind::Text:
                out += batchEscape(part.text);
                break;
            case ValuePart::Kind::Var:
                out += "!" + part.text + "!";
                break;
            case ValuePart::Kind::Arith:
            {
                const std::string temp = names_.nextTemp();
                line("set /a \"" + temp + "=" + part.text + "\"");
                out += "!" + temp + "!";
                break;
            }
        }
    }
    return out;
}

/// Escape literal text for a line that is subject to both percent and
/// delayed expansion.
std::string ScriptEmitter::batchEscape(const std::string &text)
{
    std::string out;
    out.reserve(text.size());
    for (char c : text)
    {
        switch (c)
        {
            case '%':
                out += "%%";
                break;
            case '!':
                out += "^!";
                break;
            case '^':
                out += "!__caret!";
                usesCaret_ = true;
                break;
            case '"':
                out += "!__quote!";
                usesQuote_ = true;
                break;
            default:
                out.push_back(c);
                break;
        }
    }
    return out;
}

bool ScriptEmitter::batchSafeText(const std::string &text)
{
    return text.find_first_of("^&|<>%!\"()") == std::string::npos;
}

} // namespace rosella::codegen::script
