//===----------------------------------------------------------------------===//
//
// Part of the Rosella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/script/Emitter_Shell.cpp
// Purpose: POSIX sh rendering for ScriptEmitter.
// Key invariants: Only constructs accepted by a plain POSIX sh (dash) are
//                 produced, plus `local`, which every common /bin/sh
//                 implements. Every variable read is inside double quotes.
//
//===----------------------------------------------------------------------===//

#include "codegen/script/ScriptEmitter.hpp"

namespace rosella::codegen::script
{

using namespace frontends::script;

namespace
{

const char *shellTestOperator(BinaryOp op)
{
    switch (op)
    {
        case BinaryOp::Lt:
            return "-lt";
        case BinaryOp::Gt:
            return "-gt";
        case BinaryOp::Le:
            return "-le";
        case BinaryOp::Ge:
            return "-ge";
        case BinaryOp::Eq:
            return "-eq";
        case BinaryOp::Ne:
            return "-ne";
        default:
            return "";
    }
}

std::string positional(unsigned index)
{
    if (index > 9)
        return "${" + std::to_string(index) + "}";
    return "$" + std::to_string(index);
}

} // namespace

void ScriptEmitter::shellFunction(StmtId id)
{
    const auto &decl = program_.stmt(id).as<FunctionDecl>();
    const FunctionSymbol &fn = sema_.function(sema_.stmt(id).function);

    line(fn.label + "() {");
    ++indent_;
    for (SymbolId param : fn.params)
    {
        const VarSymbol &var = sema_.var(param);
        line("local " + var.storage + "=\"" + positional(var.paramIndex) + "\"");
    }
    if (emitBody(decl.body) == 0 && fn.params.empty())
        line(":");
    --indent_;
    line("}");
    line("");
}

void ScriptEmitter::shellVarDecl(StmtId id)
{
    shellStore(sema_.stmt(id).symbol, program_.stmt(id).as<VarDeclStmt>().init, true);
}

void ScriptEmitter::shellAssign(StmtId id)
{
    shellStore(sema_.stmt(id).symbol, program_.stmt(id).as<AssignStmt>().value, false);
}

void ScriptEmitter::shellStore(SymbolId symbol, ExprId value, bool declare)
{
    const VarSymbol &var = sema_.var(symbol);
    const bool ownStorage = declare && var.rebinds == kInvalidId;
    const std::string prefix = ownStorage && !var.isGlobal() ? "local " : "";

    std::string rhs;
    if (var.type == TypeTag::Int)
    {
        rhs = isIntLiteral(value) ? arithText(value) : "$((" + arithText(value) + "))";
    }
    else
    {
        rhs = shellQuoted(valueParts(value));
    }
    if (hasError())
        return;
    line(prefix + var.storage + "=" + rhs);
}

void ScriptEmitter::shellPrint(StmtId id)
{
    const auto &print = program_.stmt(id).as<PrintStmt>();
    if (print.args.empty())
    {
        line("printf '\\n'");
        return;
    }

    Parts parts;
    for (ExprId arg : print.args)
        collectParts(arg, parts);
    if (hasError())
        return;
    line("printf '%s\\n' " + shellQuoted(parts));
}

void ScriptEmitter::shellCall(ExprId id)
{
    const auto &call = program_.expr(id).as<CallExpr>();
    const FunctionSymbol &fn = sema_.function(sema_.expr(id).callee);

    std::string text = fn.label;
    for (size_t i = 0; i < call.args.size(); ++i)
    {
        const bool isInt = sema_.var(fn.params[i]).type == TypeTag::Int;
        text += " ";
        text += isInt ? shellNumeric(call.args[i]) : shellQuoted(valueParts(call.args[i]));
    }
    if (hasError())
        return;
    line(text);
}

void ScriptEmitter::shellWhile(StmtId id)
{
    const auto &loop = program_.stmt(id).as<WhileStmt>();
    std::string cond = shellCondition(loop.cond);
    if (hasError())
        return;

    line("while " + cond + "; do");
    ++indent_;
    if (emitBody(loop.body) == 0)
        line(":");
    --indent_;
    line("done");
}

/// @brief Emit an if statement; `else if` chains continue as `elif` and
/// only the outermost call closes with `fi`.
void ScriptEmitter::shellIf(StmtId id, bool isElif)
{
    const auto &branch = program_.stmt(id).as<IfStmt>();
    std::string cond = shellCondition(branch.cond);
    if (hasError())
        return;

    line((isElif ? "elif " : "if ") + cond + "; then");
    ++indent_;
    if (emitBody(branch.thenBody) == 0)
        line(":");
    --indent_;

    if (branch.elseBody != kInvalidId)
    {
        if (program_.stmt(branch.elseBody).kind() == StmtKind::If)
        {
            shellIf(branch.elseBody, true);
        }
        else
        {
            line("else");
            ++indent_;
            if (emitBody(branch.elseBody) == 0)
                line(":");
            --indent_;
        }
    }

    if (!isElif)
        line("fi");
}

std::string ScriptEmitter::shellCondition(const Condition &cond)
{
    const Expr &root = program_.expr(cond.expr);
    const bool isInt = cond.marker == ConditionKind::Int;

    if (root.kind() == ExprKind::Binary && isComparison(root.as<BinaryExpr>().op))
    {
        const auto &cmp = root.as<BinaryExpr>();
        if (isInt)
        {
            std::string lhs = shellNumeric(cmp.lhs);
            std::string rhs = shellNumeric(cmp.rhs);
            return "[ " + lhs + " " + shellTestOperator(cmp.op) + " " + rhs + " ]";
        }

        std::string lhs = shellQuoted(valueParts(cmp.lhs));
        std::string rhs = shellQuoted(valueParts(cmp.rhs));
        const char *op = cmp.op == BinaryOp::Eq ? " = " : " != ";
        return "[ " + lhs + op + rhs + " ]";
    }

    if (isInt)
        return "[ " + shellNumeric(cond.expr) + " -ne 0 ]";
    return "[ -n " + shellQuoted(valueParts(cond.expr)) + " ]";
}

/// Operand of a numeric `[` test: a literal, a quoted Int variable, or a
/// quoted arithmetic expansion.
std::string ScriptEmitter::shellNumeric(ExprId id)
{
    const Expr &expr = program_.expr(id);
    const ExprInfo &info = sema_.expr(id);

    if (expr.kind() == ExprKind::IntLiteral)
        return arithText(id);
    if (expr.kind() == ExprKind::Ident && !info.coerced)
        return "\"${" + sema_.var(info.symbol).storage + "}\"";
    return "\"$((" + arithText(id) + "))\"";
}

std::string ScriptEmitter::shellQuoted(const Parts &parts) const
{
    std::string out = "\"";
    for (const ValuePart &part : parts)
    {
        switch (part.kind)
        {
            case ValuePart::Kind::Text:
                for (char c : part.text)
                {
                    if (c == '\\' || c == '"' || c == '$' || c == '`')
                        out.push_back('\\');
                    out.push_back(c);
                }
                break;
            case ValuePart::Kind::Var:
                out += "${" + part.text + "}";
                break;
            case ValuePart::Kind::Arith:
                out += "$((" + part.text + "))";
                break;
        }
    }
    out.push_back('"');
    return out;
}

} // namespace rosella::codegen::script
