//===----------------------------------------------------------------------===//
//
// Part of the Rosella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Emitter.cpp
/// @brief Target-independent traversal for ScriptEmitter.
///
/// @details The walk visits top-level statements in source order. Function
/// declarations are rendered into a separate buffer so each dialect can
/// place them where its interpreter needs them: before the main statements
/// for shell, after a `goto :eof` for batch.
///
/// Values are flattened into a list of parts before rendering. A chain of
/// concatenating `+` becomes its leaves, each leaf being literal text, a
/// variable read, or an integer expression. The dialect helpers only decide
/// how to spell each kind of part.
///
//===----------------------------------------------------------------------===//

#include "codegen/script/PathNormalizer.hpp"
#include "codegen/script/ScriptEmitter.hpp"
#include "frontends/script/DiagnosticCodes.hpp"

namespace rosella::codegen::script
{

using namespace frontends::script;

ScriptEmitter::ScriptEmitter(const Program &program, const SemaResult &sema, EmitOptions options)
    : program_(program), sema_(sema), options_(options)
{
}

std::optional<std::string> ScriptEmitter::emit()
{
    main_.clear();
    functions_.clear();
    out_ = &main_;
    indent_ = 0;
    lineCount_ = 0;
    usesCaret_ = false;
    usesQuote_ = false;
    names_ = frontends::common::NameMangler{};
    error_.reset();

    emitTopLevel();
    if (hasError())
        return std::nullopt;

    std::string script;
    if (options_.target == Target::Shell)
    {
        script = "#!/bin/sh\n\n";
        script += functions_;
        script += main_;
        return script;
    }

    script = batchHeader();
    script += main_;
    if (!functions_.empty())
    {
        script += "goto :eof\n";
        script += functions_;
    }

    if (!options_.batchCrlf)
        return script;

    std::string crlf;
    crlf.reserve(script.size() + script.size() / 16);
    for (char c : script)
    {
        if (c == '\n')
            crlf.push_back('\r');
        crlf.push_back(c);
    }
    return crlf;
}

void ScriptEmitter::emitTopLevel()
{
    for (StmtId id : program_.topLevel)
    {
        if (hasError())
            return;

        if (program_.stmt(id).kind() != StmtKind::FunctionDecl)
        {
            emitStmt(id);
            continue;
        }

        out_ = &functions_;
        if (options_.target == Target::Shell)
            shellFunction(id);
        else
            batchFunction(id);
        out_ = &main_;
    }
}

void ScriptEmitter::emitStmt(StmtId id)
{
    if (hasError())
        return;

    names_.resetTemps();
    const Stmt &stmt = program_.stmt(id);
    const bool shell = options_.target == Target::Shell;

    switch (stmt.kind())
    {
        case StmtKind::Block:
            emitBlock(id);
            break;
        case StmtKind::FunctionDecl:
            failAt(stmt.loc, "function declaration outside the top level");
            break;
        case StmtKind::VarDecl:
            shell ? shellVarDecl(id) : batchVarDecl(id);
            break;
        case StmtKind::Assign:
            shell ? shellAssign(id) : batchAssign(id);
            break;
        case StmtKind::Expr:
        {
            ExprId expr = stmt.as<ExprStmt>().expr;
            if (program_.expr(expr).kind() != ExprKind::Call)
            {
                fail(expr, "expression statement has no effect in the generated script");
                break;
            }
            shell ? shellCall(expr) : batchCall(expr);
            break;
        }
        case StmtKind::Print:
            shell ? shellPrint(id) : batchPrint(id);
            break;
        case StmtKind::While:
            shell ? shellWhile(id) : batchWhile(id);
            break;
        case StmtKind::If:
            shell ? shellIf(id, false) : batchIf(id);
            break;
        case StmtKind::With:
            emitWith(id);
            break;
        case StmtKind::Raw:
            emitRaw(id);
            break;
    }
}

/// A nested block needs no grouping in either dialect; its bindings
/// already carry unique storage names.
void ScriptEmitter::emitBlock(StmtId id)
{
    for (StmtId child : program_.stmt(id).as<BlockStmt>().stmts)
    {
        emitStmt(child);
        if (hasError())
            return;
    }
}

size_t ScriptEmitter::emitBody(StmtId block)
{
    const size_t before = lineCount_;
    emitBlock(block);
    return lineCount_ - before;
}

void ScriptEmitter::emitWith(StmtId id)
{
    const auto &info = sema_.stmt(id);
    if (info.target && *info.target == options_.target)
        emitBlock(program_.stmt(id).as<WithStmt>().body);
}

void ScriptEmitter::emitRaw(StmtId id)
{
    for (const std::string &raw : program_.stmt(id).as<RawStmt>().lines)
        rawLine(decodeStringLiteral(raw));
}

//===----------------------------------------------------------------------===//
// Values
//===----------------------------------------------------------------------===//

void ScriptEmitter::collectParts(ExprId id, Parts &parts)
{
    const Expr &expr = program_.expr(id);
    const ExprInfo &info = sema_.expr(id);

    ValuePart part{ValuePart::Kind::Text, {}};
    switch (expr.kind())
    {
        case ExprKind::Binary:
            if (info.type == TypeTag::Untyped && expr.as<BinaryExpr>().op == BinaryOp::Add)
            {
                collectParts(expr.as<BinaryExpr>().lhs, parts);
                collectParts(expr.as<BinaryExpr>().rhs, parts);
                return;
            }
            part = {ValuePart::Kind::Arith, arithText(id)};
            break;
        case ExprKind::StringLiteral:
            part = {ValuePart::Kind::Text, literalText(expr.as<StringLiteralExpr>().raw)};
            break;
        case ExprKind::IntLiteral:
            part = {ValuePart::Kind::Text, std::to_string(expr.as<IntLiteralExpr>().value)};
            break;
        case ExprKind::Ident:
            if (info.coerced)
                part = {ValuePart::Kind::Arith, arithText(id)};
            else
                part = {ValuePart::Kind::Var, sema_.var(info.symbol).storage};
            break;
        case ExprKind::Unary:
            part = {ValuePart::Kind::Arith, arithText(id)};
            break;
        case ExprKind::Call:
            fail(id, "call to '" + expr.as<CallExpr>().callee + "' cannot produce a value");
            return;
    }

    if (part.kind == ValuePart::Kind::Text && !parts.empty() &&
        parts.back().kind == ValuePart::Kind::Text)
    {
        parts.back().text += part.text;
        return;
    }
    parts.push_back(std::move(part));
}

ScriptEmitter::Parts ScriptEmitter::valueParts(ExprId id)
{
    Parts parts;
    collectParts(id, parts);
    return parts;
}

/// @brief Render an integer expression with bare variable names.
///
/// Parentheses are added only where precedence requires them: around a
/// lower-precedence left operand, around a right operand of equal or lower
/// precedence, and around an operator used as the operand of unary minus.
std::string ScriptEmitter::arithText(ExprId id)
{
    const Expr &expr = program_.expr(id);

    switch (expr.kind())
    {
        case ExprKind::IntLiteral:
            return std::to_string(expr.as<IntLiteralExpr>().value);

        case ExprKind::Ident:
            return sema_.var(sema_.expr(id).symbol).storage;

        case ExprKind::Unary:
        {
            ExprId operand = expr.as<UnaryExpr>().operand;
            const ExprKind kind = program_.expr(operand).kind();
            std::string inner = arithText(operand);
            if (kind == ExprKind::Unary || kind == ExprKind::Binary)
                return "-(" + inner + ")";
            return "-" + inner;
        }

        case ExprKind::Binary:
        {
            const auto &bin = expr.as<BinaryExpr>();
            if (isComparison(bin.op) || sema_.expr(id).type != TypeTag::Int)
            {
                fail(id,
                     std::string("operator '") + binaryOpSpelling(bin.op) +
                         "' cannot be rendered as integer arithmetic");
                return {};
            }

            const int prec = binaryPrecedence(bin.op);
            auto operand = [&](ExprId child, bool right) {
                std::string text = arithText(child);
                const Expr &node = program_.expr(child);
                if (node.kind() != ExprKind::Binary)
                    return text;
                const int childPrec = binaryPrecedence(node.as<BinaryExpr>().op);
                if (childPrec < prec || (right && childPrec == prec))
                    return "(" + text + ")";
                return text;
            };

            std::string lhs = operand(bin.lhs, false);
            std::string rhs = operand(bin.rhs, true);
            return lhs + " " + binaryOpSpelling(bin.op) + " " + rhs;
        }

        case ExprKind::StringLiteral:
            fail(id, "string literal in integer arithmetic");
            return {};

        case ExprKind::Call:
            fail(id, "call to '" + expr.as<CallExpr>().callee + "' in integer arithmetic");
            return {};
    }
    return {};
}

std::string ScriptEmitter::literalText(const std::string &raw) const
{
    if (options_.normalizePaths)
        return normalizePathLiteral(raw, options_.target);
    return decodeStringLiteral(raw);
}

bool ScriptEmitter::isIntLiteral(ExprId id) const
{
    return program_.expr(id).kind() == ExprKind::IntLiteral;
}

//===----------------------------------------------------------------------===//
// Output
//===----------------------------------------------------------------------===//

void ScriptEmitter::line(const std::string &text)
{
    if (!text.empty())
        out_->append(indent_ * 4, ' ');
    out_->append(text);
    out_->push_back('\n');
    ++lineCount_;
}

void ScriptEmitter::rawLine(const std::string &text)
{
    out_->append(text);
    out_->push_back('\n');
    ++lineCount_;
}

void ScriptEmitter::fail(ExprId id, std::string message)
{
    failAt(program_.expr(id).loc, std::move(message));
}

void ScriptEmitter::failAt(SourceLoc loc, std::string message)
{
    if (error_)
        return;
    CompileError err;
    err.kind = ErrorKind::Codegen;
    err.loc = loc;
    err.message = std::move(message);
    err.code = diag::UnsupportedConstruct;
    error_ = std::move(err);
}

} // namespace rosella::codegen::script
