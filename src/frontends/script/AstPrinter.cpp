//===----------------------------------------------------------------------===//
//
// Part of the Rosella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AstPrinter.cpp
/// @brief Implementation of the indented AST dump used by --dump-ast and the
///        parser tests.
///
//===----------------------------------------------------------------------===//

#include "frontends/script/AstPrinter.hpp"

#include <sstream>

namespace rosella::frontends::script
{

namespace
{

struct Printer
{
    const Program &program;
    std::ostream &os;
    bool showLocations;
    int indent = 0;

    /// @brief Write @p text on a new line at the current indentation.
    void line(const std::string &text, SourceLoc loc)
    {
        for (int i = 0; i < indent; ++i)
            os << "  ";
        os << text;
        if (showLocations && loc.hasLine())
            os << " (" << loc.line << ":" << loc.column << ")";
        os << '\n';
    }

    void line(const std::string &text)
    {
        line(text, SourceLoc{});
    }

    void push()
    {
        ++indent;
    }

    void pop()
    {
        --indent;
    }

    static std::string quoted(const std::string &s)
    {
        return "\"" + s + "\"";
    }

    static std::string typed(TypeTag type, const std::string &name)
    {
        return type == TypeTag::Int ? "int " + quoted(name) : quoted(name);
    }

    void printExpr(ExprId id)
    {
        const Expr &e = program.expr(id);
        switch (e.kind())
        {
            case ExprKind::IntLiteral:
                line("IntLiteral " + std::to_string(e.as<IntLiteralExpr>().value), e.loc);
                return;
            case ExprKind::StringLiteral:
                line("StringLiteral " + quoted(e.as<StringLiteralExpr>().raw), e.loc);
                return;
            case ExprKind::Ident:
                line("IdentExpr " + quoted(e.as<IdentExpr>().name), e.loc);
                return;
            case ExprKind::Unary:
                line("UnaryExpr (-)", e.loc);
                push();
                printExpr(e.as<UnaryExpr>().operand);
                pop();
                return;
            case ExprKind::Binary:
            {
                const auto &bin = e.as<BinaryExpr>();
                line(std::string("BinaryExpr (") + binaryOpSpelling(bin.op) + ")", e.loc);
                push();
                printExpr(bin.lhs);
                printExpr(bin.rhs);
                pop();
                return;
            }
            case ExprKind::Call:
            {
                const auto &call = e.as<CallExpr>();
                line("CallExpr " + quoted(call.callee), e.loc);
                push();
                for (ExprId arg : call.args)
                    printExpr(arg);
                pop();
                return;
            }
        }
    }

    void printCondition(const char *label, const Condition &cond, SourceLoc loc)
    {
        line(std::string(label) + (cond.marker == ConditionKind::Int ? " int" : " str"), loc);
    }

    void printStmt(StmtId id)
    {
        const Stmt &s = program.stmt(id);
        switch (s.kind())
        {
            case StmtKind::Block:
                line("Block", s.loc);
                push();
                for (StmtId child : s.as<BlockStmt>().stmts)
                    printStmt(child);
                pop();
                return;
            case StmtKind::FunctionDecl:
            {
                const auto &fn = s.as<FunctionDecl>();
                line("FunctionDecl " + quoted(fn.name), s.loc);
                push();
                for (const auto &param : fn.params)
                    line("Param " + typed(param.type, param.name), param.loc);
                printStmt(fn.body);
                pop();
                return;
            }
            case StmtKind::VarDecl:
            {
                const auto &decl = s.as<VarDeclStmt>();
                line("VarDecl " + typed(decl.type, decl.name), s.loc);
                push();
                printExpr(decl.init);
                pop();
                return;
            }
            case StmtKind::Assign:
            {
                const auto &assign = s.as<AssignStmt>();
                line("AssignStmt " + quoted(assign.name), s.loc);
                push();
                printExpr(assign.value);
                pop();
                return;
            }
            case StmtKind::Expr:
                line("ExprStmt", s.loc);
                push();
                printExpr(s.as<ExprStmt>().expr);
                pop();
                return;
            case StmtKind::Print:
                line("PrintStmt", s.loc);
                push();
                for (ExprId arg : s.as<PrintStmt>().args)
                    printExpr(arg);
                pop();
                return;
            case StmtKind::While:
            {
                const auto &loop = s.as<WhileStmt>();
                printCondition("WhileStmt", loop.cond, s.loc);
                push();
                printExpr(loop.cond.expr);
                printStmt(loop.body);
                pop();
                return;
            }
            case StmtKind::If:
            {
                const auto &branch = s.as<IfStmt>();
                printCondition("IfStmt", branch.cond, s.loc);
                push();
                printExpr(branch.cond.expr);
                printStmt(branch.thenBody);
                if (branch.elseBody != kInvalidId)
                {
                    line("Else:");
                    push();
                    printStmt(branch.elseBody);
                    pop();
                }
                pop();
                return;
            }
            case StmtKind::With:
            {
                const auto &with = s.as<WithStmt>();
                line("WithStmt " + quoted(with.target), s.loc);
                push();
                printStmt(with.body);
                pop();
                return;
            }
            case StmtKind::Raw:
                line("RawStmt", s.loc);
                push();
                for (const auto &text : s.as<RawStmt>().lines)
                    line("Line " + quoted(text));
                pop();
                return;
        }
    }
};

} // namespace

std::string AstPrinter::dump(const Program &program) const
{
    std::ostringstream os;
    Printer p{program, os, showLocations_};
    p.line("Program");
    p.push();
    for (StmtId id : program.topLevel)
        p.printStmt(id);
    p.pop();
    return os.str();
}

} // namespace rosella::frontends::script
