//===----------------------------------------------------------------------===//
//
// Part of the Rosella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Parser_Expr.cpp
/// @brief Expression parsing for the Rosella parser.
///
/// @details Binary expressions use precedence climbing:
/// parseExpression() → parseEquality() → parseRelational() →
/// parseAdditive() → parseMultiplicative() → parseUnary() → parsePrimary().
/// Each level loops to handle left-associative operators at that level.
/// Binary nodes carry the location of their operator token.
///
//===----------------------------------------------------------------------===//

#include "frontends/script/DiagnosticCodes.hpp"
#include "frontends/script/Parser.hpp"

#include <algorithm>
#include <string>

namespace rosella::frontends::script
{

ExprId Parser::parseExpression()
{
    return parseEquality();
}

ExprId Parser::parseEquality()
{
    ExprId left = parseRelational();
    if (left == kInvalidId)
        return kInvalidId;

    while (check(TokenKind::EqualEqual) || check(TokenKind::NotEqual))
    {
        Token opTok = advance();
        BinaryOp op = opTok.is(TokenKind::EqualEqual) ? BinaryOp::Eq : BinaryOp::Ne;

        ExprId right = parseRelational();
        if (right == kInvalidId)
            return kInvalidId;

        left = makeBinary(opTok, op, left, right);
        if (left == kInvalidId)
            return kInvalidId;
    }

    return left;
}

ExprId Parser::parseRelational()
{
    ExprId left = parseAdditive();
    if (left == kInvalidId)
        return kInvalidId;

    while (true)
    {
        BinaryOp op;
        if (check(TokenKind::Less))
            op = BinaryOp::Lt;
        else if (check(TokenKind::Greater))
            op = BinaryOp::Gt;
        else if (check(TokenKind::LessEqual))
            op = BinaryOp::Le;
        else if (check(TokenKind::GreaterEqual))
            op = BinaryOp::Ge;
        else
            break;

        Token opTok = advance();
        ExprId right = parseAdditive();
        if (right == kInvalidId)
            return kInvalidId;

        left = makeBinary(opTok, op, left, right);
        if (left == kInvalidId)
            return kInvalidId;
    }

    return left;
}

ExprId Parser::parseAdditive()
{
    ExprId left = parseMultiplicative();
    if (left == kInvalidId)
        return kInvalidId;

    while (check(TokenKind::Plus) || check(TokenKind::Minus))
    {
        Token opTok = advance();
        BinaryOp op = opTok.is(TokenKind::Plus) ? BinaryOp::Add : BinaryOp::Sub;

        ExprId right = parseMultiplicative();
        if (right == kInvalidId)
            return kInvalidId;

        left = makeBinary(opTok, op, left, right);
        if (left == kInvalidId)
            return kInvalidId;
    }

    return left;
}

ExprId Parser::parseMultiplicative()
{
    ExprId left = parseUnary();
    if (left == kInvalidId)
        return kInvalidId;

    while (check(TokenKind::Star) || check(TokenKind::Slash))
    {
        Token opTok = advance();
        BinaryOp op = opTok.is(TokenKind::Star) ? BinaryOp::Mul : BinaryOp::Div;

        ExprId right = parseUnary();
        if (right == kInvalidId)
            return kInvalidId;

        left = makeBinary(opTok, op, left, right);
        if (left == kInvalidId)
            return kInvalidId;
    }

    return left;
}

ExprId Parser::parseUnary()
{
    if (check(TokenKind::Minus))
    {
        Token opTok = advance();
        if (++depth_ > kMaxNestingDepth)
        {
            errorAt(opTok, "expression nested too deeply", diag::NestingTooDeep);
            --depth_;
            return kInvalidId;
        }
        ExprId operand = parseUnary();
        --depth_;
        if (operand == kInvalidId)
            return kInvalidId;
        return makeUnary(opTok, operand);
    }

    return parsePrimary();
}

ExprId Parser::parsePrimary()
{
    const Token &tok = peek();

    switch (tok.kind)
    {
        case TokenKind::IntegerLiteral:
        {
            Token lit = advance();
            return program_.addExpr(lit.loc, IntLiteralExpr{lit.intValue});
        }

        case TokenKind::StringLiteral:
        {
            Token lit = advance();
            return program_.addExpr(lit.loc, StringLiteralExpr{lit.stringValue});
        }

        case TokenKind::Identifier:
        {
            Token nameTok = advance();
            if (check(TokenKind::LParen))
            {
                CallExpr call;
                call.callee = nameTok.text;
                if (!parseCallArgs(call.args))
                    return kInvalidId;
                unsigned height = 1;
                for (ExprId arg : call.args)
                    height = std::max(height, heightOf(arg));
                if (!trackHeight(nameTok, height + 1))
                    return kInvalidId;
                return program_.addExpr(nameTok.loc, std::move(call));
            }
            return program_.addExpr(nameTok.loc, IdentExpr{nameTok.text});
        }

        case TokenKind::LParen:
        {
            Token open = advance();
            if (++depth_ > kMaxNestingDepth)
            {
                errorAt(open, "expression nested too deeply", diag::NestingTooDeep);
                --depth_;
                return kInvalidId;
            }
            ExprId inner = parseExpression();
            --depth_;
            if (inner == kInvalidId)
                return kInvalidId;
            if (!expect(TokenKind::RParen, "')'"))
                return kInvalidId;
            return inner;
        }

        default:
            errorExpected("expression", diag::ExpectedExpression);
            return kInvalidId;
    }
}

bool Parser::parseCallArgs(std::vector<ExprId> &args)
{
    Token open;
    if (!expect(TokenKind::LParen, "'('", &open))
        return false;

    if (++depth_ > kMaxNestingDepth)
    {
        errorAt(open, "call arguments nested too deeply", diag::NestingTooDeep);
        --depth_;
        return false;
    }

    if (!check(TokenKind::RParen))
    {
        do
        {
            ExprId arg = parseExpression();
            if (arg == kInvalidId)
            {
                --depth_;
                return false;
            }
            args.push_back(arg);
        } while (match(TokenKind::Comma));
    }
    --depth_;

    return expect(TokenKind::RParen, "')'");
}

ExprId Parser::makeBinary(const Token &opTok, BinaryOp op, ExprId lhs, ExprId rhs)
{
    if (!trackHeight(opTok, std::max(heightOf(lhs), heightOf(rhs)) + 1))
        return kInvalidId;
    return program_.addExpr(opTok.loc, BinaryExpr{op, lhs, rhs});
}

ExprId Parser::makeUnary(const Token &opTok, ExprId operand)
{
    if (!trackHeight(opTok, heightOf(operand) + 1))
        return kInvalidId;
    return program_.addExpr(opTok.loc, UnaryExpr{UnaryOp::Neg, operand});
}

unsigned Parser::heightOf(ExprId id) const
{
    if (id < exprHeights_.size() && exprHeights_[id] != 0)
        return exprHeights_[id];
    return 1;
}

/// The node about to be added receives the next ExprId, so the height is
/// stored under program_.exprs.size().
bool Parser::trackHeight(const Token &opTok, unsigned height)
{
    if (height > kMaxExpressionHeight)
    {
        errorAt(opTok,
                "expression has more than " + std::to_string(kMaxExpressionHeight) +
                    " levels of operators",
                diag::NestingTooDeep);
        return false;
    }
    const size_t next = program_.exprs.size();
    if (exprHeights_.size() <= next)
        exprHeights_.resize(next + 1, 0);
    exprHeights_[next] = height;
    return true;
}

} // namespace rosella::frontends::script
