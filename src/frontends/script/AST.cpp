//===----------------------------------------------------------------------===//
//
// Part of the Rosella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#include "frontends/script/AST.hpp"

namespace rosella::frontends::script
{

const char *binaryOpSpelling(BinaryOp op)
{
    switch (op)
    {
        case BinaryOp::Add:
            return "+";
        case BinaryOp::Sub:
            return "-";
        case BinaryOp::Mul:
            return "*";
        case BinaryOp::Div:
            return "/";
        case BinaryOp::Lt:
            return "<";
        case BinaryOp::Gt:
            return ">";
        case BinaryOp::Le:
            return "<=";
        case BinaryOp::Ge:
            return ">=";
        case BinaryOp::Eq:
            return "==";
        case BinaryOp::Ne:
            return "!=";
    }
    return "?";
}

bool isComparison(BinaryOp op)
{
    switch (op)
    {
        case BinaryOp::Lt:
        case BinaryOp::Gt:
        case BinaryOp::Le:
        case BinaryOp::Ge:
        case BinaryOp::Eq:
        case BinaryOp::Ne:
            return true;
        default:
            return false;
    }
}

int binaryPrecedence(BinaryOp op)
{
    switch (op)
    {
        case BinaryOp::Eq:
        case BinaryOp::Ne:
            return 1;
        case BinaryOp::Lt:
        case BinaryOp::Gt:
        case BinaryOp::Le:
        case BinaryOp::Ge:
            return 2;
        case BinaryOp::Add:
        case BinaryOp::Sub:
            return 3;
        case BinaryOp::Mul:
        case BinaryOp::Div:
            return 4;
    }
    return 0;
}

const char *typeTagName(TypeTag tag)
{
    return tag == TypeTag::Int ? "int" : "str";
}

} // namespace rosella::frontends::script
