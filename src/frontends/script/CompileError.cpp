//===----------------------------------------------------------------------===//
//
// Part of the Rosella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#include "frontends/script/CompileError.hpp"

namespace rosella::frontends::script
{

const char *errorKindName(ErrorKind kind)
{
    switch (kind)
    {
        case ErrorKind::Lex:
            return "LexError";
        case ErrorKind::Syntax:
            return "SyntaxError";
        case ErrorKind::Name:
            return "NameError";
        case ErrorKind::Type:
            return "TypeError";
        case ErrorKind::Codegen:
            return "CodegenError";
    }
    return "Error";
}

std::string CompileError::describe() const
{
    std::string out = errorKindName(kind);
    out += ": ";
    out += message;
    return out;
}

support::Diagnostic CompileError::toDiagnostic() const
{
    return support::Diagnostic{support::Severity::Error, describe(), loc, std::string(code)};
}

} // namespace rosella::frontends::script
