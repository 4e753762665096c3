//===----------------------------------------------------------------------===//
//
// Part of the Rosella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the diagnostic-oriented Expected helpers used by the source
// loader, the command-line parser and the compiler driver. Every tool prints
// diagnostics through printDiag so the wording stays uniform.
//
//===----------------------------------------------------------------------===//

#include "diag_expected.hpp"

namespace rosella::support
{
Expected<void>::Expected(Diag diag) : error_(std::move(diag))
{
}

/// @brief Success is indicated by the absence of a stored diagnostic.
bool Expected<void>::hasValue() const
{
    return !error_.has_value();
}

Expected<void>::operator bool() const
{
    return hasValue();
}

/// @brief Access the stored diagnostic; only valid when hasValue() is false.
const Diag &Expected<void>::error() const &
{
    return *error_;
}

namespace detail
{
const char *diagSeverityToString(Severity severity)
{
    switch (severity)
    {
        case Severity::Note:
            return "note";
        case Severity::Warning:
            return "warning";
        case Severity::Error:
            return "error";
    }
    return "";
}
} // namespace detail

Diag makeError(SourceLoc loc, std::string msg, std::string code)
{
    return Diag{Severity::Error, std::move(msg), loc, std::move(code)};
}

/// @brief Print a diagnostic followed by a newline.
///
/// When a path is known it prefixes the message together with the line and
/// column. Buffers compiled without a registered path still get the
/// `line:col:` prefix so the position is never lost.
void printDiag(const Diag &diag, std::ostream &os, const SourceManager *sm)
{
    bool wrotePrefix = false;
    if (sm && diag.loc.file_id != 0)
    {
        auto path = sm->getPath(diag.loc.file_id);
        if (!path.empty())
        {
            os << path;
            wrotePrefix = true;
        }
    }
    if (diag.loc.hasLine())
    {
        if (wrotePrefix)
            os << ':';
        os << diag.loc.line;
        if (diag.loc.hasColumn())
            os << ':' << diag.loc.column;
        wrotePrefix = true;
    }
    if (wrotePrefix)
        os << ": ";

    os << detail::diagSeverityToString(diag.severity);
    if (!diag.code.empty())
        os << '[' << diag.code << ']';
    os << ": " << diag.message << '\n';
}
} // namespace rosella::support
