//===----------------------------------------------------------------------===//
//
// Part of the apicheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the diagnostic-oriented Expected helpers.  The loaders and
// scanners propagate recoverable failures as Expected values carrying a
// classified Diagnostic; this unit provides the constructors and the single
// printer so every failure reaches the user in one uniform shape.
//
//===----------------------------------------------------------------------===//

#include "diag_expected.hpp"

namespace apicheck::support
{
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

Diag makeError(SourceLoc loc, std::string msg)
{
    return Diag{Severity::Error, std::move(msg), loc, DiagCode::None, {}};
}

Diag makeError(DiagCode code, std::string path, std::string msg)
{
    return Diag{Severity::Error, std::move(msg), {}, code, std::move(path)};
}

/// @brief Print a diagnostic to the provided output stream.
///
/// @details The location prefix comes from the SourceManager when the
///          diagnostic carries a file id, otherwise from the raw artifact
///          path.  The code prefix keeps parse failures visibly distinct from
///          API violations, which never pass through this printer.
void printDiag(const Diag &diag, std::ostream &os, const SourceManager *sm)
{
    std::string_view path = diag.path;
    if (sm && diag.loc.file_id != 0)
        path = sm->getPath(diag.loc.file_id);

    if (!path.empty())
    {
        os << path;
        if (diag.loc.line != 0)
            os << ':' << diag.loc.line;
        os << ": ";
    }
    os << detail::diagSeverityToString(diag.severity) << ": ";
    if (auto code = toString(diag.code); !code.empty())
        os << code << ": ";
    os << diag.message << '\n';
}
} // namespace apicheck::support
