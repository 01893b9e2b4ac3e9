//===----------------------------------------------------------------------===//
//
// Part of the apicheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the diagnostic engine that aggregates per-file failures (catalog
// load errors, unparsable class files or layouts).  API violations are not
// diagnostics: they are rendered by the report module in the lint format, so
// a parse failure can never be mistaken for a violation.
//
//===----------------------------------------------------------------------===//

#include "diagnostics.hpp"
#include "diag_expected.hpp"
#include "source_manager.hpp"

namespace apicheck::support
{

std::string_view toString(DiagCode code)
{
    switch (code)
    {
        case DiagCode::None:
            return {};
        case DiagCode::CatalogLoad:
            return "catalog-load";
        case DiagCode::UnitParse:
            return "unit-parse";
        case DiagCode::Usage:
            return "usage";
    }
    return {};
}

/// @brief Adds a diagnostic to the engine and updates severity counters.
/// @param d Diagnostic to record; moved into the engine's storage.
void DiagnosticEngine::report(Diagnostic d)
{
    if (d.severity == Severity::Error)
        ++errors_;
    else if (d.severity == Severity::Warning)
        ++warnings_;
    diags_.push_back(std::move(d));
}

/// @brief Writes all stored diagnostics to the provided output stream.
///
/// Formatting is delegated to `printDiag`; when a SourceManager is supplied
/// diagnostics carrying a file id print the registered path.
void DiagnosticEngine::printAll(std::ostream &os, const SourceManager *sm) const
{
    for (const auto &d : diags_)
    {
        printDiag(d, os, sm);
    }
}

size_t DiagnosticEngine::errorCount() const
{
    return errors_;
}

size_t DiagnosticEngine::warningCount() const
{
    return warnings_;
}
} // namespace apicheck::support
