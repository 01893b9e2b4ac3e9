//===----------------------------------------------------------------------===//
//
// Part of the apicheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Lint-format rendering of check results.
//
//===----------------------------------------------------------------------===//

#include "report/Reporter.hpp"

#include "classfile/Descriptor.hpp"
#include "support/text_utils.hpp"

#include <sstream>

namespace apicheck::report
{

std::string formatSignature(const check::Violation &v)
{
    const catalog::Signature &sig = v.reference.signature;
    switch (v.reference.kind)
    {
        case catalog::ElementKind::Class:
            return classfile::toSourceName(v.displayOwner);
        case catalog::ElementKind::UiTag:
            return "<" + v.displayOwner + ">";
        case catalog::ElementKind::Method:
        case catalog::ElementKind::Field:
            return classfile::toDottedName(v.displayOwner) + "#" + sig.member;
    }
    return {};
}

std::string formatViolation(const check::Violation &v)
{
    std::ostringstream os;
    os << v.reference.file << ':' << v.reference.line << ": Error: "
       << catalog::toString(v.reference.kind) << " requires API level " << v.required
       << " (current min is " << v.declaredMin << "): " << formatSignature(v);
    return os.str();
}

void printReport(const std::vector<check::Violation> &violations, std::ostream &os)
{
    if (violations.empty())
    {
        os << kNoWarnings << '\n';
        return;
    }
    for (const auto &v : violations)
        os << formatViolation(v) << '\n';
}

std::string parseFailureSummary(const std::vector<std::string> &paths, size_t maxItems)
{
    if (paths.empty())
        return {};
    std::ostringstream os;
    os << "skipped " << paths.size() << " unreadable file" << (paths.size() == 1 ? "" : "s")
       << ": " << support::formatList(paths, maxItems);
    return os.str();
}

} // namespace apicheck::report
