//===----------------------------------------------------------------------===//
//
// Part of the apicheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Layout documents reference widgets by tag name, either the simple name of a
// framework view ("GridLayout") or a fully qualified class name. Both forms
// are looked up verbatim in the UiTag table by the resolver; this file only
// walks the tree.
//
//===----------------------------------------------------------------------===//

#include "check/LayoutScanner.hpp"

#include "xml/XmlReader.hpp"

#include <array>
#include <fstream>
#include <sstream>

namespace apicheck::check
{
namespace
{

constexpr std::array<std::string_view, 10> kAlwaysAvailable = {
    "view", "fragment", "requestFocus", "merge", "include",
    "tag",  "data",     "layout",       "variable", "import",
};

void collect(const xml::XmlElement &element, const std::string &path, std::vector<Reference> &out)
{
    if (!isAlwaysAvailableTag(element.name))
    {
        Reference ref;
        ref.kind = catalog::ElementKind::UiTag;
        ref.signature.owner = element.name;
        ref.file = path;
        ref.line = element.line;
        ref.seq = static_cast<uint32_t>(out.size());
        out.push_back(std::move(ref));
    }
    for (const auto &child : element.children)
        collect(child, path, out);
}

} // namespace

bool isAlwaysAvailableTag(std::string_view tag)
{
    for (std::string_view t : kAlwaysAvailable)
    {
        if (t == tag)
            return true;
    }
    return false;
}

support::Expected<std::vector<Reference>> scanLayout(std::string_view text, const std::string &path)
{
    auto root = xml::parseXml(text);
    if (!root)
        return support::makeError(support::DiagCode::UnitParse, path, root.error().message);

    std::vector<Reference> refs;
    collect(root.value(), path, refs);
    return refs;
}

support::Expected<std::vector<Reference>> scanLayoutFile(const std::string &path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        return support::makeError(support::DiagCode::UnitParse, path, "cannot open layout file");

    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad())
        return support::makeError(support::DiagCode::UnitParse, path, "error reading layout file");
    return scanLayout(buffer.str(), path);
}

} // namespace apicheck::check
