//===----------------------------------------------------------------------===//
//
// Part of the apicheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements catalog loading on top of the element-tree XML reader.  Class
// entries are registered first; UI tags are derived in a second pass so the
// view-package precedence (widget, then view, then webkit) does not depend on
// document order.
//
//===----------------------------------------------------------------------===//

#include "catalog/CatalogLoader.hpp"

#include "classfile/Descriptor.hpp"
#include "support/trace.hpp"
#include "xml/XmlReader.hpp"

#include <array>
#include <initializer_list>
#include <charconv>
#include <fstream>
#include <sstream>

namespace apicheck::catalog
{
namespace
{
using support::DiagCode;

constexpr std::array<std::string_view, 3> kViewPackages = {
    "android/widget/", "android/view/", "android/webkit/"};

support::Diag catalogError(std::string_view path, uint32_t line, const std::string &msg)
{
    std::ostringstream os;
    if (line != 0)
        os << "line " << line << ": ";
    os << msg;
    return support::makeError(DiagCode::CatalogLoad, std::string(path), os.str());
}

/// Parse a `since` attribute; absent means @p fallback.
bool parseSince(const xml::XmlElement &el, int fallback, int &out)
{
    const std::string *text = el.attribute("since");
    if (text == nullptr)
    {
        out = fallback;
        return true;
    }
    const char *begin = text->data();
    const char *end = begin + text->size();
    const auto res = std::from_chars(begin, end, out);
    return res.ec == std::errc() && res.ptr == end && !text->empty() && out > 0;
}

class Builder
{
  public:
    explicit Builder(std::string_view path) : path_(path) {}

    support::Expected<ApiCatalog> build(const xml::XmlElement &root)
    {
        if (root.name != "api")
            return catalogError(path_, root.line, "root element must be <api>, found <" +
                                                      root.name + ">");

        for (const auto &child : root.children)
        {
            if (child.name != "class")
                continue;
            if (!addClass(child))
                return error_;
        }

        deriveUiTags();
        return std::move(catalog_);
    }

  private:
    bool fail(uint32_t line, const std::string &msg)
    {
        error_ = catalogError(path_, line, msg);
        return false;
    }

    bool addClass(const xml::XmlElement &el)
    {
        const std::string *name = el.attribute("name");
        if (name == nullptr || name->empty())
            return fail(el.line, "<class> without a name");

        int classSince = 1;
        if (!parseSince(el, 1, classSince))
            return fail(el.line, "invalid since value for class " + *name);
        catalog_.addClass(*name, classSince);
        classNames_.push_back(*name);

        // Superclass edges precede interface edges regardless of document order.
        for (const char *edgeTag : {"extends", "implements"})
        {
            for (const auto &child : el.children)
            {
                if (child.name != edgeTag)
                    continue;
                const std::string *super = child.attribute("name");
                if (super == nullptr || super->empty())
                    return fail(child.line, std::string("<") + edgeTag + "> without a name");
                catalog_.addEdge({*name, *super});
            }
        }

        for (const auto &child : el.children)
        {
            if (child.name != "method" && child.name != "field")
                continue;
            const std::string *memberName = child.attribute("name");
            if (memberName == nullptr || memberName->empty())
                return fail(child.line, "<" + child.name + "> without a name in " + *name);
            int since = classSince;
            if (!parseSince(child, classSince, since))
                return fail(child.line, "invalid since value for " + *name + "#" + *memberName);

            if (child.name == "field")
            {
                catalog_.addField(*name, *memberName, since);
                continue;
            }
            std::string method;
            std::string params;
            if (!classfile::splitMethodEntry(*memberName, method, params))
                return fail(child.line, "malformed method signature " + *memberName);
            catalog_.addMethod(*name, method, params, since);
        }
        return true;
    }

    void deriveUiTags()
    {
        for (std::string_view pkg : kViewPackages)
        {
            for (const auto &cls : classNames_)
            {
                if (classfile::packageOf(cls) != pkg || cls.find('$') != std::string::npos)
                    continue;
                const auto since = catalog_.lookup(Signature{cls, {}, {}}, ElementKind::Class);
                catalog_.addUiTag(std::string(classfile::simpleNameOf(cls)), since.value_or(1));
            }
        }
        for (const auto &cls : classNames_)
        {
            if (cls.find('$') != std::string::npos)
                continue;
            const auto since = catalog_.lookup(Signature{cls, {}, {}}, ElementKind::Class);
            catalog_.addUiTag(classfile::toDottedName(cls), since.value_or(1));
        }
    }

    std::string_view path_;
    ApiCatalog catalog_;
    std::vector<std::string> classNames_;
    support::Diag error_;
};

} // namespace

support::Expected<ApiCatalog> parseCatalog(std::string_view text, std::string_view path)
{
    auto doc = xml::parseXml(text);
    if (!doc)
        return catalogError(path, 0, doc.error().message);

    Builder builder(path);
    auto catalog = builder.build(doc.value());
    if (catalog)
    {
        std::ostringstream os;
        os << "loaded catalog " << path << ": " << catalog.value().size()
           << " entries, max version " << catalog.value().maxVersion();
        support::trace(os.str());
    }
    return catalog;
}

support::Expected<ApiCatalog> loadCatalog(const std::string &path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        return catalogError(path, 0, "cannot open catalog");

    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad())
        return catalogError(path, 0, "error reading catalog");

    return parseCatalog(buffer.str(), path);
}

} // namespace apicheck::catalog
