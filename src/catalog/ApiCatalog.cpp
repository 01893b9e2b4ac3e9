//===----------------------------------------------------------------------===//
//
// Part of the apicheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the versioned element catalog.  Member keys concatenate owner,
// name and parameter descriptor ("android/app/Activity#getActionBar()") so a
// lookup is a single hash lookup per table.
//
//===----------------------------------------------------------------------===//

#include "catalog/ApiCatalog.hpp"

#include <algorithm>

namespace apicheck::catalog
{

std::string_view toString(ElementKind kind)
{
    switch (kind)
    {
        case ElementKind::Class:
            return "Class";
        case ElementKind::Method:
            return "Call";
        case ElementKind::Field:
            return "Field";
        case ElementKind::UiTag:
            return "View";
    }
    return {};
}

std::string ApiCatalog::memberKey(const std::string &owner,
                                  const std::string &member,
                                  const std::string &descriptor)
{
    std::string key;
    key.reserve(owner.size() + member.size() + descriptor.size() + 1);
    key.append(owner).append(1, '#').append(member).append(descriptor);
    return key;
}

std::optional<int> ApiCatalog::lookup(const Signature &sig, ElementKind kind) const
{
    const std::unordered_map<std::string, int> *table = nullptr;
    std::string key;
    switch (kind)
    {
        case ElementKind::Class:
            table = &classes_;
            key = sig.owner;
            break;
        case ElementKind::Method:
            table = &methods_;
            key = memberKey(sig.owner, sig.member, sig.descriptor);
            break;
        case ElementKind::Field:
            table = &fields_;
            key = memberKey(sig.owner, sig.member, {});
            break;
        case ElementKind::UiTag:
            table = &tags_;
            key = sig.owner;
            break;
    }
    if (table == nullptr)
        return std::nullopt;

    auto it = table->find(key);
    if (it == table->end())
        return std::nullopt;
    return it->second;
}

const std::vector<std::string> &ApiCatalog::supertypes(const std::string &type) const
{
    static const std::vector<std::string> kNone;
    auto it = supertypes_.find(type);
    return it == supertypes_.end() ? kNone : it->second;
}

bool ApiCatalog::hasClass(const std::string &internalName) const
{
    return classes_.count(internalName) != 0;
}

size_t ApiCatalog::size() const
{
    return classes_.size() + methods_.size() + fields_.size() + tags_.size();
}

void ApiCatalog::noteVersion(int since)
{
    maxVersion_ = std::max(maxVersion_, since);
}

void ApiCatalog::addClass(const std::string &internalName, int since)
{
    classes_[internalName] = since;
    noteVersion(since);
}

void ApiCatalog::addMethod(const std::string &owner,
                           const std::string &name,
                           const std::string &params,
                           int since)
{
    methods_[memberKey(owner, name, params)] = since;
    noteVersion(since);
}

void ApiCatalog::addField(const std::string &owner, const std::string &name, int since)
{
    fields_[memberKey(owner, name, {})] = since;
    noteVersion(since);
}

void ApiCatalog::addUiTag(const std::string &tag, int since)
{
    if (tags_.emplace(tag, since).second)
        noteVersion(since);
}

void ApiCatalog::addEdge(HierarchyEdge edge)
{
    auto &supers = supertypes_[edge.subtype];
    if (std::find(supers.begin(), supers.end(), edge.supertype) == supers.end())
        supers.push_back(std::move(edge.supertype));
}

} // namespace apicheck::catalog
