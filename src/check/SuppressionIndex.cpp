//===----------------------------------------------------------------------===//
//
// Part of the apicheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// A class file keeps @SuppressLint (class retention) on the class, its methods
// and fields. Annotations written on local variables or blocks are gone, so a
// suppression there never reaches this index. Nested, local and anonymous
// classes are compiled to separate units; their lexical parents are recovered
// from EnclosingMethod and InnerClasses, falling back to the '$' naming
// convention when the attribute is absent.
//
//===----------------------------------------------------------------------===//

#include "check/SuppressionIndex.hpp"

#include <unordered_set>

namespace apicheck::check
{
namespace
{

/// Upper bound on the number of lexical levels followed outward.
constexpr int kMaxNesting = 64;

std::string outerByName(const std::string &name)
{
    const auto dollar = name.rfind('$');
    const auto slash = name.rfind('/');
    if (dollar == std::string::npos || dollar == 0 ||
        (slash != std::string::npos && dollar < slash))
        return {};
    return name.substr(0, dollar);
}

} // namespace

std::optional<SuppressionIndex::Scope> SuppressionIndex::suppressionOf(
    const std::vector<classfile::Annotation> &annotations)
{
    for (const auto &ann : annotations)
    {
        if (ann.type != kSuppressLintDescriptor)
            continue;
        const std::vector<std::string> *values = ann.values("value");
        return values ? *values : Scope{};
    }
    return std::nullopt;
}

bool SuppressionIndex::covers(const Scope &scope, std::string_view checkId)
{
    if (scope.empty())
        return true;
    for (const auto &id : scope)
    {
        if (id == checkId || id == "all")
            return true;
    }
    return false;
}

void SuppressionIndex::addClass(const classfile::ClassFile &cls)
{
    ClassScopes &scopes = classes_[cls.name];
    scopes.self = suppressionOf(cls.annotations);

    for (const auto &method : cls.methods)
    {
        if (auto scope = suppressionOf(method.annotations))
            scopes.methods.emplace(method.name + method.descriptor, std::move(*scope));
    }
    for (const auto &field : cls.fields)
    {
        if (auto scope = suppressionOf(field.annotations))
            scopes.fields.emplace(field.name, std::move(*scope));
    }

    if (cls.enclosingMethod)
    {
        scopes.outerClass = cls.enclosingMethod->owner;
        if (!cls.enclosingMethod->name.empty())
            scopes.outerMethod = cls.enclosingMethod->name + cls.enclosingMethod->descriptor;
    }
    else
    {
        scopes.outerClass = cls.declaringClass();
        if (scopes.outerClass.empty())
            scopes.outerClass = outerByName(cls.name);
    }
}

bool SuppressionIndex::classSuppresses(const std::string &owner,
                                       const std::string &methodKey,
                                       const std::string &field,
                                       std::string_view checkId) const
{
    auto it = classes_.find(owner);
    if (it == classes_.end())
        return false;
    const ClassScopes &scopes = it->second;

    if (!field.empty())
    {
        if (auto f = scopes.fields.find(field);
            f != scopes.fields.end() && covers(f->second, checkId))
            return true;
    }
    if (!methodKey.empty())
    {
        if (auto m = scopes.methods.find(methodKey);
            m != scopes.methods.end() && covers(m->second, checkId))
            return true;
    }
    return scopes.self && covers(*scopes.self, checkId);
}

bool SuppressionIndex::isSuppressed(const Reference &ref, std::string_view checkId) const
{
    const Enclosing &where = ref.enclosing;
    if (where.owner.empty())
        return false;

    std::string owner = where.owner;
    std::string methodKey =
        where.method.empty() ? std::string() : where.method + where.methodDescriptor;
    std::string field = where.field;

    std::unordered_set<std::string> seen;
    for (int depth = 0; depth < kMaxNesting && !owner.empty(); ++depth)
    {
        if (!seen.insert(owner).second)
            break;
        if (classSuppresses(owner, methodKey, field, checkId))
            return true;

        auto it = classes_.find(owner);
        if (it == classes_.end())
        {
            // Unscanned enclosing class: keep climbing by name only.
            owner = outerByName(owner);
            methodKey.clear();
        }
        else
        {
            methodKey = it->second.outerMethod;
            owner = it->second.outerClass;
        }
        field.clear();
    }
    return false;
}

} // namespace apicheck::check
