//===----------------------------------------------------------------------===//
//
// Part of the apicheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/classfile/Descriptor.cpp
// Purpose: Helpers for JVM internal names and field/method descriptors.
// Key invariants: See Descriptor.hpp.
// Ownership/Lifetime: Stateless.
// Links: classfile/Descriptor.hpp

#include "classfile/Descriptor.hpp"

#include <algorithm>

namespace apicheck::classfile
{

std::string parameterDescriptor(std::string_view descriptor)
{
    const size_t close = descriptor.find(')');
    if (close == std::string_view::npos)
        return std::string(descriptor);
    return std::string(descriptor.substr(0, close + 1));
}

bool splitMethodEntry(std::string_view entry, std::string &name, std::string &params)
{
    const size_t open = entry.find('(');
    if (open == std::string_view::npos || open == 0)
        return false;
    name.assign(entry.substr(0, open));
    params = parameterDescriptor(entry.substr(open));
    return params.back() == ')';
}

std::string elementClassName(std::string_view nameOrDescriptor)
{
    std::string_view s = nameOrDescriptor;
    const bool isArray = !s.empty() && s.front() == '[';
    while (!s.empty() && s.front() == '[')
        s.remove_prefix(1);
    if (s.empty())
        return {};
    if (s.front() == 'L' && s.back() == ';')
        return std::string(s.substr(1, s.size() - 2));
    // A bare single letter after '[' is a primitive element type.
    if (isArray)
        return {};
    return std::string(s);
}

std::string toDottedName(std::string_view internalName)
{
    std::string out(internalName);
    std::replace(out.begin(), out.end(), '/', '.');
    return out;
}

std::string toSourceName(std::string_view internalName)
{
    std::string out = toDottedName(internalName);
    std::replace(out.begin(), out.end(), '$', '.');
    return out;
}

std::string_view packageOf(std::string_view internalName)
{
    const size_t slash = internalName.rfind('/');
    if (slash == std::string_view::npos)
        return {};
    return internalName.substr(0, slash + 1);
}

std::string_view simpleNameOf(std::string_view internalName)
{
    const size_t slash = internalName.rfind('/');
    if (slash == std::string_view::npos)
        return internalName;
    return internalName.substr(slash + 1);
}

} // namespace apicheck::classfile
