//===----------------------------------------------------------------------===//
//
// Part of the apicheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Project overlay on top of the catalog hierarchy.
//
//===----------------------------------------------------------------------===//

#include "check/TypeHierarchy.hpp"

#include "classfile/Descriptor.hpp"

namespace apicheck::check
{

void TypeHierarchy::addProjectType(const classfile::ClassFile &cls)
{
    ProjectType &type = project_[cls.name];
    type.supertypes.clear();
    if (!cls.superName.empty())
        type.supertypes.push_back(cls.superName);
    type.supertypes.insert(type.supertypes.end(), cls.interfaces.begin(), cls.interfaces.end());

    for (const auto &method : cls.methods)
        type.methods.insert(method.name + classfile::parameterDescriptor(method.descriptor));
    for (const auto &field : cls.fields)
        type.fields.insert(field.name);
}

const std::vector<std::string> &TypeHierarchy::supertypes(const std::string &type) const
{
    if (auto it = project_.find(type); it != project_.end())
        return it->second.supertypes;
    return catalog_.supertypes(type);
}

bool TypeHierarchy::declaresMember(const std::string &type,
                                   catalog::ElementKind kind,
                                   const std::string &name,
                                   const std::string &params) const
{
    auto it = project_.find(type);
    if (it == project_.end())
        return false;
    if (kind == catalog::ElementKind::Field)
        return it->second.fields.count(name) != 0;
    return it->second.methods.count(name + params) != 0;
}

} // namespace apicheck::check
