//===----------------------------------------------------------------------===//
//
// Part of the apicheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Query helpers on the parsed class-file model.
//
//===----------------------------------------------------------------------===//

#include "classfile/ClassFile.hpp"

#include <algorithm>

namespace apicheck::classfile
{

const std::vector<std::string> *Annotation::values(const std::string &elementName) const
{
    for (const auto &element : elements)
    {
        if (element.first == elementName)
            return &element.second;
    }
    return nullptr;
}

const MemberInfo *ClassFile::findMethod(const std::string &methodName,
                                        const std::string &methodDescriptor) const
{
    for (const auto &method : methods)
    {
        if (method.name == methodName && method.descriptor == methodDescriptor)
            return &method;
    }
    return nullptr;
}

const MemberInfo *ClassFile::findField(const std::string &fieldName) const
{
    for (const auto &field : fields)
    {
        if (field.name == fieldName)
            return &field;
    }
    return nullptr;
}

std::string ClassFile::declaringClass() const
{
    for (const auto &entry : innerClasses)
    {
        if (entry.inner == name)
            return entry.outer;
    }
    return {};
}

uint32_t ClassFile::declarationLine() const
{
    uint32_t best = 0;
    for (const auto &method : methods)
    {
        if (!method.code)
            continue;
        const uint32_t line = method.code->lines.minLine();
        if (line != 0 && (best == 0 || line < best))
            best = line;
    }
    return best;
}

} // namespace apicheck::classfile
