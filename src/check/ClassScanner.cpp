//===----------------------------------------------------------------------===//
//
// Part of the apicheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Walks the symbolic instructions ClassReader extracted and turns each operand
// that names a class, field or method into a Reference. Construction is
// reported through the allocated class rather than the <init> call, and
// references inside instance or static initializers are attributed to the
// field they initialize when a store to that field follows on the same line.
// In a constructor, lines between the superclass constructor call and the
// closing return are the constructor's own body and are never attributed.
//
//===----------------------------------------------------------------------===//

#include "check/ClassScanner.hpp"

#include "classfile/Descriptor.hpp"
#include "classfile/Opcodes.hpp"

#include <cstddef>
#include <optional>

namespace apicheck::check
{
namespace
{

using catalog::ElementKind;
using classfile::Opcode;
using classfile::SymbolicInstruction;
using classfile::toByte;

bool isInitializer(const std::string &name)
{
    return name == "<init>" || name == "<clinit>";
}

class Emitter
{
  public:
    Emitter(std::vector<Reference> &out, const std::string &file) : out_(out), file_(file) {}

    void emit(ElementKind kind, catalog::Signature sig, uint32_t line, const Enclosing &where)
    {
        Reference ref;
        ref.kind = kind;
        ref.signature = std::move(sig);
        ref.file = file_;
        ref.line = line;
        ref.enclosing = where;
        ref.seq = next_++;
        out_.push_back(std::move(ref));
    }

    /// Class reference to the element class of @p nameOrDescriptor, if any.
    void emitClass(const std::string &nameOrDescriptor, uint32_t line, const Enclosing &where)
    {
        std::string cls = classfile::elementClassName(nameOrDescriptor);
        if (cls.empty())
            return;
        emit(ElementKind::Class, {std::move(cls), {}, {}}, line, where);
    }

  private:
    std::vector<Reference> &out_;
    const std::string &file_;
    uint32_t next_ = 0;
};

/// For each instruction, the index of the first store to a field of @p owner
/// at or after it, or nullopt when none follows.
std::vector<std::optional<size_t>> nextOwnStores(const std::vector<SymbolicInstruction> &code,
                                                 const std::string &owner)
{
    std::vector<std::optional<size_t>> next(code.size());
    std::optional<size_t> pending;
    for (size_t i = code.size(); i-- > 0;)
    {
        const uint8_t op = code[i].opcode;
        if ((op == toByte(Opcode::PUTFIELD) || op == toByte(Opcode::PUTSTATIC)) &&
            code[i].owner == owner)
            pending = i;
        next[i] = pending;
    }
    return next;
}

/// Lines of an instance constructor that belong to its own body: from the
/// superclass constructor call through the closing return. Field initializers
/// sit outside this span. An empty optional means the constructor delegates
/// to this(...) and runs no initializers.
struct ConstructorBody
{
    uint32_t first = 0;
    uint32_t last = 0;

    [[nodiscard]] bool contains(uint32_t line) const
    {
        return last > first && line >= first && line <= last;
    }
};

template <typename LineAt>
std::optional<ConstructorBody> constructorBody(const classfile::ClassFile &cls,
                                               const classfile::CodeAttribute &code,
                                               const LineAt &lineAt)
{
    ConstructorBody body;
    for (const auto &insn : code.instructions)
    {
        if (insn.opcode != toByte(Opcode::INVOKESPECIAL) || insn.name != "<init>")
            continue;
        if (insn.owner == cls.name)
            return std::nullopt;
        if (insn.owner == cls.superName)
        {
            body.first = lineAt(insn.offset);
            break;
        }
    }
    body.last = code.codeLength == 0 ? body.first : lineAt(code.codeLength - 1);
    return body;
}

void scanMethod(const classfile::ClassFile &cls,
                const classfile::MemberInfo &method,
                uint32_t declLine,
                Emitter &emitter)
{
    const classfile::CodeAttribute &code = *method.code;
    const auto lineAt = [&](uint32_t offset) {
        const auto line = code.lines.lineFor(offset);
        return line && *line != 0 ? *line : declLine;
    };

    Enclosing where{cls.name, method.name, method.descriptor, {}};
    bool initializer = isInitializer(method.name);
    ConstructorBody body;
    if (method.name == "<init>")
    {
        auto span = constructorBody(cls, code, lineAt);
        initializer = span.has_value();
        if (span)
            body = *span;
    }
    std::vector<std::optional<size_t>> stores;
    if (initializer)
        stores = nextOwnStores(code.instructions, cls.name);

    for (size_t i = 0; i < code.instructions.size(); ++i)
    {
        const SymbolicInstruction &insn = code.instructions[i];
        const uint32_t line = lineAt(insn.offset);

        Enclosing site = where;
        if (initializer && stores[i])
        {
            const SymbolicInstruction &store = code.instructions[*stores[i]];
            if (lineAt(store.offset) == line && !body.contains(line))
                site.field = store.name;
        }

        if (classfile::isFieldAccess(insn.opcode))
        {
            if (insn.owner.empty() || insn.owner.front() == '[')
                continue;
            emitter.emit(ElementKind::Field, {insn.owner, insn.name, {}}, line, site);
        }
        else if (classfile::isMethodInvoke(insn.opcode))
        {
            if (isInitializer(insn.name) || insn.owner.empty() || insn.owner.front() == '[')
                continue;
            emitter.emit(ElementKind::Method,
                         {insn.owner, insn.name, classfile::parameterDescriptor(insn.descriptor)},
                         line,
                         site);
        }
        else
        {
            // new, anewarray, checkcast, instanceof, multianewarray, ldc class.
            emitter.emitClass(insn.owner, line, site);
        }
    }

    // Parameters and locals declared with a platform type. The declaration
    // line is the line of the first instruction in the variable's scope.
    for (const auto &local : code.locals)
    {
        const char tag = local.descriptor.empty() ? '\0' : local.descriptor.front();
        if (tag != 'L' && tag != '[')
            continue;
        emitter.emitClass(local.descriptor, lineAt(local.startPc), where);
    }

    for (const auto &handler : code.handlers)
    {
        if (!handler.catchType.empty())
            emitter.emitClass(handler.catchType, lineAt(handler.handlerPc), where);
    }
}

} // namespace

std::vector<Reference> scanClassFile(const classfile::ClassFile &cls, const std::string &sourcePath)
{
    std::vector<Reference> refs;
    Emitter emitter(refs, sourcePath);

    uint32_t declLine = cls.declarationLine();
    if (declLine == 0)
        declLine = 1;

    const Enclosing classScope{cls.name, {}, {}, {}};
    if (!cls.superName.empty())
        emitter.emitClass(cls.superName, declLine, classScope);
    for (const auto &iface : cls.interfaces)
        emitter.emitClass(iface, declLine, classScope);

    for (const auto &method : cls.methods)
    {
        if (method.code)
            scanMethod(cls, method, declLine, emitter);
    }
    return refs;
}

} // namespace apicheck::check
