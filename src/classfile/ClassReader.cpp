//===----------------------------------------------------------------------===//
//
// Part of the apicheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the class-file reader. The constant pool is decoded first; all
// later structures are resolved through it immediately so the model carries
// names instead of indices. Attributes are parsed from a bounded sub-reader so
// a lying attribute_length cannot run into the next structure. Method bodies
// are walked once to extract every instruction with a symbolic operand.
//
//===----------------------------------------------------------------------===//

#include "classfile/ClassReader.hpp"

#include "classfile/ByteReader.hpp"
#include "classfile/Opcodes.hpp"

#include <fstream>
#include <sstream>

namespace apicheck::classfile
{
namespace
{

using support::Expected;

constexpr uint32_t kClassMagic = 0xCAFEBABE;

/// Nested element values deeper than this are treated as malformed.
constexpr int kMaxElementDepth = 64;

enum class CpTag : uint8_t
{
    Utf8 = 1,
    Integer = 3,
    Float = 4,
    Long = 5,
    Double = 6,
    Class = 7,
    String = 8,
    Fieldref = 9,
    Methodref = 10,
    InterfaceMethodref = 11,
    NameAndType = 12,
    MethodHandle = 15,
    MethodType = 16,
    Dynamic = 17,
    InvokeDynamic = 18,
    Module = 19,
    Package = 20
};

struct CpEntry
{
    uint8_t tag = 0; ///< 0 marks index 0 and the second slot of Long/Double.
    uint16_t a = 0;
    uint16_t b = 0;
    std::string text; ///< Utf8 payload.
};

struct MemberRef
{
    std::string owner;
    std::string name;
    std::string descriptor;
};

class ClassParser
{
  public:
    ClassParser(std::string_view bytes, const std::string &path)
        : in_(reinterpret_cast<const uint8_t *>(bytes.data()), bytes.size()), path_(path)
    {
    }

    Expected<ClassFile> run()
    {
        if (in_.u4() != kClassMagic || !in_.ok())
            return fail("not a class file (bad magic number)");
        cls_.minorVersion = in_.u2();
        cls_.majorVersion = in_.u2();

        if (auto r = readConstantPool(); !r)
            return Expected<ClassFile>(r.error());

        cls_.access = in_.u2();
        const uint16_t thisIndex = in_.u2();
        const uint16_t superIndex = in_.u2();
        if (!in_.ok())
            return fail("truncated class header");
        if (!className(thisIndex, cls_.name))
            return fail("invalid this_class index " + std::to_string(thisIndex));
        if (superIndex != 0 && !className(superIndex, cls_.superName))
            return fail("invalid super_class index " + std::to_string(superIndex));

        const uint16_t interfaceCount = in_.u2();
        for (uint16_t i = 0; i < interfaceCount && in_.ok(); ++i)
        {
            const uint16_t index = in_.u2();
            std::string iface;
            if (!className(index, iface))
                return fail("invalid interface index " + std::to_string(index));
            cls_.interfaces.push_back(std::move(iface));
        }

        if (auto r = readMembers(cls_.fields, false); !r)
            return Expected<ClassFile>(r.error());
        if (auto r = readMembers(cls_.methods, true); !r)
            return Expected<ClassFile>(r.error());
        if (auto r = readClassAttributes(); !r)
            return Expected<ClassFile>(r.error());

        if (!in_.ok())
            return fail("truncated class file");
        return std::move(cls_);
    }

  private:
    support::Diag error(const std::string &msg) const
    {
        return support::makeError(support::DiagCode::UnitParse, path_, msg);
    }

    Expected<ClassFile> fail(const std::string &msg) const
    {
        return Expected<ClassFile>(error(msg));
    }

    Expected<void> readConstantPool()
    {
        const uint16_t count = in_.u2();
        if (!in_.ok() || count == 0)
            return error("truncated constant pool");
        pool_.assign(count, CpEntry{});

        for (uint16_t i = 1; i < count; ++i)
        {
            CpEntry &e = pool_[i];
            e.tag = in_.u1();
            switch (static_cast<CpTag>(e.tag))
            {
                case CpTag::Utf8:
                {
                    const uint16_t len = in_.u2();
                    e.text = std::string(in_.bytes(len));
                    break;
                }
                case CpTag::Integer:
                case CpTag::Float:
                    in_.skip(4);
                    break;
                case CpTag::Long:
                case CpTag::Double:
                    in_.skip(8);
                    // The following slot is unusable.
                    ++i;
                    break;
                case CpTag::Class:
                case CpTag::String:
                case CpTag::MethodType:
                case CpTag::Module:
                case CpTag::Package:
                    e.a = in_.u2();
                    break;
                case CpTag::Fieldref:
                case CpTag::Methodref:
                case CpTag::InterfaceMethodref:
                case CpTag::NameAndType:
                case CpTag::Dynamic:
                case CpTag::InvokeDynamic:
                    e.a = in_.u2();
                    e.b = in_.u2();
                    break;
                case CpTag::MethodHandle:
                    e.a = in_.u1();
                    e.b = in_.u2();
                    break;
                default:
                    if (!in_.ok())
                        return error("truncated constant pool");
                    return error("unknown constant pool tag " + std::to_string(e.tag) +
                                 " at index " + std::to_string(i));
            }
            if (!in_.ok())
                return error("truncated constant pool");
        }
        return {};
    }

    const CpEntry *entry(uint16_t index, CpTag tag) const
    {
        if (index == 0 || index >= pool_.size())
            return nullptr;
        const CpEntry &e = pool_[index];
        return e.tag == static_cast<uint8_t>(tag) ? &e : nullptr;
    }

    bool utf8(uint16_t index, std::string &out) const
    {
        const CpEntry *e = entry(index, CpTag::Utf8);
        if (!e)
            return false;
        out = e->text;
        return true;
    }

    bool className(uint16_t index, std::string &out) const
    {
        const CpEntry *e = entry(index, CpTag::Class);
        return e && utf8(e->a, out);
    }

    bool nameAndType(uint16_t index, std::string &name, std::string &descriptor) const
    {
        const CpEntry *e = entry(index, CpTag::NameAndType);
        return e && utf8(e->a, name) && utf8(e->b, descriptor);
    }

    bool memberRef(uint16_t index, bool method, MemberRef &out) const
    {
        if (index == 0 || index >= pool_.size())
            return false;
        const CpEntry &e = pool_[index];
        const auto tag = static_cast<CpTag>(e.tag);
        const bool tagOk = method ? (tag == CpTag::Methodref || tag == CpTag::InterfaceMethodref)
                                  : tag == CpTag::Fieldref;
        return tagOk && className(e.a, out.owner) && nameAndType(e.b, out.name, out.descriptor);
    }

    Expected<void> readMembers(std::vector<MemberInfo> &out, bool methods)
    {
        const char *what = methods ? "method" : "field";
        const uint16_t count = in_.u2();
        for (uint16_t i = 0; i < count; ++i)
        {
            MemberInfo member;
            member.access = in_.u2();
            const uint16_t nameIndex = in_.u2();
            const uint16_t descIndex = in_.u2();
            if (!in_.ok())
                return error(std::string("truncated ") + what + " table");
            if (!utf8(nameIndex, member.name) || !utf8(descIndex, member.descriptor))
                return error(std::string("invalid ") + what + " name or descriptor index");

            const uint16_t attrCount = in_.u2();
            for (uint16_t a = 0; a < attrCount; ++a)
            {
                std::string attrName;
                std::string_view body;
                if (auto r = nextAttribute(attrName, body); !r)
                    return r;
                ByteReader sub(reinterpret_cast<const uint8_t *>(body.data()), body.size());
                if (methods && attrName == "Code")
                {
                    CodeAttribute code;
                    if (auto r = readCode(sub, code); !r)
                        return r;
                    member.code = std::move(code);
                }
                else if (attrName == "RuntimeVisibleAnnotations" ||
                         attrName == "RuntimeInvisibleAnnotations")
                {
                    if (auto r = readAnnotations(sub, member.annotations); !r)
                        return r;
                }
            }
            out.push_back(std::move(member));
        }
        if (!in_.ok())
            return error(std::string("truncated ") + what + " table");
        return {};
    }

    /// Read one attribute header and hand back its name and bounded body.
    Expected<void> nextAttribute(std::string &name, std::string_view &body)
    {
        const uint16_t nameIndex = in_.u2();
        const uint32_t length = in_.u4();
        if (!in_.ok())
            return error("truncated attribute header");
        if (!utf8(nameIndex, name))
            return error("invalid attribute name index " + std::to_string(nameIndex));
        if (length > in_.remaining())
            return error("attribute " + name + " runs past end of file");
        body = in_.bytes(length);
        return {};
    }

    Expected<void> readClassAttributes()
    {
        const uint16_t count = in_.u2();
        for (uint16_t a = 0; a < count && in_.ok(); ++a)
        {
            std::string attrName;
            std::string_view body;
            if (auto r = nextAttribute(attrName, body); !r)
                return r;
            ByteReader sub(reinterpret_cast<const uint8_t *>(body.data()), body.size());

            if (attrName == "SourceFile")
            {
                if (!utf8(sub.u2(), cls_.sourceFile) || !sub.ok())
                    return error("malformed SourceFile attribute");
            }
            else if (attrName == "InnerClasses")
            {
                const uint16_t n = sub.u2();
                for (uint16_t i = 0; i < n && sub.ok(); ++i)
                {
                    InnerClassEntry e;
                    const uint16_t innerIndex = sub.u2();
                    const uint16_t outerIndex = sub.u2();
                    const uint16_t nameIndex = sub.u2();
                    e.access = sub.u2();
                    if (!sub.ok())
                        break;
                    if (!className(innerIndex, e.inner) ||
                        (outerIndex != 0 && !className(outerIndex, e.outer)) ||
                        (nameIndex != 0 && !utf8(nameIndex, e.innerName)))
                        return error("malformed InnerClasses attribute");
                    cls_.innerClasses.push_back(std::move(e));
                }
                if (!sub.ok())
                    return error("truncated InnerClasses attribute");
            }
            else if (attrName == "EnclosingMethod")
            {
                EnclosingMethodInfo info;
                const uint16_t classIndex = sub.u2();
                const uint16_t methodIndex = sub.u2();
                if (!sub.ok() || !className(classIndex, info.owner) ||
                    (methodIndex != 0 && !nameAndType(methodIndex, info.name, info.descriptor)))
                    return error("malformed EnclosingMethod attribute");
                cls_.enclosingMethod = std::move(info);
            }
            else if (attrName == "RuntimeVisibleAnnotations" ||
                     attrName == "RuntimeInvisibleAnnotations")
            {
                if (auto r = readAnnotations(sub, cls_.annotations); !r)
                    return r;
            }
        }
        if (!in_.ok())
            return error("truncated class attributes");
        return {};
    }

    Expected<void> readAnnotations(ByteReader &r, std::vector<Annotation> &out)
    {
        const uint16_t count = r.u2();
        for (uint16_t i = 0; i < count && r.ok(); ++i)
        {
            Annotation ann;
            if (auto res = readAnnotation(r, &ann, 0); !res)
                return res;
            out.push_back(std::move(ann));
        }
        if (!r.ok())
            return error("truncated annotation attribute");
        return {};
    }

    /// Parse one annotation; @p out may be null for nested annotations.
    Expected<void> readAnnotation(ByteReader &r, Annotation *out, int depth)
    {
        std::string type;
        if (!utf8(r.u2(), type))
            return error("invalid annotation type index");
        const uint16_t pairs = r.u2();
        if (out)
            out->type = std::move(type);
        for (uint16_t p = 0; p < pairs && r.ok(); ++p)
        {
            std::string elementName;
            if (!utf8(r.u2(), elementName))
                return error("invalid annotation element name index");
            std::vector<std::string> strings;
            if (auto res = readElementValue(r, out ? &strings : nullptr, depth + 1); !res)
                return res;
            if (out)
                out->elements.emplace_back(std::move(elementName), std::move(strings));
        }
        return {};
    }

    /// Parse one element_value, appending string constants to @p strings.
    Expected<void> readElementValue(ByteReader &r, std::vector<std::string> *strings, int depth)
    {
        if (depth > kMaxElementDepth)
            return error("annotation nesting too deep");
        const char tag = static_cast<char>(r.u1());
        if (!r.ok())
            return error("truncated annotation element");
        switch (tag)
        {
            case 's':
            {
                std::string value;
                if (!utf8(r.u2(), value))
                    return error("invalid annotation string constant");
                if (strings)
                    strings->push_back(std::move(value));
                return {};
            }
            case 'B':
            case 'C':
            case 'D':
            case 'F':
            case 'I':
            case 'J':
            case 'S':
            case 'Z':
            case 'c':
                r.skip(2);
                return {};
            case 'e':
                r.skip(4);
                return {};
            case '@':
                return readAnnotation(r, nullptr, depth);
            case '[':
            {
                const uint16_t n = r.u2();
                for (uint16_t i = 0; i < n && r.ok(); ++i)
                {
                    if (auto res = readElementValue(r, strings, depth + 1); !res)
                        return res;
                }
                return {};
            }
            default:
                return error(std::string("unknown annotation element tag '") + tag + "'");
        }
    }

    Expected<void> readCode(ByteReader &r, CodeAttribute &code)
    {
        r.skip(4); // max_stack, max_locals
        code.codeLength = r.u4();
        const std::string_view body = r.bytes(code.codeLength);
        if (!r.ok())
            return error("truncated Code attribute");

        const uint16_t handlerCount = r.u2();
        for (uint16_t i = 0; i < handlerCount && r.ok(); ++i)
        {
            ExceptionHandler h;
            h.startPc = r.u2();
            h.endPc = r.u2();
            h.handlerPc = r.u2();
            const uint16_t catchIndex = r.u2();
            if (!r.ok())
                break;
            if (catchIndex != 0 && !className(catchIndex, h.catchType))
                return error("invalid exception handler catch type index");
            code.handlers.push_back(std::move(h));
        }

        const uint16_t attrCount = r.u2();
        for (uint16_t a = 0; a < attrCount && r.ok(); ++a)
        {
            const uint16_t nameIndex = r.u2();
            const uint32_t length = r.u4();
            std::string attrName;
            if (!r.ok())
                break;
            if (!utf8(nameIndex, attrName))
                return error("invalid Code sub-attribute name index");
            const std::string_view sub = r.bytes(length);
            if (!r.ok())
                break;
            if (attrName == "LineNumberTable")
            {
                if (auto res = readLineNumbers(sub, code); !res)
                    return res;
            }
            else if (attrName == "LocalVariableTable")
            {
                if (auto res = readLocalVariables(sub, code); !res)
                    return res;
            }
        }
        if (!r.ok())
            return error("truncated Code attribute");
        code.lines.finalize();

        return decodeInstructions(body, code);
    }

    Expected<void> readLineNumbers(std::string_view sub, CodeAttribute &code)
    {
        ByteReader r(reinterpret_cast<const uint8_t *>(sub.data()), sub.size());
        const uint16_t n = r.u2();
        for (uint16_t i = 0; i < n; ++i)
        {
            const uint16_t pc = r.u2();
            const uint16_t line = r.u2();
            if (!r.ok())
                return error("truncated LineNumberTable attribute");
            code.lines.add(pc, line);
        }
        return {};
    }

    Expected<void> readLocalVariables(std::string_view sub, CodeAttribute &code)
    {
        ByteReader r(reinterpret_cast<const uint8_t *>(sub.data()), sub.size());
        const uint16_t n = r.u2();
        for (uint16_t i = 0; i < n; ++i)
        {
            LocalVariable local;
            local.startPc = r.u2();
            local.length = r.u2();
            const uint16_t nameIndex = r.u2();
            const uint16_t descIndex = r.u2();
            local.index = r.u2();
            if (!r.ok())
                return error("truncated LocalVariableTable attribute");
            if (!utf8(nameIndex, local.name) || !utf8(descIndex, local.descriptor))
                return error("invalid LocalVariableTable entry");
            code.locals.push_back(std::move(local));
        }
        return {};
    }

    Expected<void> decodeInstructions(std::string_view body, CodeAttribute &code)
    {
        const auto *bytes = reinterpret_cast<const uint8_t *>(body.data());
        const size_t size = body.size();
        size_t pc = 0;
        while (pc < size)
        {
            const auto len = instructionLength(bytes, size, pc);
            if (!len)
                return error("invalid instruction at offset " + std::to_string(pc));

            const uint8_t op = bytes[pc];
            const uint16_t operand =
                *len >= 3 ? static_cast<uint16_t>((bytes[pc + 1] << 8) | bytes[pc + 2]) : 0;
            SymbolicInstruction insn;
            insn.offset = static_cast<uint32_t>(pc);
            insn.opcode = op;

            if (isFieldAccess(op) || isMethodInvoke(op))
            {
                MemberRef ref;
                if (!memberRef(operand, isMethodInvoke(op), ref))
                    return error(std::string("invalid ") + std::string(opcodeName(op)) +
                                 " operand at offset " + std::to_string(pc));
                insn.owner = std::move(ref.owner);
                insn.name = std::move(ref.name);
                insn.descriptor = std::move(ref.descriptor);
                code.instructions.push_back(std::move(insn));
            }
            else if (isClassOperand(op))
            {
                if (!className(operand, insn.owner))
                    return error(std::string("invalid ") + std::string(opcodeName(op)) +
                                 " operand at offset " + std::to_string(pc));
                code.instructions.push_back(std::move(insn));
            }
            else if (op == toByte(Opcode::LDC) || op == toByte(Opcode::LDC_W))
            {
                const uint16_t index = op == toByte(Opcode::LDC) ? bytes[pc + 1] : operand;
                // Only class literals are references; other constants are ignored.
                if (entry(index, CpTag::Class) && className(index, insn.owner))
                    code.instructions.push_back(std::move(insn));
            }
            pc += *len;
        }
        return {};
    }

    ByteReader in_;
    const std::string &path_;
    std::vector<CpEntry> pool_;
    ClassFile cls_;
};

} // namespace

Expected<ClassFile> parseClassFile(std::string_view bytes, const std::string &path)
{
    return ClassParser(bytes, path).run();
}

Expected<ClassFile> readClassFile(const std::string &path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        return support::makeError(support::DiagCode::UnitParse, path, "cannot open class file");

    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad())
        return support::makeError(support::DiagCode::UnitParse, path, "error reading class file");

    const std::string bytes = buffer.str();
    return parseClassFile(bytes, path);
}

} // namespace apicheck::classfile
