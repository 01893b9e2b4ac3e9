//===----------------------------------------------------------------------===//
//
// Part of the apicheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Instruction length table for JVM method bodies.
//
//===----------------------------------------------------------------------===//

#include "classfile/Opcodes.hpp"

#include <array>

namespace apicheck::classfile
{
namespace
{

/// Fixed lengths for opcodes 0x00-0xC9; 0 marks variable-length instructions.
constexpr std::array<uint8_t, 0xCA> kFixedLengths = [] {
    std::array<uint8_t, 0xCA> t{};
    for (auto &len : t)
        len = 1;
    t[0x10] = 2; // bipush
    t[0x11] = 3; // sipush
    t[0x12] = 2; // ldc
    t[0x13] = 3; // ldc_w
    t[0x14] = 3; // ldc2_w
    for (int op = 0x15; op <= 0x19; ++op)
        t[op] = 2; // xload
    for (int op = 0x36; op <= 0x3A; ++op)
        t[op] = 2; // xstore
    t[0x84] = 3; // iinc
    for (int op = 0x99; op <= 0xA8; ++op)
        t[op] = 3; // if<cond>, goto, jsr
    t[0xA9] = 2; // ret
    t[0xAA] = 0; // tableswitch
    t[0xAB] = 0; // lookupswitch
    for (int op = 0xB2; op <= 0xB8; ++op)
        t[op] = 3; // field access, invokevirtual/special/static
    t[0xB9] = 5; // invokeinterface
    t[0xBA] = 5; // invokedynamic
    t[0xBB] = 3; // new
    t[0xBC] = 2; // newarray
    t[0xBD] = 3; // anewarray
    t[0xC0] = 3; // checkcast
    t[0xC1] = 3; // instanceof
    t[0xC4] = 0; // wide
    t[0xC5] = 4; // multianewarray
    t[0xC6] = 3; // ifnull
    t[0xC7] = 3; // ifnonnull
    t[0xC8] = 5; // goto_w
    t[0xC9] = 5; // jsr_w
    return t;
}();

int32_t readS32(const uint8_t *p)
{
    return static_cast<int32_t>((uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16) |
                                (uint32_t(p[2]) << 8) | uint32_t(p[3]));
}

} // namespace

std::optional<size_t> instructionLength(const uint8_t *code, size_t size, size_t offset)
{
    const uint8_t op = code[offset];
    if (op >= kFixedLengths.size())
        return std::nullopt;

    if (const uint8_t fixed = kFixedLengths[op]; fixed != 0)
    {
        if (offset + fixed > size)
            return std::nullopt;
        return fixed;
    }

    if (op == toByte(Opcode::WIDE))
    {
        if (offset + 1 >= size)
            return std::nullopt;
        const size_t len = code[offset + 1] == toByte(Opcode::IINC) ? 6 : 4;
        if (offset + len > size)
            return std::nullopt;
        return len;
    }

    // Switches: opcode, 0-3 padding bytes to a 4-byte boundary, then operands.
    const size_t operands = (offset + 4) & ~size_t{3};
    if (op == toByte(Opcode::TABLESWITCH))
    {
        if (operands + 12 > size)
            return std::nullopt;
        const int64_t low = readS32(code + operands + 4);
        const int64_t high = readS32(code + operands + 8);
        if (high < low)
            return std::nullopt;
        const size_t end = operands + 12 + static_cast<size_t>(high - low + 1) * 4;
        if (end > size)
            return std::nullopt;
        return end - offset;
    }

    // lookupswitch
    if (operands + 8 > size)
        return std::nullopt;
    const int32_t pairs = readS32(code + operands + 4);
    if (pairs < 0)
        return std::nullopt;
    const size_t end = operands + 8 + static_cast<size_t>(pairs) * 8;
    if (end > size)
        return std::nullopt;
    return end - offset;
}

bool isFieldAccess(uint8_t opcode)
{
    return opcode >= toByte(Opcode::GETSTATIC) && opcode <= toByte(Opcode::PUTFIELD);
}

bool isMethodInvoke(uint8_t opcode)
{
    return opcode >= toByte(Opcode::INVOKEVIRTUAL) && opcode <= toByte(Opcode::INVOKEINTERFACE);
}

bool isClassOperand(uint8_t opcode)
{
    switch (static_cast<Opcode>(opcode))
    {
        case Opcode::NEW:
        case Opcode::ANEWARRAY:
        case Opcode::CHECKCAST:
        case Opcode::INSTANCEOF:
        case Opcode::MULTIANEWARRAY:
            return true;
        default:
            return false;
    }
}

std::string_view opcodeName(uint8_t opcode)
{
    switch (static_cast<Opcode>(opcode))
    {
        case Opcode::LDC:
            return "ldc";
        case Opcode::LDC_W:
            return "ldc_w";
        case Opcode::GETSTATIC:
            return "getstatic";
        case Opcode::PUTSTATIC:
            return "putstatic";
        case Opcode::GETFIELD:
            return "getfield";
        case Opcode::PUTFIELD:
            return "putfield";
        case Opcode::INVOKEVIRTUAL:
            return "invokevirtual";
        case Opcode::INVOKESPECIAL:
            return "invokespecial";
        case Opcode::INVOKESTATIC:
            return "invokestatic";
        case Opcode::INVOKEINTERFACE:
            return "invokeinterface";
        case Opcode::NEW:
            return "new";
        case Opcode::ANEWARRAY:
            return "anewarray";
        case Opcode::CHECKCAST:
            return "checkcast";
        case Opcode::INSTANCEOF:
            return "instanceof";
        case Opcode::MULTIANEWARRAY:
            return "multianewarray";
        default:
            return "op";
    }
}

} // namespace apicheck::classfile
