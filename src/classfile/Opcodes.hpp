//===----------------------------------------------------------------------===//
//
// Part of the apicheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/classfile/Opcodes.hpp
// Purpose: JVM opcodes whose operands the scan inspects, plus the instruction
//          length table needed to walk a method body.
// Key invariants: instructionLength() covers every defined opcode 0x00-0xC9;
//                 0xCA (breakpoint) and above are rejected.
// Ownership/Lifetime: Constants and free functions only.
// Links: https://docs.oracle.com/javase/specs/jvms/se17/html/jvms-6.html
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace apicheck::classfile
{

/// @brief Opcodes with constant-pool operands.
/// @details Only instructions that can name a platform element are listed;
///          the rest are skipped by length.
enum class Opcode : uint8_t
{
    LDC = 0x12,
    LDC_W = 0x13,
    LDC2_W = 0x14,
    IINC = 0x84,
    TABLESWITCH = 0xAA,
    LOOKUPSWITCH = 0xAB,
    GETSTATIC = 0xB2,
    PUTSTATIC = 0xB3,
    GETFIELD = 0xB4,
    PUTFIELD = 0xB5,
    INVOKEVIRTUAL = 0xB6,
    INVOKESPECIAL = 0xB7,
    INVOKESTATIC = 0xB8,
    INVOKEINTERFACE = 0xB9,
    INVOKEDYNAMIC = 0xBA,
    NEW = 0xBB,
    ANEWARRAY = 0xBD,
    CHECKCAST = 0xC0,
    INSTANCEOF = 0xC1,
    WIDE = 0xC4,
    MULTIANEWARRAY = 0xC5,
};

constexpr uint8_t toByte(Opcode op)
{
    return static_cast<uint8_t>(op);
}

/// @brief Length in bytes of the instruction starting at @p offset.
/// @param code Method body.
/// @param size Number of bytes in @p code.
/// @param offset Offset of the opcode byte; must be < @p size.
/// @return std::nullopt for an undefined opcode or an instruction whose
///         variable-length operands run past @p size.
std::optional<size_t> instructionLength(const uint8_t *code, size_t size, size_t offset);

/// @brief True for get/put static/field.
[[nodiscard]] bool isFieldAccess(uint8_t opcode);

/// @brief True for the invoke family except invokedynamic.
[[nodiscard]] bool isMethodInvoke(uint8_t opcode);

/// @brief True for opcodes whose operand is a Class constant.
[[nodiscard]] bool isClassOperand(uint8_t opcode);

/// @brief Mnemonic for trace output ("invokevirtual"); "op" for unlisted opcodes.
[[nodiscard]] std::string_view opcodeName(uint8_t opcode);

} // namespace apicheck::classfile
