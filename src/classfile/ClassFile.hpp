//===----------------------------------------------------------------------===//
//
// Part of the apicheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/classfile/ClassFile.hpp
// Purpose: In-memory model of one parsed JVM class file, reduced to what the
//          API scan needs: declarations, annotations, symbolic instructions,
//          exception handlers and line tables.
// Key invariants: Every name in the model is already resolved through the
//                 constant pool and validated by ClassReader; consumers never
//                 index the pool and therefore cannot fail.
// Ownership/Lifetime: ClassFile owns all strings and vectors; it is created by
//                     ClassReader and read-only afterwards.
// Links: classfile/ClassReader.hpp, check/ClassScanner.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "classfile/LineTable.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace apicheck::classfile
{

/// @brief Access flags used by the scan.
enum AccessFlags : uint16_t
{
    ACC_STATIC = 0x0008,
    ACC_INTERFACE = 0x0200,
    ACC_SYNTHETIC = 0x1000,
    ACC_ANNOTATION = 0x2000,
    ACC_ENUM = 0x4000
};

/// @brief One annotation with its string-valued elements flattened.
/// @details Only string constants matter for suppression; nested annotations,
///          enum and class values are parsed and dropped.
struct Annotation
{
    std::string type; ///< Field descriptor, e.g. "Landroid/annotation/SuppressLint;".
    std::vector<std::pair<std::string, std::vector<std::string>>> elements;

    /// @brief String values of element @p name, or nullptr when absent.
    [[nodiscard]] const std::vector<std::string> *values(const std::string &name) const;
};

/// @brief An instruction whose operand names a class, field or method.
struct SymbolicInstruction
{
    uint32_t offset = 0;    ///< Bytecode offset within the method.
    uint8_t opcode = 0;     ///< JVM opcode (see Opcodes.hpp).
    std::string owner;      ///< Class internal name (or array descriptor).
    std::string name;       ///< Member name; empty for class operands.
    std::string descriptor; ///< Member descriptor; empty for class operands.
};

/// @brief One exception-table row; empty @c catchType means catch-all.
struct ExceptionHandler
{
    uint16_t startPc = 0;
    uint16_t endPc = 0;
    uint16_t handlerPc = 0;
    std::string catchType;
};

/// @brief One LocalVariableTable row. Parameters (and @c this) start at 0.
struct LocalVariable
{
    uint16_t startPc = 0;
    uint16_t length = 0;
    std::string name;
    std::string descriptor; ///< Field descriptor of the declared type.
    uint16_t index = 0;     ///< Local slot.
};

struct CodeAttribute
{
    uint32_t codeLength = 0;
    std::vector<SymbolicInstruction> instructions; ///< In offset order.
    std::vector<ExceptionHandler> handlers;        ///< In table order.
    std::vector<LocalVariable> locals;             ///< Empty unless compiled with -g.
    LineTable lines;
};

/// @brief A field or method declaration.
struct MemberInfo
{
    uint16_t access = 0;
    std::string name;
    std::string descriptor;
    std::vector<Annotation> annotations; ///< Visible and invisible, in file order.
    std::optional<CodeAttribute> code;   ///< Methods with a body only.
};

/// @brief One InnerClasses attribute row.
struct InnerClassEntry
{
    std::string inner;     ///< Internal name of the nested class.
    std::string outer;     ///< Declaring class; empty for local/anonymous classes.
    std::string innerName; ///< Simple name; empty for anonymous classes.
    uint16_t access = 0;
};

/// @brief EnclosingMethod attribute of a local or anonymous class.
struct EnclosingMethodInfo
{
    std::string owner;      ///< Lexically enclosing class.
    std::string name;       ///< Enclosing method; empty for initializer blocks.
    std::string descriptor; ///< Enclosing method descriptor.
};

struct ClassFile
{
    uint16_t minorVersion = 0;
    uint16_t majorVersion = 0;
    uint16_t access = 0;
    std::string name;                    ///< This class, internal name.
    std::string superName;               ///< Empty only for java/lang/Object.
    std::vector<std::string> interfaces; ///< Declared interfaces, in order.
    std::vector<MemberInfo> fields;
    std::vector<MemberInfo> methods;
    std::vector<Annotation> annotations;
    std::string sourceFile; ///< SourceFile attribute; empty when stripped.
    std::vector<InnerClassEntry> innerClasses;
    std::optional<EnclosingMethodInfo> enclosingMethod;

    /// @brief Declared method with @p name and @p descriptor, or nullptr.
    [[nodiscard]] const MemberInfo *findMethod(const std::string &name,
                                               const std::string &descriptor) const;

    /// @brief Declared field named @p name, or nullptr.
    [[nodiscard]] const MemberInfo *findField(const std::string &name) const;

    /// @brief Lexically enclosing member class per InnerClasses, or empty.
    [[nodiscard]] std::string declaringClass() const;

    /// @brief Smallest source line of any method, or 0 without line info.
    /// @details javac places an implicit constructor on the class declaration
    ///          line, which makes this the best available declaration line.
    [[nodiscard]] uint32_t declarationLine() const;
};

} // namespace apicheck::classfile
