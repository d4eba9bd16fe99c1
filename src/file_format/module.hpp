#ifndef BASTION_FILE_FORMAT_MODULE_HPP
#define BASTION_FILE_FORMAT_MODULE_HPP

#include "common/defs.hpp"
#include "common/entities/entity_storage.hpp"
#include "common/format.hpp"
#include "common/hash.hpp"
#include "file_format/entities.hpp"
#include "file_format/index_kind.hpp"
#include "file_format/signature.hpp"

#include <array>
#include <optional>
#include <string>
#include <vector>

namespace bastion {

/// Raw account address that a module is published under.
using AccountAddress = std::array<byte, 16>;

/// An interned name, e.g. of a module, struct, function or field.
using Identifier = std::string;

/// A literal constant: its type and the serialized value.
struct Constant final {
    SignatureToken type;
    std::vector<byte> data;

    void hash(Hasher& h) const;
};

bool operator==(const Constant& lhs, const Constant& rhs);
bool operator!=(const Constant& lhs, const Constant& rhs);

/// References a module, either this one or an import.
struct ModuleHandle final {
    AccountAddress address{};
    IdentifierIndex name;

    void format(FormatStream& stream) const;
    void hash(Hasher& h) const;
};

bool operator==(const ModuleHandle& lhs, const ModuleHandle& rhs);
bool operator!=(const ModuleHandle& lhs, const ModuleHandle& rhs);

/// References a struct type declared by some module.
/// Only `module` and `name` identify the struct.
struct StructHandle final {
    ModuleHandleIndex module;
    IdentifierIndex name;
    bool is_nominal_resource = false;
    std::vector<Kind> type_parameters;
};

/// References a function declared by some module.
/// Only `module` and `name` identify the function.
struct FunctionHandle final {
    ModuleHandleIndex module;
    IdentifierIndex name;
    SignatureIndex parameters;
    SignatureIndex return_;
    std::vector<Kind> type_parameters;
};

/// References a field of a struct defined in this module.
struct FieldHandle final {
    StructDefinitionIndex owner;
    MemberCount field = 0;

    void hash(Hasher& h) const;
};

bool operator==(const FieldHandle& lhs, const FieldHandle& rhs);
bool operator!=(const FieldHandle& lhs, const FieldHandle& rhs);

/// A generic struct definition applied to concrete type arguments.
struct StructDefInstantiation final {
    StructDefinitionIndex def;
    SignatureIndex type_parameters;

    void hash(Hasher& h) const;
};

bool operator==(const StructDefInstantiation& lhs, const StructDefInstantiation& rhs);
bool operator!=(const StructDefInstantiation& lhs, const StructDefInstantiation& rhs);

/// A generic function applied to concrete type arguments.
struct FunctionInstantiation final {
    FunctionHandleIndex handle;
    SignatureIndex type_parameters;

    void hash(Hasher& h) const;
};

bool operator==(const FunctionInstantiation& lhs, const FunctionInstantiation& rhs);
bool operator!=(const FunctionInstantiation& lhs, const FunctionInstantiation& rhs);

/// A field of a generic struct applied to concrete type arguments.
struct FieldInstantiation final {
    FieldHandleIndex handle;
    SignatureIndex type_parameters;

    void hash(Hasher& h) const;
};

bool operator==(const FieldInstantiation& lhs, const FieldInstantiation& rhs);
bool operator!=(const FieldInstantiation& lhs, const FieldInstantiation& rhs);

/// A field declared by a struct definition.
struct FieldDefinition final {
    IdentifierIndex name;
    SignatureToken signature;
};

/// The body of a struct definition. Native structs have no declared fields.
class StructFieldInformation final {
public:
    static StructFieldInformation make_native();
    static StructFieldInformation make_declared(std::vector<FieldDefinition> fields);

    bool is_native() const noexcept { return native_; }

    /// The declared fields, in declaration order.
    /// \pre `!is_native()`.
    const std::vector<FieldDefinition>& fields() const;

private:
    StructFieldInformation(bool native, std::vector<FieldDefinition> fields);

private:
    bool native_;
    std::vector<FieldDefinition> fields_;
};

/// The definition of a struct declared by this module.
struct StructDefinition final {
    StructHandleIndex struct_handle;
    StructFieldInformation field_information;
};

/// Bytecode of a non-native function. The code is opaque at this level.
struct CodeUnit final {
    SignatureIndex locals;
    std::vector<byte> code;
};

/// The definition of a function declared by this module.
struct FunctionDefinition final {
    FunctionHandleIndex function;
    bool is_public = false;

    /// Struct definitions whose global instances this function may access.
    std::vector<StructDefinitionIndex> acquires_global_resources;

    /// Empty for native functions.
    std::optional<CodeUnit> code;

    bool is_native() const { return !code; }
};

/// The in-memory representation of a deserialized module.
///
/// Every table is addressed with its own index type. The module handle
/// returned by `self_handle()` designates the module itself; all other
/// module handles refer to imports.
class CompiledModule final {
public:
    /// Maximum number of entries in a single table.
    static constexpr size_t max_table_size = EntityStorage<Identifier, IdentifierIndex>::max_size;

    CompiledModule();
    ~CompiledModule();

    CompiledModule(CompiledModule&&) noexcept = default;
    CompiledModule& operator=(CompiledModule&&) noexcept = default;

    CompiledModule(const CompiledModule&) = default;
    CompiledModule& operator=(const CompiledModule&) = default;

    /// Index of the module handle that represents this module.
    ModuleHandleIndex self_handle() const { return self_handle_; }
    void self_handle(ModuleHandleIndex handle) { self_handle_ = handle; }

    // clang-format off
    auto& identifiers() { return identifiers_; }
    const auto& identifiers() const { return identifiers_; }

    auto& constant_pool() { return constant_pool_; }
    const auto& constant_pool() const { return constant_pool_; }

    auto& signatures() { return signatures_; }
    const auto& signatures() const { return signatures_; }

    auto& module_handles() { return module_handles_; }
    const auto& module_handles() const { return module_handles_; }

    auto& struct_handles() { return struct_handles_; }
    const auto& struct_handles() const { return struct_handles_; }

    auto& function_handles() { return function_handles_; }
    const auto& function_handles() const { return function_handles_; }

    auto& field_handles() { return field_handles_; }
    const auto& field_handles() const { return field_handles_; }

    auto& struct_instantiations() { return struct_instantiations_; }
    const auto& struct_instantiations() const { return struct_instantiations_; }

    auto& function_instantiations() { return function_instantiations_; }
    const auto& function_instantiations() const { return function_instantiations_; }

    auto& field_instantiations() { return field_instantiations_; }
    const auto& field_instantiations() const { return field_instantiations_; }

    auto& struct_defs() { return struct_defs_; }
    const auto& struct_defs() const { return struct_defs_; }

    auto& function_defs() { return function_defs_; }
    const auto& function_defs() const { return function_defs_; }
    // clang-format on

    /// Bounds checked table lookups. Throw an `Error` with code `BASTION_ERROR_OUT_OF_BOUNDS`
    /// if the index does not resolve.
    const ModuleHandle& module_handle(ModuleHandleIndex index) const;
    const StructHandle& struct_handle(StructHandleIndex index) const;
    const FunctionHandle& function_handle(FunctionHandleIndex index) const;

    /// Returns the number of entries in the given table. For `IndexKind::FieldDefinition`,
    /// returns the largest number of fields declared by a single struct definition.
    size_t table_size(IndexKind kind) const;

private:
    ModuleHandleIndex self_handle_;
    EntityStorage<Identifier, IdentifierIndex> identifiers_;
    EntityStorage<Constant, ConstantPoolIndex> constant_pool_;
    EntityStorage<Signature, SignatureIndex> signatures_;
    EntityStorage<ModuleHandle, ModuleHandleIndex> module_handles_;
    EntityStorage<StructHandle, StructHandleIndex> struct_handles_;
    EntityStorage<FunctionHandle, FunctionHandleIndex> function_handles_;
    EntityStorage<FieldHandle, FieldHandleIndex> field_handles_;
    EntityStorage<StructDefInstantiation, StructDefInstantiationIndex> struct_instantiations_;
    EntityStorage<FunctionInstantiation, FunctionInstantiationIndex> function_instantiations_;
    EntityStorage<FieldInstantiation, FieldInstantiationIndex> field_instantiations_;
    EntityStorage<StructDefinition, StructDefinitionIndex> struct_defs_;
    EntityStorage<FunctionDefinition, FunctionDefinitionIndex> function_defs_;
};

} // namespace bastion

BASTION_ENABLE_MEMBER_FORMAT(bastion::ModuleHandle)

BASTION_ENABLE_MEMBER_HASH(bastion::Constant)
BASTION_ENABLE_MEMBER_HASH(bastion::ModuleHandle)
BASTION_ENABLE_MEMBER_HASH(bastion::FieldHandle)
BASTION_ENABLE_MEMBER_HASH(bastion::StructDefInstantiation)
BASTION_ENABLE_MEMBER_HASH(bastion::FunctionInstantiation)
BASTION_ENABLE_MEMBER_HASH(bastion::FieldInstantiation)

#endif // BASTION_FILE_FORMAT_MODULE_HPP
