#include "file_format/module.hpp"

#include "common/assert.hpp"
#include "common/error.hpp"

#include <algorithm>

namespace bastion {

void Constant::hash(Hasher& h) const {
    h.append(type, data);
}

bool operator==(const Constant& lhs, const Constant& rhs) {
    return lhs.type == rhs.type && lhs.data == rhs.data;
}

bool operator!=(const Constant& lhs, const Constant& rhs) {
    return !(lhs == rhs);
}

void ModuleHandle::format(FormatStream& stream) const {
    stream.format("ModuleHandle(0x");
    for (byte b : address)
        stream.format("{:02x}", b);
    stream.format(", {})", name);
}

void ModuleHandle::hash(Hasher& h) const {
    h.append(address, name);
}

bool operator==(const ModuleHandle& lhs, const ModuleHandle& rhs) {
    return lhs.address == rhs.address && lhs.name == rhs.name;
}

bool operator!=(const ModuleHandle& lhs, const ModuleHandle& rhs) {
    return !(lhs == rhs);
}

void FieldHandle::hash(Hasher& h) const {
    h.append(owner, field);
}

bool operator==(const FieldHandle& lhs, const FieldHandle& rhs) {
    return lhs.owner == rhs.owner && lhs.field == rhs.field;
}

bool operator!=(const FieldHandle& lhs, const FieldHandle& rhs) {
    return !(lhs == rhs);
}

void StructDefInstantiation::hash(Hasher& h) const {
    h.append(def, type_parameters);
}

bool operator==(const StructDefInstantiation& lhs, const StructDefInstantiation& rhs) {
    return lhs.def == rhs.def && lhs.type_parameters == rhs.type_parameters;
}

bool operator!=(const StructDefInstantiation& lhs, const StructDefInstantiation& rhs) {
    return !(lhs == rhs);
}

void FunctionInstantiation::hash(Hasher& h) const {
    h.append(handle, type_parameters);
}

bool operator==(const FunctionInstantiation& lhs, const FunctionInstantiation& rhs) {
    return lhs.handle == rhs.handle && lhs.type_parameters == rhs.type_parameters;
}

bool operator!=(const FunctionInstantiation& lhs, const FunctionInstantiation& rhs) {
    return !(lhs == rhs);
}

void FieldInstantiation::hash(Hasher& h) const {
    h.append(handle, type_parameters);
}

bool operator==(const FieldInstantiation& lhs, const FieldInstantiation& rhs) {
    return lhs.handle == rhs.handle && lhs.type_parameters == rhs.type_parameters;
}

bool operator!=(const FieldInstantiation& lhs, const FieldInstantiation& rhs) {
    return !(lhs == rhs);
}

StructFieldInformation StructFieldInformation::make_native() {
    return StructFieldInformation(true, {});
}

StructFieldInformation StructFieldInformation::make_declared(std::vector<FieldDefinition> fields) {
    return StructFieldInformation(false, std::move(fields));
}

StructFieldInformation::StructFieldInformation(bool native, std::vector<FieldDefinition> fields)
    : native_(native)
    , fields_(std::move(fields)) {}

const std::vector<FieldDefinition>& StructFieldInformation::fields() const {
    BASTION_DEBUG_ASSERT(!native_, "Native structs do not declare fields.");
    return fields_;
}

CompiledModule::CompiledModule() {}

CompiledModule::~CompiledModule() {}

const ModuleHandle& CompiledModule::module_handle(ModuleHandleIndex index) const {
    auto handle = module_handles_.try_get(index);
    if (!handle) {
        BASTION_ERROR_WITH_CODE(BASTION_ERROR_OUT_OF_BOUNDS,
            "{} is out of bounds (table size {})", index, module_handles_.size());
    }
    return *handle;
}

const StructHandle& CompiledModule::struct_handle(StructHandleIndex index) const {
    auto handle = struct_handles_.try_get(index);
    if (!handle) {
        BASTION_ERROR_WITH_CODE(BASTION_ERROR_OUT_OF_BOUNDS,
            "{} is out of bounds (table size {})", index, struct_handles_.size());
    }
    return *handle;
}

const FunctionHandle& CompiledModule::function_handle(FunctionHandleIndex index) const {
    auto handle = function_handles_.try_get(index);
    if (!handle) {
        BASTION_ERROR_WITH_CODE(BASTION_ERROR_OUT_OF_BOUNDS,
            "{} is out of bounds (table size {})", index, function_handles_.size());
    }
    return *handle;
}

size_t CompiledModule::table_size(IndexKind kind) const {
    switch (kind) {
    case IndexKind::Identifier:
        return identifiers_.size();
    case IndexKind::ConstantPool:
        return constant_pool_.size();
    case IndexKind::Signature:
        return signatures_.size();
    case IndexKind::ModuleHandle:
        return module_handles_.size();
    case IndexKind::StructHandle:
        return struct_handles_.size();
    case IndexKind::FunctionHandle:
        return function_handles_.size();
    case IndexKind::FieldHandle:
        return field_handles_.size();
    case IndexKind::StructDefInstantiation:
        return struct_instantiations_.size();
    case IndexKind::FunctionInstantiation:
        return function_instantiations_.size();
    case IndexKind::FieldInstantiation:
        return field_instantiations_.size();
    case IndexKind::StructDefinition:
        return struct_defs_.size();
    case IndexKind::FunctionDefinition:
        return function_defs_.size();
    case IndexKind::FieldDefinition: {
        size_t max_fields = 0;
        for (const auto& def : struct_defs_) {
            if (!def.field_information.is_native())
                max_fields = std::max(max_fields, def.field_information.fields().size());
        }
        return max_fields;
    }
    }
    BASTION_UNREACHABLE("Invalid IndexKind.");
}

} // namespace bastion
