#ifndef BASTION_FILE_FORMAT_INDEX_KIND_HPP
#define BASTION_FILE_FORMAT_INDEX_KIND_HPP

#include "common/defs.hpp"
#include "common/format.hpp"

#include <string_view>

namespace bastion {

/// Names the table (or, for field definitions, the per-struct list) that
/// an index points into.
enum class IndexKind : u8 {
    Identifier,
    ConstantPool,
    Signature,
    ModuleHandle,
    StructHandle,
    FunctionHandle,
    FieldHandle,
    StructDefInstantiation,
    FunctionInstantiation,
    FieldInstantiation,
    StructDefinition,
    FunctionDefinition,
    FieldDefinition,
};

/// All index kinds, in table order.
inline constexpr IndexKind all_index_kinds[] = {
    IndexKind::Identifier,
    IndexKind::ConstantPool,
    IndexKind::Signature,
    IndexKind::ModuleHandle,
    IndexKind::StructHandle,
    IndexKind::FunctionHandle,
    IndexKind::FieldHandle,
    IndexKind::StructDefInstantiation,
    IndexKind::FunctionInstantiation,
    IndexKind::FieldInstantiation,
    IndexKind::StructDefinition,
    IndexKind::FunctionDefinition,
    IndexKind::FieldDefinition,
};

std::string_view to_string(IndexKind kind);

} // namespace bastion

BASTION_ENABLE_FREE_TO_STRING(bastion::IndexKind)

#endif // BASTION_FILE_FORMAT_INDEX_KIND_HPP
