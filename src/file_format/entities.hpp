#ifndef BASTION_FILE_FORMAT_ENTITIES_HPP
#define BASTION_FILE_FORMAT_ENTITIES_HPP

#include "common/entities/entity_id.hpp"

namespace bastion {

// Table indices are 16 bit wide, as in the binary format.
BASTION_DEFINE_ENTITY_ID(IdentifierIndex, u16)
BASTION_DEFINE_ENTITY_ID(ConstantPoolIndex, u16)
BASTION_DEFINE_ENTITY_ID(SignatureIndex, u16)
BASTION_DEFINE_ENTITY_ID(ModuleHandleIndex, u16)
BASTION_DEFINE_ENTITY_ID(StructHandleIndex, u16)
BASTION_DEFINE_ENTITY_ID(FunctionHandleIndex, u16)
BASTION_DEFINE_ENTITY_ID(FieldHandleIndex, u16)
BASTION_DEFINE_ENTITY_ID(StructDefInstantiationIndex, u16)
BASTION_DEFINE_ENTITY_ID(FunctionInstantiationIndex, u16)
BASTION_DEFINE_ENTITY_ID(FieldInstantiationIndex, u16)
BASTION_DEFINE_ENTITY_ID(StructDefinitionIndex, u16)
BASTION_DEFINE_ENTITY_ID(FunctionDefinitionIndex, u16)

/// Index of a generic type parameter within its declaring handle.
using TypeParameterIndex = u16;

/// Position of a field within its struct definition.
using MemberCount = u16;

} // namespace bastion

#endif // BASTION_FILE_FORMAT_ENTITIES_HPP
