#include "file_format/index_kind.hpp"

#include "common/assert.hpp"

namespace bastion {

std::string_view to_string(IndexKind kind) {
    switch (kind) {
#define BASTION_CASE(X)  \
    case IndexKind::X: \
        return #X;

        BASTION_CASE(Identifier)
        BASTION_CASE(ConstantPool)
        BASTION_CASE(Signature)
        BASTION_CASE(ModuleHandle)
        BASTION_CASE(StructHandle)
        BASTION_CASE(FunctionHandle)
        BASTION_CASE(FieldHandle)
        BASTION_CASE(StructDefInstantiation)
        BASTION_CASE(FunctionInstantiation)
        BASTION_CASE(FieldInstantiation)
        BASTION_CASE(StructDefinition)
        BASTION_CASE(FunctionDefinition)
        BASTION_CASE(FieldDefinition)

#undef BASTION_CASE
    }
    BASTION_UNREACHABLE("Invalid IndexKind.");
}

} // namespace bastion
