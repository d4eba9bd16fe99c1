#include "verifier/status.hpp"

#include "common/assert.hpp"

namespace bastion {

std::string_view to_string(StatusCode status) {
    switch (status) {
    case StatusCode::DuplicateElement:
        return "DuplicateElement";
    case StatusCode::DuplicateAcquiresAnnotation:
        return "DuplicateAcquiresAnnotation";
    case StatusCode::ZeroSizedStruct:
        return "ZeroSizedStruct";
    case StatusCode::InvalidModuleOwner:
        return "InvalidModuleOwner";
    case StatusCode::UnimplementedHandle:
        return "UnimplementedHandle";
    }
    BASTION_UNREACHABLE("Invalid StatusCode.");
}

void VerificationError::format(FormatStream& stream) const {
    stream.format("{} at {}[{}]", status, kind, index);
}

bool operator==(const VerificationError& lhs, const VerificationError& rhs) {
    return lhs.kind == rhs.kind && lhs.index == rhs.index && lhs.status == rhs.status;
}

bool operator!=(const VerificationError& lhs, const VerificationError& rhs) {
    return !(lhs == rhs);
}

VerifyError::VerifyError(const VerificationError& violation, std::string message)
    : Error(BASTION_ERROR_BAD_MODULE, std::move(message))
    , violation_(violation) {}

} // namespace bastion
