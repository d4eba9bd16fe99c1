#ifndef BASTION_VERIFIER_STATUS_HPP
#define BASTION_VERIFIER_STATUS_HPP

#include "common/defs.hpp"
#include "common/error.hpp"
#include "common/format.hpp"
#include "file_format/index_kind.hpp"

#include <string_view>

namespace bastion {

/// The closed set of structural defects reported by the module checker.
enum class StatusCode : u8 {
    /// Two entries of a table (or two field names of a struct) are equal under the table's key.
    DuplicateElement,

    /// A function lists the same struct definition more than once in its acquires list.
    DuplicateAcquiresAnnotation,

    /// A non-native struct declares no fields.
    ZeroSizedStruct,

    /// A definition's handle is not owned by the self module.
    InvalidModuleOwner,

    /// A handle owned by the self module has no definition.
    UnimplementedHandle,
};

std::string_view to_string(StatusCode status);

/// Describes the first structural defect found in a module: the table that contains
/// the offending entry, the entry's position and the reason.
struct VerificationError final {
    IndexKind kind;
    size_t index;
    StatusCode status;

    VerificationError(IndexKind kind_, size_t index_, StatusCode status_)
        : kind(kind_)
        , index(index_)
        , status(status_) {}

    void format(FormatStream& stream) const;
};

bool operator==(const VerificationError& lhs, const VerificationError& rhs);
bool operator!=(const VerificationError& lhs, const VerificationError& rhs);

/// Thrown by `verify_module()` when a module is rejected.
/// The error code is always `BASTION_ERROR_BAD_MODULE`.
class VerifyError final : public virtual Error {
public:
    explicit VerifyError(const VerificationError& violation, std::string message);

    const VerificationError& violation() const noexcept { return violation_; }

private:
    VerificationError violation_;
};

} // namespace bastion

BASTION_ENABLE_FREE_TO_STRING(bastion::StatusCode)
BASTION_ENABLE_MEMBER_FORMAT(bastion::VerificationError)

#endif // BASTION_VERIFIER_STATUS_HPP
