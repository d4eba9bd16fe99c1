#ifndef BASTION_FILE_FORMAT_SIGNATURE_HPP
#define BASTION_FILE_FORMAT_SIGNATURE_HPP

#include "common/defs.hpp"
#include "common/format.hpp"
#include "common/hash.hpp"
#include "file_format/entities.hpp"

#include <string_view>
#include <vector>

namespace bastion {

/// Constrains the types that may be substituted for a generic type parameter.
enum class Kind : u8 {
    All,
    Resource,
    Copyable,
};

std::string_view to_string(Kind kind);

/// Represents the type of a signature token.
enum class SignatureTokenType : u8 {
    Bool,
    U8,
    U64,
    U128,
    Address,
    Signer,
    Vector,
    Struct,
    StructInstantiation,
    Reference,
    MutableReference,
    TypeParameter,
};

std::string_view to_string(SignatureTokenType type);

/// A single (possibly nested) type in a signature.
///
/// Vectors and references wrap exactly one inner token, struct instantiations
/// carry their type arguments. All other tokens are leaves.
class SignatureToken final {
public:
    static SignatureToken make_bool();
    static SignatureToken make_u8();
    static SignatureToken make_u64();
    static SignatureToken make_u128();
    static SignatureToken make_address();
    static SignatureToken make_signer();
    static SignatureToken make_vector(SignatureToken element);
    static SignatureToken make_struct(StructHandleIndex handle);
    static SignatureToken
    make_struct_instantiation(StructHandleIndex handle, std::vector<SignatureToken> type_args);
    static SignatureToken make_reference(SignatureToken inner);
    static SignatureToken make_mutable_reference(SignatureToken inner);
    static SignatureToken make_type_parameter(TypeParameterIndex index);

    SignatureTokenType type() const noexcept { return type_; }

    /// The referenced struct handle.
    /// \pre `type()` is `Struct` or `StructInstantiation`.
    StructHandleIndex struct_handle() const;

    /// The index of the referenced type parameter.
    /// \pre `type()` is `TypeParameter`.
    TypeParameterIndex type_parameter() const;

    /// The wrapped token.
    /// \pre `type()` is `Vector`, `Reference` or `MutableReference`.
    const SignatureToken& inner() const;

    /// The type arguments of a struct instantiation.
    /// \pre `type()` is `StructInstantiation`.
    const std::vector<SignatureToken>& type_arguments() const;

    void format(FormatStream& stream) const;

    void hash(Hasher& h) const;

private:
    explicit SignatureToken(SignatureTokenType type);

    friend bool operator==(const SignatureToken& lhs, const SignatureToken& rhs);

private:
    SignatureTokenType type_;
    StructHandleIndex struct_handle_;
    TypeParameterIndex type_parameter_ = 0;
    std::vector<SignatureToken> children_;
};

bool operator==(const SignatureToken& lhs, const SignatureToken& rhs);
bool operator!=(const SignatureToken& lhs, const SignatureToken& rhs);

/// An ordered list of types, e.g. function parameters or the type arguments of an instantiation.
struct Signature final {
    std::vector<SignatureToken> tokens;

    Signature() = default;

    explicit Signature(std::vector<SignatureToken> tokens_)
        : tokens(std::move(tokens_)) {}

    void format(FormatStream& stream) const;

    void hash(Hasher& h) const;
};

inline bool operator==(const Signature& lhs, const Signature& rhs) {
    return lhs.tokens == rhs.tokens;
}

inline bool operator!=(const Signature& lhs, const Signature& rhs) {
    return !(lhs == rhs);
}

} // namespace bastion

BASTION_ENABLE_FREE_TO_STRING(bastion::Kind)
BASTION_ENABLE_FREE_TO_STRING(bastion::SignatureTokenType)
BASTION_ENABLE_MEMBER_FORMAT(bastion::SignatureToken)
BASTION_ENABLE_MEMBER_FORMAT(bastion::Signature)

BASTION_ENABLE_MEMBER_HASH(bastion::SignatureToken)
BASTION_ENABLE_MEMBER_HASH(bastion::Signature)

#endif // BASTION_FILE_FORMAT_SIGNATURE_HPP
