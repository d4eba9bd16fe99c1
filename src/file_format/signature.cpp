#include "file_format/signature.hpp"

#include "common/assert.hpp"

namespace bastion {

std::string_view to_string(Kind kind) {
    switch (kind) {
    case Kind::All:
        return "All";
    case Kind::Resource:
        return "Resource";
    case Kind::Copyable:
        return "Copyable";
    }
    BASTION_UNREACHABLE("Invalid Kind.");
}

std::string_view to_string(SignatureTokenType type) {
    switch (type) {
    case SignatureTokenType::Bool:
        return "Bool";
    case SignatureTokenType::U8:
        return "U8";
    case SignatureTokenType::U64:
        return "U64";
    case SignatureTokenType::U128:
        return "U128";
    case SignatureTokenType::Address:
        return "Address";
    case SignatureTokenType::Signer:
        return "Signer";
    case SignatureTokenType::Vector:
        return "Vector";
    case SignatureTokenType::Struct:
        return "Struct";
    case SignatureTokenType::StructInstantiation:
        return "StructInstantiation";
    case SignatureTokenType::Reference:
        return "Reference";
    case SignatureTokenType::MutableReference:
        return "MutableReference";
    case SignatureTokenType::TypeParameter:
        return "TypeParameter";
    }
    BASTION_UNREACHABLE("Invalid SignatureTokenType.");
}

SignatureToken SignatureToken::make_bool() {
    return SignatureToken(SignatureTokenType::Bool);
}

SignatureToken SignatureToken::make_u8() {
    return SignatureToken(SignatureTokenType::U8);
}

SignatureToken SignatureToken::make_u64() {
    return SignatureToken(SignatureTokenType::U64);
}

SignatureToken SignatureToken::make_u128() {
    return SignatureToken(SignatureTokenType::U128);
}

SignatureToken SignatureToken::make_address() {
    return SignatureToken(SignatureTokenType::Address);
}

SignatureToken SignatureToken::make_signer() {
    return SignatureToken(SignatureTokenType::Signer);
}

SignatureToken SignatureToken::make_vector(SignatureToken element) {
    SignatureToken token(SignatureTokenType::Vector);
    token.children_.push_back(std::move(element));
    return token;
}

SignatureToken SignatureToken::make_struct(StructHandleIndex handle) {
    SignatureToken token(SignatureTokenType::Struct);
    token.struct_handle_ = handle;
    return token;
}

SignatureToken SignatureToken::make_struct_instantiation(
    StructHandleIndex handle, std::vector<SignatureToken> type_args) {
    SignatureToken token(SignatureTokenType::StructInstantiation);
    token.struct_handle_ = handle;
    token.children_ = std::move(type_args);
    return token;
}

SignatureToken SignatureToken::make_reference(SignatureToken inner) {
    SignatureToken token(SignatureTokenType::Reference);
    token.children_.push_back(std::move(inner));
    return token;
}

SignatureToken SignatureToken::make_mutable_reference(SignatureToken inner) {
    SignatureToken token(SignatureTokenType::MutableReference);
    token.children_.push_back(std::move(inner));
    return token;
}

SignatureToken SignatureToken::make_type_parameter(TypeParameterIndex index) {
    SignatureToken token(SignatureTokenType::TypeParameter);
    token.type_parameter_ = index;
    return token;
}

SignatureToken::SignatureToken(SignatureTokenType type)
    : type_(type) {}

StructHandleIndex SignatureToken::struct_handle() const {
    BASTION_DEBUG_ASSERT(
        type_ == SignatureTokenType::Struct || type_ == SignatureTokenType::StructInstantiation,
        "Bad member access on SignatureToken: not a struct type.");
    return struct_handle_;
}

TypeParameterIndex SignatureToken::type_parameter() const {
    BASTION_DEBUG_ASSERT(type_ == SignatureTokenType::TypeParameter,
        "Bad member access on SignatureToken: not a TypeParameter.");
    return type_parameter_;
}

const SignatureToken& SignatureToken::inner() const {
    BASTION_DEBUG_ASSERT(type_ == SignatureTokenType::Vector
                             || type_ == SignatureTokenType::Reference
                             || type_ == SignatureTokenType::MutableReference,
        "Bad member access on SignatureToken: token has no inner type.");
    BASTION_DEBUG_ASSERT(children_.size() == 1, "Wrapping tokens must have exactly one child.");
    return children_.front();
}

const std::vector<SignatureToken>& SignatureToken::type_arguments() const {
    BASTION_DEBUG_ASSERT(type_ == SignatureTokenType::StructInstantiation,
        "Bad member access on SignatureToken: not a StructInstantiation.");
    return children_;
}

void SignatureToken::format(FormatStream& stream) const {
    switch (type_) {
    case SignatureTokenType::Bool:
    case SignatureTokenType::U8:
    case SignatureTokenType::U64:
    case SignatureTokenType::U128:
    case SignatureTokenType::Address:
    case SignatureTokenType::Signer:
        stream.format("{}", type_);
        return;
    case SignatureTokenType::Vector:
        stream.format("Vector<{}>", inner());
        return;
    case SignatureTokenType::Struct:
        stream.format("Struct({})", struct_handle_);
        return;
    case SignatureTokenType::StructInstantiation: {
        stream.format("StructInstantiation({}, [", struct_handle_);
        bool first = true;
        for (const auto& arg : children_) {
            if (!first)
                stream.format(", ");
            stream.format("{}", arg);
            first = false;
        }
        stream.format("])");
        return;
    }
    case SignatureTokenType::Reference:
        stream.format("&{}", inner());
        return;
    case SignatureTokenType::MutableReference:
        stream.format("&mut {}", inner());
        return;
    case SignatureTokenType::TypeParameter:
        stream.format("TypeParameter({})", type_parameter_);
        return;
    }
    BASTION_UNREACHABLE("Invalid SignatureTokenType.");
}

void SignatureToken::hash(Hasher& h) const {
    h.append(type_, struct_handle_, type_parameter_, children_);
}

bool operator==(const SignatureToken& lhs, const SignatureToken& rhs) {
    return lhs.type_ == rhs.type_ && lhs.struct_handle_ == rhs.struct_handle_
           && lhs.type_parameter_ == rhs.type_parameter_ && lhs.children_ == rhs.children_;
}

bool operator!=(const SignatureToken& lhs, const SignatureToken& rhs) {
    return !(lhs == rhs);
}

void Signature::format(FormatStream& stream) const {
    stream.format("(");
    bool first = true;
    for (const auto& token : tokens) {
        if (!first)
            stream.format(", ");
        stream.format("{}", token);
        first = false;
    }
    stream.format(")");
}

void Signature::hash(Hasher& h) const {
    h.append(tokens);
}

} // namespace bastion
