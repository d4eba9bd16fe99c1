#include "verifier/check_duplication.hpp"

#include "common/ranges/find_duplicate.hpp"

#include "absl/container/flat_hash_set.h"

#include <fmt/format.h>

#include <tuple>

// #define BASTION_TRACE_DUPLICATION

#ifdef BASTION_TRACE_DUPLICATION
#    define BASTION_TRACE(...) fmt::print("duplication checker: " __VA_ARGS__)
#else
#    define BASTION_TRACE(...)
#endif

namespace bastion {

namespace {

class DuplicationChecker final {
public:
    explicit DuplicationChecker(const CompiledModule& module)
        : module_(module) {}

    std::optional<VerificationError> check();

private:
    using CheckResult = std::optional<VerificationError>;

    CheckResult check_tables();
    CheckResult check_acquires();
    CheckResult check_fields();
    CheckResult check_struct_owners();
    CheckResult check_function_owners();
    CheckResult check_struct_totality();
    CheckResult check_function_totality();

    bool is_self(ModuleHandleIndex module) const {
        return module && module == module_.self_handle();
    }

    template<typename Table, typename KeyFunc>
    static CheckResult unique_entries(IndexKind kind, const Table& table, KeyFunc&& key_of) {
        if (auto index = find_duplicate(table, key_of))
            return VerificationError(kind, *index, StatusCode::DuplicateElement);
        return {};
    }

    template<typename Table>
    static CheckResult unique_entries(IndexKind kind, const Table& table) {
        if (auto index = find_duplicate(table))
            return VerificationError(kind, *index, StatusCode::DuplicateElement);
        return {};
    }

private:
    const CompiledModule& module_;
};

} // namespace

std::optional<VerificationError> DuplicationChecker::check() {
    using Check = CheckResult (DuplicationChecker::*)();

    // Later checks rely on the handle and definition tables being free of duplicates.
    static constexpr Check checks[] = {
        &DuplicationChecker::check_tables,
        &DuplicationChecker::check_acquires,
        &DuplicationChecker::check_fields,
        &DuplicationChecker::check_struct_owners,
        &DuplicationChecker::check_function_owners,
        &DuplicationChecker::check_struct_totality,
        &DuplicationChecker::check_function_totality,
    };

    for (const auto& check : checks) {
        if (auto error = (this->*check)())
            return error;
    }
    return {};
}

DuplicationChecker::CheckResult DuplicationChecker::check_tables() {
    BASTION_TRACE("checking tables for duplicate entries\n");

    const auto& m = module_;
    if (auto err = unique_entries(IndexKind::Identifier, m.identifiers()))
        return err;
    if (auto err = unique_entries(IndexKind::ConstantPool, m.constant_pool()))
        return err;
    if (auto err = unique_entries(IndexKind::Signature, m.signatures()))
        return err;
    if (auto err = unique_entries(IndexKind::ModuleHandle, m.module_handles()))
        return err;

    // Handles are identified by their owning module and their name only.
    if (auto err = unique_entries(IndexKind::StructHandle, m.struct_handles(),
            [](const StructHandle& h) { return std::tuple(h.module, h.name); }))
        return err;
    if (auto err = unique_entries(IndexKind::FunctionHandle, m.function_handles(),
            [](const FunctionHandle& h) { return std::tuple(h.module, h.name); }))
        return err;

    if (auto err = unique_entries(IndexKind::FieldHandle, m.field_handles()))
        return err;
    if (auto err = unique_entries(IndexKind::StructDefInstantiation, m.struct_instantiations()))
        return err;
    if (auto err = unique_entries(IndexKind::FunctionInstantiation, m.function_instantiations()))
        return err;
    if (auto err = unique_entries(IndexKind::FieldInstantiation, m.field_instantiations()))
        return err;

    // At most one definition per handle.
    if (auto err = unique_entries(IndexKind::StructDefinition, m.struct_defs(),
            [](const StructDefinition& def) { return def.struct_handle; }))
        return err;
    if (auto err = unique_entries(IndexKind::FunctionDefinition, m.function_defs(),
            [](const FunctionDefinition& def) { return def.function; }))
        return err;

    return {};
}

DuplicationChecker::CheckResult DuplicationChecker::check_acquires() {
    BASTION_TRACE("checking acquires annotations\n");

    size_t index = 0;
    for (const auto& def : module_.function_defs()) {
        if (find_duplicate(def.acquires_global_resources)) {
            return VerificationError(
                IndexKind::FunctionDefinition, index, StatusCode::DuplicateAcquiresAnnotation);
        }
        ++index;
    }
    return {};
}

DuplicationChecker::CheckResult DuplicationChecker::check_fields() {
    BASTION_TRACE("checking struct fields\n");

    size_t index = 0;
    for (const auto& def : module_.struct_defs()) {
        const auto current = index++;

        const auto& info = def.field_information;
        if (info.is_native())
            continue;

        const auto& fields = info.fields();
        if (fields.empty())
            return VerificationError(
                IndexKind::StructDefinition, current, StatusCode::ZeroSizedStruct);

        // The reported index is the field's position within its struct.
        if (auto field_index = find_duplicate(
                fields, [](const FieldDefinition& field) { return field.name; })) {
            return VerificationError(
                IndexKind::FieldDefinition, *field_index, StatusCode::DuplicateElement);
        }
    }
    return {};
}

DuplicationChecker::CheckResult DuplicationChecker::check_struct_owners() {
    BASTION_TRACE("checking owners of struct definitions\n");

    size_t index = 0;
    for (const auto& def : module_.struct_defs()) {
        if (!is_self(module_.struct_handle(def.struct_handle).module))
            return VerificationError(
                IndexKind::StructDefinition, index, StatusCode::InvalidModuleOwner);
        ++index;
    }
    return {};
}

DuplicationChecker::CheckResult DuplicationChecker::check_function_owners() {
    BASTION_TRACE("checking owners of function definitions\n");

    size_t index = 0;
    for (const auto& def : module_.function_defs()) {
        if (!is_self(module_.function_handle(def.function).module))
            return VerificationError(
                IndexKind::FunctionDefinition, index, StatusCode::InvalidModuleOwner);
        ++index;
    }
    return {};
}

DuplicationChecker::CheckResult DuplicationChecker::check_struct_totality() {
    BASTION_TRACE("checking that all struct handles of the self module are implemented\n");

    // Positions of the handles that have a definition.
    absl::flat_hash_set<size_t> implemented;
    implemented.reserve(module_.struct_defs().size());
    for (const auto& def : module_.struct_defs())
        implemented.insert(def.struct_handle.value());

    size_t index = 0;
    for (const auto& handle : module_.struct_handles()) {
        if (is_self(handle.module) && !implemented.contains(index))
            return VerificationError(
                IndexKind::StructHandle, index, StatusCode::UnimplementedHandle);
        ++index;
    }
    return {};
}

DuplicationChecker::CheckResult DuplicationChecker::check_function_totality() {
    BASTION_TRACE("checking that all function handles of the self module are implemented\n");

    absl::flat_hash_set<size_t> implemented;
    implemented.reserve(module_.function_defs().size());
    for (const auto& def : module_.function_defs())
        implemented.insert(def.function.value());

    size_t index = 0;
    for (const auto& handle : module_.function_handles()) {
        if (is_self(handle.module) && !implemented.contains(index))
            return VerificationError(
                IndexKind::FunctionHandle, index, StatusCode::UnimplementedHandle);
        ++index;
    }
    return {};
}

std::optional<VerificationError> check_duplication(const CompiledModule& module) {
    DuplicationChecker checker(module);
    return checker.check();
}

} // namespace bastion
