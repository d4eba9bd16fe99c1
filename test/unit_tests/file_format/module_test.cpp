#include <catch2/catch.hpp>

#include "file_format/module.hpp"

#include "support/matchers.hpp"
#include "support/test_modules.hpp"

namespace bastion::test {

using test_support::declared_struct;
using test_support::exception_matches_code;
using test_support::minimal_module;

TEST_CASE("Module tables report their sizes", "[module]") {
    auto m = minimal_module();
    const auto& mod = m.module;

    REQUIRE(mod.table_size(IndexKind::Identifier) == 4);
    REQUIRE(mod.table_size(IndexKind::ConstantPool) == 0);
    REQUIRE(mod.table_size(IndexKind::Signature) == 1);
    REQUIRE(mod.table_size(IndexKind::ModuleHandle) == 1);
    REQUIRE(mod.table_size(IndexKind::StructHandle) == 1);
    REQUIRE(mod.table_size(IndexKind::FunctionHandle) == 1);
    REQUIRE(mod.table_size(IndexKind::StructDefinition) == 1);
    REQUIRE(mod.table_size(IndexKind::FunctionDefinition) == 1);
    REQUIRE(mod.table_size(IndexKind::FieldDefinition) == 1);
}

TEST_CASE("Field definitions are counted per struct", "[module]") {
    auto m = minimal_module();
    auto& mod = m.module;

    auto y = mod.identifiers().push_back("y");
    auto z = mod.identifiers().push_back("z");
    mod.struct_defs().push_back(declared_struct(StructHandleIndex(1), {m.field_name, y, z}));
    mod.struct_defs().push_back(
        StructDefinition{StructHandleIndex(2), StructFieldInformation::make_native()});

    REQUIRE(mod.table_size(IndexKind::StructDefinition) == 3);
    REQUIRE(mod.table_size(IndexKind::FieldDefinition) == 3);
}

TEST_CASE("Module handle lookups are bounds checked", "[module]") {
    auto m = minimal_module();
    const auto& mod = m.module;

    REQUIRE(mod.module_handle(m.self).name == m.module_name);
    REQUIRE(mod.struct_handle(m.struct_handle).name == m.struct_name);
    REQUIRE(mod.function_handle(m.function_handle).name == m.function_name);

    REQUIRE_THROWS_MATCHES(mod.module_handle(ModuleHandleIndex(1)), Error,
        exception_matches_code(BASTION_ERROR_OUT_OF_BOUNDS));
    REQUIRE_THROWS_MATCHES(mod.struct_handle(StructHandleIndex()), Error,
        exception_matches_code(BASTION_ERROR_OUT_OF_BOUNDS));
    REQUIRE_THROWS_MATCHES(mod.function_handle(FunctionHandleIndex(9)), Error,
        exception_matches_code(BASTION_ERROR_OUT_OF_BOUNDS));
}

TEST_CASE("Native structs have no declared fields", "[module]") {
    auto native = StructFieldInformation::make_native();
    REQUIRE(native.is_native());

    auto declared = StructFieldInformation::make_declared({});
    REQUIRE_FALSE(declared.is_native());
    REQUIRE(declared.fields().empty());
}

TEST_CASE("Functions without code are native", "[module]") {
    FunctionDefinition def;
    REQUIRE(def.is_native());

    def.code = CodeUnit{SignatureIndex(0), {}};
    REQUIRE_FALSE(def.is_native());
}

} // namespace bastion::test
