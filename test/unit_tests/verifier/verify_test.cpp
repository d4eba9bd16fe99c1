#include <catch2/catch.hpp>

#include "verifier/verify.hpp"

#include "support/matchers.hpp"
#include "support/test_modules.hpp"

#include <string>
#include <vector>

namespace bastion::test {

using test_support::declared_struct;
using test_support::exception_contains_string;
using test_support::exception_matches_code;
using test_support::make_address;
using test_support::minimal_module;
using test_support::rejected_with;

TEST_CASE("verify_module accepts well formed modules", "[module-verify]") {
    std::vector<std::string> messages;
    VerifierSettings settings;
    settings.print_diagnostic = [&](std::string_view message) {
        messages.emplace_back(message);
    };

    auto m = minimal_module();
    REQUIRE_NOTHROW(verify_module(m.module, settings));
    REQUIRE_NOTHROW(verify_module(CompiledModule(), settings));
    REQUIRE(messages.empty());
}

TEST_CASE("verify_module throws the first structural defect", "[module-verify]") {
    auto m = minimal_module();
    m.module.struct_defs()[m.struct_def] = declared_struct(
        m.struct_handle, {m.field_name, m.field_name});

    std::vector<std::string> messages;
    VerifierSettings settings;
    settings.print_diagnostic = [&](std::string_view message) {
        messages.emplace_back(message);
    };

    REQUIRE_THROWS_MATCHES(verify_module(m.module, settings), VerifyError,
        rejected_with(IndexKind::FieldDefinition, 1, StatusCode::DuplicateElement));
    REQUIRE_THROWS_MATCHES(verify_module(m.module), VerifyError,
        exception_contains_string("DuplicateElement at FieldDefinition[1]"));

    REQUIRE(messages.size() == 1);
    REQUIRE(messages[0] == "module rejected: DuplicateElement at FieldDefinition[1]");
}

TEST_CASE("verify_module reports rejected modules as errors", "[module-verify]") {
    auto m = minimal_module();
    m.module.identifiers().push_back("M");

    REQUIRE_THROWS_MATCHES(
        verify_module(m.module), Error, exception_matches_code(BASTION_ERROR_BAD_MODULE));
    REQUIRE_THROWS_MATCHES(verify_module(m.module), VerifyError,
        rejected_with(IndexKind::Identifier, 4, StatusCode::DuplicateElement));
}

TEST_CASE("verify_module enforces the table size limit", "[module-verify]") {
    auto m = minimal_module();

    std::vector<std::string> messages;
    VerifierSettings settings;
    settings.print_diagnostic = [&](std::string_view message) {
        messages.emplace_back(message);
    };

    SECTION("tables at the limit are accepted") {
        settings.max_table_size = 4;
        REQUIRE_NOTHROW(verify_module(m.module, settings));
        REQUIRE(messages.empty());
    }

    SECTION("larger tables are rejected before any structural check") {
        // Also a duplicate, which must not be reported.
        m.module.identifiers().push_back("M");
        settings.max_table_size = 4;
        REQUIRE_THROWS_MATCHES(verify_module(m.module, settings), Error,
            exception_matches_code(BASTION_ERROR_MODULE_TOO_LARGE));
        REQUIRE(messages.size() == 1);
        REQUIRE(messages[0] == "module rejected: Identifier table has 5 entries (limit is 4)");
    }

    SECTION("the number of fields per struct is limited as well") {
        // Every table has at most four entries, but the struct declares five fields.
        CompiledModule mod;
        auto name = mod.identifiers().push_back("M");
        auto self = mod.module_handles().push_back(ModuleHandle{make_address(1), name});
        mod.self_handle(self);
        auto s = mod.struct_handles().push_back(StructHandle{self, name, false, {}});
        mod.struct_defs().push_back(declared_struct(s, {name, name, name, name, name}));

        settings.max_table_size = 4;
        REQUIRE_THROWS_MATCHES(verify_module(mod, settings), Error,
            exception_matches_code(BASTION_ERROR_MODULE_TOO_LARGE));
        REQUIRE(messages.size() == 1);
        REQUIRE(messages[0] == "module rejected: FieldDefinition table has 5 entries (limit is 4)");
    }
}

TEST_CASE("verify_module rejects invalid settings", "[module-verify]") {
    auto m = minimal_module();

    VerifierSettings settings;
    settings.max_table_size = CompiledModule::max_table_size + 1;
    REQUIRE_THROWS_MATCHES(
        verify_module(m.module, settings), Error, exception_matches_code(BASTION_ERROR_BAD_ARG));
}

TEST_CASE("verify_module propagates unresolved indices", "[module-verify]") {
    auto m = minimal_module();
    m.module.function_defs()[m.function_def].function = FunctionHandleIndex(7);

    REQUIRE_THROWS_MATCHES(
        verify_module(m.module), Error, exception_matches_code(BASTION_ERROR_OUT_OF_BOUNDS));
}

} // namespace bastion::test
