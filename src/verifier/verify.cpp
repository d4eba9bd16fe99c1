#include "verifier/verify.hpp"

#include "common/error.hpp"
#include "verifier/check_duplication.hpp"

#include <fmt/format.h>

namespace bastion {

static void report(const VerifierSettings& settings, std::string_view message) {
    if (settings.print_diagnostic)
        settings.print_diagnostic(message);
}

static void check_table_sizes(const CompiledModule& module, const VerifierSettings& settings) {
    if (settings.max_table_size > CompiledModule::max_table_size) {
        BASTION_ERROR_WITH_CODE(BASTION_ERROR_BAD_ARG,
            "table size limit {} exceeds the maximum table size {}", settings.max_table_size,
            CompiledModule::max_table_size);
    }

    for (const auto kind : all_index_kinds) {
        const size_t size = module.table_size(kind);
        if (size > settings.max_table_size) {
            auto message = fmt::format("module rejected: {} table has {} entries (limit is {})",
                kind, size, settings.max_table_size);
            report(settings, message);
            BASTION_ERROR_WITH_CODE(BASTION_ERROR_MODULE_TOO_LARGE, "{}", message);
        }
    }
}

void verify_module(const CompiledModule& module, const VerifierSettings& settings) {
    check_table_sizes(module, settings);

    if (auto violation = check_duplication(module)) {
        auto message = fmt::format("module rejected: {}", *violation);
        report(settings, message);
        throw VerifyError(*violation, std::move(message));
    }
}

} // namespace bastion
