#ifndef BASTION_VERIFIER_VERIFY_HPP
#define BASTION_VERIFIER_VERIFY_HPP

#include "file_format/module.hpp"
#include "verifier/status.hpp"

#include <functional>
#include <string_view>

namespace bastion {

struct VerifierSettings {
    /// Modules with a table that has more entries than this are rejected before
    /// any structural check runs. Must not exceed `CompiledModule::max_table_size`.
    size_t max_table_size = CompiledModule::max_table_size;

    /// Receives one line for every rejected module. Nothing is reported if empty.
    std::function<void(std::string_view message)> print_diagnostic;
};

/// Verifies the module's structure with static checks before it is handed to later
/// verification stages. Returns normally if the module is accepted.
///
/// Throws a `VerifyError` (code `BASTION_ERROR_BAD_MODULE`) carrying the first structural
/// defect, or an `Error` with code `BASTION_ERROR_MODULE_TOO_LARGE` if a table exceeds
/// `settings.max_table_size`.
void verify_module(const CompiledModule& module, const VerifierSettings& settings = {});

} // namespace bastion

#endif // BASTION_VERIFIER_VERIFY_HPP
