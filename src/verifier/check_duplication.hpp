#ifndef BASTION_VERIFIER_CHECK_DUPLICATION_HPP
#define BASTION_VERIFIER_CHECK_DUPLICATION_HPP

#include "file_format/module.hpp"
#include "verifier/status.hpp"

#include <optional>

namespace bastion {

/// Verifies that every table of the module contains distinct entries, so that an
/// index can be used to uniquely name the entry at that index. Additionally checks that
///
/// - acquires lists do not repeat a struct definition,
/// - non-native structs declare at least one field and their field names are distinct,
/// - the handles of all struct and function definitions are owned by the self module,
/// - every struct and function handle owned by the self module has a definition.
///
/// Checks run in a fixed order and stop at the first defect, which is returned.
/// Returns an empty optional if the module is consistent. The module is not modified.
///
/// \pre No table of the module holds more than `CompiledModule::max_table_size` entries.
///      Larger tables cannot be addressed by their index types, so positions reported for
///      them would be meaningless. `verify_module()` enforces this bound before calling
///      this function; other callers must enforce it themselves.
///
/// Throws an `Error` with code `BASTION_ERROR_OUT_OF_BOUNDS` if a definition references a
/// handle index that does not resolve.
std::optional<VerificationError> check_duplication(const CompiledModule& module);

} // namespace bastion

#endif // BASTION_VERIFIER_CHECK_DUPLICATION_HPP
