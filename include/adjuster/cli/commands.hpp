#pragma once

#include <adjuster/cli/options.hpp>
#include <adjuster/registry/claim_registry.hpp>
#include <ostream>

namespace adjuster::cli {

inline constexpr int kExitSuccess = 0;
inline constexpr int kExitRegistryFailure = 1;
inline constexpr int kExitUsage = 2;

/// Execute one parsed command against the registry. Results go to `out`,
/// failures are printed to `err` as "<ErrorName>: <reason>".
int run_command(const cli_options& options,
                adjuster::registry::claim_registry& registry,
                std::ostream& out,
                std::ostream& err);

}  // namespace adjuster::cli
