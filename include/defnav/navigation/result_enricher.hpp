#pragma once

#include <optional>

#include "defnav/analysis/package.hpp"
#include "defnav/core/request_context.hpp"
#include "defnav/error/error.hpp"
#include "defnav/navigation/package_cache.hpp"
#include "defnav/navigation/position_resolver.hpp"
#include "defnav/utils/canonical_path.hpp"
#include "lsp/navigation.hpp"

namespace defnav::navigation {

// Outcome of best-effort enrichment. Exactly one of the two is set.
struct EnrichmentResult {
  std::optional<lsp::SymbolDescriptor> descriptor;

  // Why the descriptor is missing
  std::optional<NavError> diagnostic;
};

// Computes definition info for the node chain and describes the symbol
// declared at declaration_pos. Never fails: any error, including
// cancellation, is reported through the diagnostic.
auto Enrich(
    const RequestContext& ctx, const analysis::Package& package,
    const PathNodes& path_nodes, analysis::Pos declaration_pos,
    const CanonicalPath& root, const PackageCache& cache,
    const FindPackageFunc& find_package) -> EnrichmentResult;

}  // namespace defnav::navigation
