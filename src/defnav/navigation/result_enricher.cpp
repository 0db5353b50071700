#include "defnav/navigation/result_enricher.hpp"

#include <utility>

#include "defnav/navigation/definition_info.hpp"
#include "defnav/navigation/symbol_descriptor.hpp"

namespace defnav::navigation {

auto Enrich(
    const RequestContext& ctx, const analysis::Package& package,
    const PathNodes& path_nodes, analysis::Pos declaration_pos,
    const CanonicalPath& root, const PackageCache& cache,
    const FindPackageFunc& find_package) -> EnrichmentResult {
  if (ctx.IsCancelled()) {
    return EnrichmentResult{
        .descriptor = std::nullopt,
        .diagnostic = NavError::Make(NavErrorCode::kCancelled)};
  }

  auto info = ComputeDefinitionInfo(package, path_nodes, declaration_pos);
  if (!info) {
    return EnrichmentResult{
        .descriptor = std::nullopt, .diagnostic = std::move(info.error())};
  }

  if (!find_package) {
    return EnrichmentResult{
        .descriptor = std::nullopt,
        .diagnostic = NavError::Make(
            NavErrorCode::kInternalError, "no package lookup configured")};
  }

  auto descriptor =
      DescribeSymbol(ctx, package, cache, root, *info, find_package);
  if (!descriptor) {
    return EnrichmentResult{
        .descriptor = std::nullopt,
        .diagnostic = std::move(descriptor.error())};
  }

  return EnrichmentResult{
      .descriptor = std::move(*descriptor), .diagnostic = std::nullopt};
}

}  // namespace defnav::navigation
