#pragma once

#include <expected>

#include "defnav/analysis/package.hpp"
#include "defnav/core/request_context.hpp"
#include "defnav/error/error.hpp"
#include "defnav/navigation/definition_info.hpp"
#include "defnav/navigation/package_cache.hpp"
#include "defnav/utils/canonical_path.hpp"
#include "lsp/navigation.hpp"

namespace defnav::navigation {

// Builds the cross-reference descriptor of a declaration.
//
// The owning package is located with find_package, except for
// compilation-unit members which belong to the file that declares them.
// - vendor: the declaring file sits below a "vendor" directory
// - package: root-relative directory of the declaring file plus package name
// - recv/name: first and last path fields (name only for a single field)
// - id: "<package>/-/<fields joined by '/'>", empty for the package itself
auto DescribeSymbol(
    const RequestContext& ctx, const analysis::Package& package,
    const PackageCache& cache, const CanonicalPath& root,
    const DefinitionInfo& info, const FindPackageFunc& find_package)
    -> std::expected<lsp::SymbolDescriptor, NavError>;

}  // namespace defnav::navigation
