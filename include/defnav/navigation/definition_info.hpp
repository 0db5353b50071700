#pragma once

#include <expected>
#include <string>
#include <string_view>

#include "defnav/analysis/package.hpp"
#include "defnav/error/error.hpp"
#include "defnav/navigation/position_resolver.hpp"

namespace defnav::navigation {

// Cross-reference metadata of a declaration
struct DefinitionInfo {
  // Outermost package or module scope, "$unit" for compilation-unit members
  std::string package_name;

  // Enclosing scopes below the package followed by the declaration name,
  // space separated. Empty when the declaration is the package itself.
  std::string path;

  analysis::ObjectKind kind = analysis::ObjectKind::kVariable;

  const analysis::Object* object = nullptr;
};

inline constexpr std::string_view kUnitPackageName = "$unit";

// Metadata for the object named by the innermost identifier of path_nodes.
// The object must be declared at pos. Declarations local to a subroutine or
// block are not addressable from outside and fail with kNotFound.
auto ComputeDefinitionInfo(
    const analysis::Package& package, const PathNodes& path_nodes,
    analysis::Pos pos) -> std::expected<DefinitionInfo, NavError>;

}  // namespace defnav::navigation
