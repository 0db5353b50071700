#pragma once

#include <expected>
#include <string>
#include <vector>

#include "defnav/analysis/package.hpp"
#include "defnav/error/error.hpp"

namespace defnav::navigation {

// An identifier resolved to its declaring occurrence
struct FoundDeclaration {
  // Declaration identifier: position and name of the declared object
  analysis::Pos pos = analysis::kNoPos;
  std::string name;

  // Named-type object of the identifier's static type, if it has one
  const analysis::Object* type_name = nullptr;
};

// Resolves an identifier through the use index, falling back to the
// definition index when the identifier is itself a declaration.
//
// - No object in either index: kNotFound.
// - Object without a source position (a builtin): empty result. Builtins are
//   deliberately not navigable.
// - Otherwise exactly one FoundDeclaration.
auto LookupIdent(
    const analysis::Package& package, const analysis::SyntaxNode& ident)
    -> std::expected<std::vector<FoundDeclaration>, NavError>;

}  // namespace defnav::navigation
