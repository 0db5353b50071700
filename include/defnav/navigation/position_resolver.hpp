#pragma once

#include <expected>
#include <vector>

#include "defnav/analysis/package.hpp"
#include "defnav/error/error.hpp"

namespace defnav::navigation {

using PathNodes = std::vector<const analysis::SyntaxNode*>;

// Chain of syntax nodes enclosing [start, end], innermost first, ending with
// the file root. Fails with kInvalidNode when no file contains the interval
// or when nothing below the file root encloses it.
auto GetPathNodes(
    const analysis::Package& package, analysis::Pos start, analysis::Pos end)
    -> std::expected<PathNodes, NavError>;

}  // namespace defnav::navigation
