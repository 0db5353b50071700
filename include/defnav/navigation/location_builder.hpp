#pragma once

#include <string_view>

#include "defnav/analysis/objects.hpp"
#include "defnav/analysis/source_map.hpp"
#include "lsp/basic.hpp"

namespace defnav::navigation {

// Location spanning [start, end) in the file that contains start. Positions
// outside every registered file produce an empty URI and a zero range.
auto BuildLocation(
    const analysis::SourceMap& source_map, analysis::Pos start,
    analysis::Pos end) -> lsp::Location;

// Location of a declared name: [pos, pos + name length)
auto BuildDeclarationLocation(
    const analysis::SourceMap& source_map, analysis::Pos pos,
    std::string_view name) -> lsp::Location;

// Location of a named type's declaration. Uses the exact name end when the
// analyzer recorded one, otherwise approximates it as start + name length.
auto BuildTypeLocation(
    const analysis::SourceMap& source_map, const analysis::Object& type_name)
    -> lsp::Location;

}  // namespace defnav::navigation
