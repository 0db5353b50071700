#include "defnav/navigation/location_builder.hpp"

#include <algorithm>

namespace defnav::navigation {

auto BuildLocation(
    const analysis::SourceMap& source_map, analysis::Pos start,
    analysis::Pos end) -> lsp::Location {
  const auto* file = source_map.FileFor(start);
  if (file == nullptr) {
    return lsp::Location{};
  }

  if (end < start) {
    end = start;
  }
  // An end past the file (bad name length, stale positions) is clamped
  auto end_offset = std::min(file->OffsetOf(end), file->Size());

  return lsp::Location{
      .uri = file->Uri(),
      .range = {
          .start = file->PositionOf(file->OffsetOf(start)),
          .end = file->PositionOf(end_offset),
      }};
}

auto BuildDeclarationLocation(
    const analysis::SourceMap& source_map, analysis::Pos pos,
    std::string_view name) -> lsp::Location {
  return BuildLocation(
      source_map, pos, pos + static_cast<analysis::Pos>(name.size()));
}

auto BuildTypeLocation(
    const analysis::SourceMap& source_map, const analysis::Object& type_name)
    -> lsp::Location {
  if (analysis::IsValid(type_name.name_end) &&
      type_name.name_end >= type_name.pos) {
    return BuildLocation(source_map, type_name.pos, type_name.name_end);
  }
  return BuildDeclarationLocation(source_map, type_name.pos, type_name.name);
}

}  // namespace defnav::navigation
