#include "defnav/analysis/source_map.hpp"

#include <algorithm>
#include <utility>

namespace defnav::analysis {

SourceFile::SourceFile(std::string uri, Pos base, std::string_view content)
    : uri_(std::move(uri)),
      base_(base),
      size_(static_cast<uint32_t>(content.size())) {
  line_starts_.push_back(0);
  for (uint32_t i = 0; i < size_; ++i) {
    if (content[i] == '\n') {
      line_starts_.push_back(i + 1);
    }
  }
}

auto SourceFile::PositionOf(uint32_t offset) const -> lsp::Position {
  offset = std::min(offset, size_);
  auto it = std::ranges::upper_bound(line_starts_, offset);
  auto line = static_cast<int>(std::distance(line_starts_.begin(), it)) - 1;
  return lsp::Position{
      .line = line,
      .character = static_cast<int>(offset - line_starts_[line])};
}

auto SourceFile::OffsetAt(lsp::Position position) const
    -> std::optional<uint32_t> {
  if (position.line < 0 || position.line >= LineCount() ||
      position.character < 0) {
    return std::nullopt;
  }

  auto line_start = line_starts_[position.line];
  // Line end excludes the newline character
  auto line_end = position.line + 1 < LineCount()
                      ? line_starts_[position.line + 1] - 1
                      : size_;
  return std::min(
      line_start + static_cast<uint32_t>(position.character), line_end);
}

auto SourceMap::AddFile(std::string uri, std::string_view content)
    -> const SourceFile& {
  auto file = std::make_unique<SourceFile>(std::move(uri), next_base_, content);
  // Leave one position of slack so end-of-file is addressable
  next_base_ += file->Size() + 1;
  files_.push_back(std::move(file));
  return *files_.back();
}

auto SourceMap::FileFor(Pos pos) const -> const SourceFile* {
  if (!IsValid(pos)) {
    return nullptr;
  }
  // Files are appended with increasing bases
  auto it = std::ranges::upper_bound(
      files_, pos, std::ranges::less{},
      [](const std::unique_ptr<SourceFile>& f) { return f->Base(); });
  if (it == files_.begin()) {
    return nullptr;
  }
  --it;
  return (*it)->Contains(pos) ? it->get() : nullptr;
}

auto SourceMap::FileFor(std::string_view uri) const -> const SourceFile* {
  for (const auto& file : files_) {
    if (file->Uri() == uri) {
      return file.get();
    }
  }
  return nullptr;
}

}  // namespace defnav::analysis
