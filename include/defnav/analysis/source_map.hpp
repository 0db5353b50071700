#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "lsp/basic.hpp"

namespace defnav::analysis {

// Global position inside a SourceMap. Zero is reserved for "no position",
// which is what builtin entities carry.
using Pos = uint32_t;
inline constexpr Pos kNoPos = 0;

[[nodiscard]] inline auto IsValid(Pos pos) -> bool {
  return pos != kNoPos;
}

// One registered file. Owns the position interval [base, base + size].
class SourceFile {
 public:
  SourceFile(std::string uri, Pos base, std::string_view content);

  [[nodiscard]] auto Uri() const -> const std::string& {
    return uri_;
  }
  [[nodiscard]] auto Base() const -> Pos {
    return base_;
  }
  [[nodiscard]] auto Size() const -> uint32_t {
    return size_;
  }
  [[nodiscard]] auto LineCount() const -> int {
    return static_cast<int>(line_starts_.size());
  }

  [[nodiscard]] auto Contains(Pos pos) const -> bool {
    return pos >= base_ && pos <= base_ + size_;
  }

  [[nodiscard]] auto PosAt(uint32_t offset) const -> Pos {
    return base_ + offset;
  }
  [[nodiscard]] auto OffsetOf(Pos pos) const -> uint32_t {
    return pos - base_;
  }

  // Zero-based line and byte column of an offset
  [[nodiscard]] auto PositionOf(uint32_t offset) const -> lsp::Position;

  // Offset of an LSP position. Columns past the end of a line are clamped to
  // the line end; lines past the end of the file yield nullopt.
  [[nodiscard]] auto OffsetAt(lsp::Position position) const
      -> std::optional<uint32_t>;

 private:
  std::string uri_;
  Pos base_;
  uint32_t size_;
  std::vector<uint32_t> line_starts_;
};

// Maps global positions back to file, line and column.
class SourceMap {
 public:
  SourceMap() = default;

  SourceMap(const SourceMap&) = delete;
  SourceMap(SourceMap&&) = default;
  auto operator=(const SourceMap&) -> SourceMap& = delete;
  auto operator=(SourceMap&&) -> SourceMap& = default;
  ~SourceMap() = default;

  auto AddFile(std::string uri, std::string_view content) -> const SourceFile&;

  [[nodiscard]] auto FileFor(Pos pos) const -> const SourceFile*;
  [[nodiscard]] auto FileFor(std::string_view uri) const -> const SourceFile*;

 private:
  std::vector<std::unique_ptr<SourceFile>> files_;
  Pos next_base_ = 1;
};

}  // namespace defnav::analysis
