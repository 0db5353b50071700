#pragma once

#include <cstdint>
#include <unordered_map>
#include <utility>
#include <vector>

#include <slang/syntax/SyntaxNode.h>
#include <slang/text/SourceLocation.h>
#include <slang/text/SourceManager.h>

#include "defnav/analysis/package.hpp"

namespace defnav::analysis {

// Half-open span of one token
using TokenSpan = std::pair<Pos, Pos>;

// Maps slang locations into a package's position space. Only buffers that
// were registered as package files have positions; everything else
// (include files, predefined macros) maps to kNoPos.
class LocationMapper {
 public:
  explicit LocationMapper(const slang::SourceManager& source_manager)
      : source_manager_(source_manager) {
  }

  void RegisterBuffer(slang::BufferID buffer, Pos base) {
    bases_[buffer.getId()] = base;
  }

  [[nodiscard]] auto ToPos(slang::SourceLocation location) const -> Pos;

 private:
  const slang::SourceManager& source_manager_;
  std::unordered_map<uint32_t, Pos> bases_;
};

// Mirrors a slang syntax tree into the package's syntax tree.
//
// Identifier tokens become kIdentifier leaves, typedef and class
// declarations become kTypeDeclaration nodes bound to their name, every
// other syntax node becomes kOther. Nodes that cannot be placed inside their
// parent (macro expansions, included text) are flattened into it. Spans of
// all tokens are collected so callers can tell code from trivia.
class SyntaxConverter {
 public:
  explicit SyntaxConverter(const LocationMapper& mapper) : mapper_(mapper) {
  }

  void Convert(const slang::syntax::SyntaxNode& root, SyntaxNode& file_root);

  // Sorted spans of every token seen by Convert
  [[nodiscard]] auto TakeTokenSpans() -> std::vector<TokenSpan>;

 private:
  void ConvertChildren(
      const slang::syntax::SyntaxNode& node, SyntaxNode& parent);
  void AddToken(const slang::parsing::Token& token, SyntaxNode& parent);
  auto Placeable(const SyntaxNode& parent, Pos start, Pos end) const -> bool;

  const LocationMapper& mapper_;
  std::vector<TokenSpan> token_spans_;
};

}  // namespace defnav::analysis
