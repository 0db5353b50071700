#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "defnav/analysis/source_map.hpp"

namespace defnav::analysis {

enum class SyntaxNodeKind {
  kFile,
  kIdentifier,
  kTypeDeclaration,
  kOther,
};

auto ToString(SyntaxNodeKind kind) -> std::string_view;

// Node of an analyzed syntax tree. Covers the half-open interval
// [Start(), End()). Children are ordered by position and never overlap.
class SyntaxNode {
 public:
  SyntaxNode(SyntaxNodeKind kind, Pos start, Pos end, std::string name = "");

  SyntaxNode(const SyntaxNode&) = delete;
  SyntaxNode(SyntaxNode&&) = delete;
  auto operator=(const SyntaxNode&) -> SyntaxNode& = delete;
  auto operator=(SyntaxNode&&) -> SyntaxNode& = delete;
  ~SyntaxNode() = default;

  [[nodiscard]] auto Kind() const -> SyntaxNodeKind {
    return kind_;
  }
  [[nodiscard]] auto Start() const -> Pos {
    return start_;
  }
  [[nodiscard]] auto End() const -> Pos {
    return end_;
  }

  // Identifier text, type declaration name, or a descriptive label
  [[nodiscard]] auto Name() const -> const std::string& {
    return name_;
  }

  [[nodiscard]] auto Parent() const -> const SyntaxNode* {
    return parent_;
  }

  [[nodiscard]] auto Children() const
      -> const std::vector<std::unique_ptr<SyntaxNode>>& {
    return children_;
  }

  [[nodiscard]] auto IsIdentifier() const -> bool {
    return kind_ == SyntaxNodeKind::kIdentifier;
  }
  [[nodiscard]] auto IsTypeDeclaration() const -> bool {
    return kind_ == SyntaxNodeKind::kTypeDeclaration;
  }

  // For type declarations: the identifier that names the declared type
  [[nodiscard]] auto DeclaredName() const -> const SyntaxNode* {
    return declared_name_;
  }
  void SetDeclaredName(const SyntaxNode* name) {
    declared_name_ = name;
  }

  // A zero-width interval encloses when start lies inside the node
  [[nodiscard]] auto Encloses(Pos start, Pos end) const -> bool;

  auto AddChild(std::unique_ptr<SyntaxNode> child) -> SyntaxNode&;

  // Widen the node to cover [start, end); used when a backend can only
  // derive a node's extent from its children
  void Extend(Pos start, Pos end);

 private:
  SyntaxNodeKind kind_;
  Pos start_;
  Pos end_;
  std::string name_;
  const SyntaxNode* parent_ = nullptr;
  const SyntaxNode* declared_name_ = nullptr;
  std::vector<std::unique_ptr<SyntaxNode>> children_;
};

// Root of one analyzed file
struct SyntaxFile {
  std::string uri;
  std::unique_ptr<SyntaxNode> root;
};

}  // namespace defnav::analysis
