#include "defnav/analysis/syntax.hpp"

#include <algorithm>
#include <utility>

namespace defnav::analysis {

auto ToString(SyntaxNodeKind kind) -> std::string_view {
  switch (kind) {
    case SyntaxNodeKind::kFile:
      return "File";
    case SyntaxNodeKind::kIdentifier:
      return "Identifier";
    case SyntaxNodeKind::kTypeDeclaration:
      return "TypeDeclaration";
    case SyntaxNodeKind::kOther:
      return "Other";
  }
  return "Unknown";
}

SyntaxNode::SyntaxNode(
    SyntaxNodeKind kind, Pos start, Pos end, std::string name)
    : kind_(kind), start_(start), end_(end), name_(std::move(name)) {
}

auto SyntaxNode::Encloses(Pos start, Pos end) const -> bool {
  if (!IsValid(start_) || start < start_) {
    return false;
  }
  if (start == end) {
    return start < end_;
  }
  return end <= end_;
}

auto SyntaxNode::AddChild(std::unique_ptr<SyntaxNode> child) -> SyntaxNode& {
  child->parent_ = this;
  children_.push_back(std::move(child));
  return *children_.back();
}

void SyntaxNode::Extend(Pos start, Pos end) {
  if (!IsValid(start)) {
    return;
  }
  if (!IsValid(start_)) {
    start_ = start;
    end_ = end;
    return;
  }
  start_ = std::min(start_, start);
  end_ = std::max(end_, end);
}

}  // namespace defnav::analysis
