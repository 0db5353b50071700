#include "defnav/analysis/syntax_converter.hpp"

#include <algorithm>
#include <memory>
#include <string>

#include <slang/parsing/Token.h>
#include <slang/syntax/AllSyntax.h>

namespace defnav::analysis {

namespace {

using slang::syntax::SyntaxKind;

auto IsTypeDeclaration(SyntaxKind kind) -> bool {
  return kind == SyntaxKind::TypedefDeclaration ||
         kind == SyntaxKind::ClassDeclaration;
}

auto DeclaredNameToken(const slang::syntax::SyntaxNode& node)
    -> slang::parsing::Token {
  if (node.kind == SyntaxKind::TypedefDeclaration) {
    return node.as<slang::syntax::TypedefDeclarationSyntax>().name;
  }
  return node.as<slang::syntax::ClassDeclarationSyntax>().name;
}

}  // namespace

auto LocationMapper::ToPos(slang::SourceLocation location) const -> Pos {
  if (!location.valid()) {
    return kNoPos;
  }
  location = source_manager_.getFullyExpandedLoc(location);
  auto it = bases_.find(location.buffer().getId());
  if (it == bases_.end()) {
    return kNoPos;
  }
  return it->second + static_cast<Pos>(location.offset());
}

void SyntaxConverter::Convert(
    const slang::syntax::SyntaxNode& root, SyntaxNode& file_root) {
  ConvertChildren(root, file_root);
}

auto SyntaxConverter::TakeTokenSpans() -> std::vector<TokenSpan> {
  std::ranges::sort(token_spans_);
  return std::move(token_spans_);
}

auto SyntaxConverter::Placeable(
    const SyntaxNode& parent, Pos start, Pos end) const -> bool {
  if (!IsValid(start) || !IsValid(end) || end <= start) {
    return false;
  }
  if (start < parent.Start() || end > parent.End()) {
    return false;
  }
  // Children are kept ordered and disjoint
  const auto& siblings = parent.Children();
  return siblings.empty() || siblings.back()->End() <= start;
}

void SyntaxConverter::ConvertChildren(
    const slang::syntax::SyntaxNode& node, SyntaxNode& parent) {
  for (uint32_t i = 0; i < node.getChildCount(); i++) {
    const auto* child = node.childNode(i);
    if (child == nullptr) {
      AddToken(node.childToken(i), parent);
      continue;
    }

    auto range = child->sourceRange();
    auto start = mapper_.ToPos(range.start());
    auto end = mapper_.ToPos(range.end());
    if (!Placeable(parent, start, end)) {
      ConvertChildren(*child, parent);
      continue;
    }

    auto kind = IsTypeDeclaration(child->kind)
                    ? SyntaxNodeKind::kTypeDeclaration
                    : SyntaxNodeKind::kOther;
    auto& converted = parent.AddChild(std::make_unique<SyntaxNode>(
        kind, start, end, std::string(toString(child->kind))));
    ConvertChildren(*child, converted);

    if (kind == SyntaxNodeKind::kTypeDeclaration) {
      auto name_pos = mapper_.ToPos(DeclaredNameToken(*child).location());
      for (const auto& grandchild : converted.Children()) {
        if (grandchild->IsIdentifier() && grandchild->Start() == name_pos) {
          converted.SetDeclaredName(grandchild.get());
          break;
        }
      }
    }
  }
}

void SyntaxConverter::AddToken(
    const slang::parsing::Token& token, SyntaxNode& parent) {
  if (!token || token.isMissing() || token.rawText().empty()) {
    return;
  }

  auto start = mapper_.ToPos(token.location());
  auto end = start + static_cast<Pos>(token.rawText().size());
  if (!IsValid(start)) {
    return;
  }
  token_spans_.emplace_back(start, end);

  if (token.kind != slang::parsing::TokenKind::Identifier &&
      token.kind != slang::parsing::TokenKind::SystemIdentifier) {
    return;
  }
  if (!Placeable(parent, start, end)) {
    return;
  }
  parent.AddChild(std::make_unique<SyntaxNode>(
      SyntaxNodeKind::kIdentifier, start, end, std::string(token.valueText())));
}

}  // namespace defnav::analysis
