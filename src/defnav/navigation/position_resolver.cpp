#include "defnav/navigation/position_resolver.hpp"

#include <algorithm>
#include <utility>

#include <fmt/format.h>

namespace defnav::navigation {

using analysis::Pos;
using analysis::SyntaxNode;

auto GetPathNodes(const analysis::Package& package, Pos start, Pos end)
    -> std::expected<PathNodes, NavError> {
  if (end < start) {
    std::swap(start, end);
  }

  const auto* root = package.FileRootFor(start);
  if (root == nullptr || end > root->End()) {
    return NavError::Unexpected(
        NavErrorCode::kInvalidNode,
        fmt::format("no file in package {} contains position {}",
                    package.Name(), start));
  }

  // Collected outermost first, reversed at the end
  PathNodes path{root};
  const SyntaxNode* node = root;
  while (true) {
    const SyntaxNode* next = nullptr;
    for (const auto& child : node->Children()) {
      if (child->Encloses(start, end)) {
        next = child.get();
        break;
      }
    }
    if (next == nullptr) {
      break;
    }
    path.push_back(next);
    node = next;
  }

  if (path.size() == 1) {
    return NavError::Unexpected(
        NavErrorCode::kInvalidNode,
        fmt::format("position {} is not inside any syntax node", start));
  }

  std::ranges::reverse(path);
  return path;
}

}  // namespace defnav::navigation
