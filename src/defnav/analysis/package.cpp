#include "defnav/analysis/package.hpp"

#include <utility>

namespace defnav::analysis {

Package::Package(std::string name) : name_(std::move(name)) {
}

auto Package::AddFile(std::string uri, std::string_view content)
    -> SyntaxNode& {
  const auto& file = source_map_.AddFile(uri, content);
  auto root = std::make_unique<SyntaxNode>(
      SyntaxNodeKind::kFile, file.Base(), file.Base() + file.Size(), uri);
  auto& root_ref = *root;
  files_.push_back(SyntaxFile{.uri = std::move(uri), .root = std::move(root)});
  return root_ref;
}

auto Package::NewObject(Object object) -> Object& {
  return objects_.emplace_back(std::move(object));
}

auto Package::NewType(Type type) -> Type& {
  return types_.emplace_back(std::move(type));
}

void Package::RecordUse(const SyntaxNode& ident, const Object& object) {
  info_.uses[&ident] = &object;
}

void Package::RecordDef(const SyntaxNode& ident, const Object& object) {
  info_.defs[&ident] = &object;
}

auto Package::ObjectOf(const SyntaxNode& ident) const -> const Object* {
  if (auto it = info_.uses.find(&ident); it != info_.uses.end()) {
    return it->second;
  }
  if (auto it = info_.defs.find(&ident); it != info_.defs.end()) {
    return it->second;
  }
  return nullptr;
}

auto Package::TypeOf(const SyntaxNode& ident) const -> const Type* {
  if (const auto* object = ObjectOf(ident)) {
    return object->type;
  }
  return nullptr;
}

auto Package::FileRootFor(Pos pos) const -> const SyntaxNode* {
  for (const auto& file : files_) {
    if (pos >= file.root->Start() && pos <= file.root->End()) {
      return file.root.get();
    }
  }
  return nullptr;
}

auto Package::FindIdentifierAt(Pos pos) const -> const SyntaxNode* {
  const auto* node = FileRootFor(pos);
  while (node != nullptr) {
    if (node->IsIdentifier()) {
      return node->Start() == pos ? node : nullptr;
    }
    const SyntaxNode* next = nullptr;
    for (const auto& child : node->Children()) {
      if (child->Encloses(pos, pos)) {
        next = child.get();
        break;
      }
    }
    node = next;
  }
  return nullptr;
}

}  // namespace defnav::analysis
