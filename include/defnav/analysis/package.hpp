#pragma once

#include <deque>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "defnav/analysis/objects.hpp"
#include "defnav/analysis/source_map.hpp"
#include "defnav/analysis/syntax.hpp"

namespace defnav::analysis {

// Identifier-keyed indexes produced by type checking
struct TypesInfo {
  // Identifier occurrences that refer to a declaration made elsewhere
  std::unordered_map<const SyntaxNode*, const Object*> uses;

  // Identifier occurrences that are themselves the declaration
  std::unordered_map<const SyntaxNode*, const Object*> defs;
};

// Output of analyzing one compilation unit: syntax trees for its files, the
// objects and types they declare, and the use/definition indexes.
// Immutable once handed to the resolution core.
class Package {
 public:
  explicit Package(std::string name);

  Package(const Package&) = delete;
  Package(Package&&) = delete;
  auto operator=(const Package&) -> Package& = delete;
  auto operator=(Package&&) -> Package& = delete;
  ~Package() = default;

  [[nodiscard]] auto Name() const -> const std::string& {
    return name_;
  }

  [[nodiscard]] auto Sources() const -> const SourceMap& {
    return source_map_;
  }

  [[nodiscard]] auto Files() const -> const std::vector<SyntaxFile>& {
    return files_;
  }

  [[nodiscard]] auto Info() const -> const TypesInfo& {
    return info_;
  }

  // Builder interface, used by analysis backends and tests

  // Register a file and create its (empty) root node
  auto AddFile(std::string uri, std::string_view content) -> SyntaxNode&;

  auto NewObject(Object object) -> Object&;
  auto NewType(Type type) -> Type&;

  void RecordUse(const SyntaxNode& ident, const Object& object);
  void RecordDef(const SyntaxNode& ident, const Object& object);

  // Query interface

  // Object an identifier refers to or declares (uses first, then defs)
  [[nodiscard]] auto ObjectOf(const SyntaxNode& ident) const -> const Object*;

  // Static type of ObjectOf(ident)
  [[nodiscard]] auto TypeOf(const SyntaxNode& ident) const -> const Type*;

  // Identifier node whose first character is at pos
  [[nodiscard]] auto FindIdentifierAt(Pos pos) const -> const SyntaxNode*;

  // Root node of the file containing pos
  [[nodiscard]] auto FileRootFor(Pos pos) const -> const SyntaxNode*;

 private:
  std::string name_;
  SourceMap source_map_;
  std::vector<SyntaxFile> files_;
  TypesInfo info_;

  // Stable addresses for objects and types referenced from the indexes
  std::deque<Object> objects_;
  std::deque<Type> types_;
};

}  // namespace defnav::analysis
