#pragma once

#include <string>
#include <string_view>

#include "defnav/analysis/source_map.hpp"

namespace defnav::analysis {

enum class ObjectKind {
  kVariable,
  kConstant,
  kFunction,
  kTypeName,
  kField,
  kPackage,
  kModule,
  kScope,
  kBuiltin,
};

auto ToString(ObjectKind kind) -> std::string_view;

enum class TypeKind {
  // Built-in types without a declaration site (int, logic, ...)
  kBasic,
  // Types introduced by a declaration (typedef, class, ...)
  kNamed,
  // Handle or reference to another type
  kPointer,
  // Anonymous aggregates (unnamed structs, arrays, ...)
  kComposite,
};

struct Object;

struct Type {
  TypeKind kind = TypeKind::kBasic;
  std::string name;

  // Declaring object, set for kNamed only
  const Object* type_name = nullptr;

  // Referenced type, set for kPointer only
  const Type* elem = nullptr;
};

// Semantic entity an identifier refers to or introduces
struct Object {
  ObjectKind kind = ObjectKind::kVariable;
  std::string name;

  // Declaration position of the name; kNoPos for builtins
  Pos pos = kNoPos;

  // Exact end of the declared name when the analyzer knows it
  Pos name_end = kNoPos;

  // Static type, may be null for entities without one (packages, modules)
  const Type* type = nullptr;

  // Enclosing scope, null at the top level
  const Object* parent = nullptr;
};

// Named-type object behind a static type. Pointers are unwrapped; basic and
// composite types have no declaration site and yield null.
[[nodiscard]] auto TypeLookup(const Type* type) -> const Object*;

// Objects declared inside a subroutine or block are not visible outside it
[[nodiscard]] auto IsLocal(const Object& object) -> bool;

}  // namespace defnav::analysis
