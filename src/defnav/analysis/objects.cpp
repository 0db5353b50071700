#include "defnav/analysis/objects.hpp"

namespace defnav::analysis {

auto ToString(ObjectKind kind) -> std::string_view {
  switch (kind) {
    case ObjectKind::kVariable:
      return "variable";
    case ObjectKind::kConstant:
      return "constant";
    case ObjectKind::kFunction:
      return "function";
    case ObjectKind::kTypeName:
      return "type";
    case ObjectKind::kField:
      return "field";
    case ObjectKind::kPackage:
      return "package";
    case ObjectKind::kModule:
      return "module";
    case ObjectKind::kScope:
      return "scope";
    case ObjectKind::kBuiltin:
      return "builtin";
  }
  return "unknown";
}

auto TypeLookup(const Type* type) -> const Object* {
  while (type != nullptr) {
    switch (type->kind) {
      case TypeKind::kNamed:
        if (type->type_name != nullptr && IsValid(type->type_name->pos)) {
          return type->type_name;
        }
        return nullptr;
      case TypeKind::kPointer:
        type = type->elem;
        break;
      case TypeKind::kBasic:
      case TypeKind::kComposite:
        return nullptr;
    }
  }
  return nullptr;
}

auto IsLocal(const Object& object) -> bool {
  for (const auto* scope = object.parent; scope != nullptr;
       scope = scope->parent) {
    if (scope->kind == ObjectKind::kFunction ||
        scope->kind == ObjectKind::kScope) {
      return true;
    }
  }
  return false;
}

}  // namespace defnav::analysis
