#include "defnav/navigation/identifier_resolver.hpp"

namespace defnav::navigation {

auto LookupIdent(
    const analysis::Package& package, const analysis::SyntaxNode& ident)
    -> std::expected<std::vector<FoundDeclaration>, NavError> {
  const auto& info = package.Info();

  const analysis::Object* object = nullptr;
  if (auto it = info.uses.find(&ident); it != info.uses.end()) {
    object = it->second;
  } else if (auto it = info.defs.find(&ident); it != info.defs.end()) {
    object = it->second;
  }

  if (object == nullptr) {
    return NavError::Unexpected(NavErrorCode::kNotFound);
  }

  // Builtins have no source position. Emit nothing rather than an error.
  if (!analysis::IsValid(object->pos)) {
    return std::vector<FoundDeclaration>{};
  }

  return std::vector<FoundDeclaration>{FoundDeclaration{
      .pos = object->pos,
      .name = object->name,
      .type_name = analysis::TypeLookup(package.TypeOf(ident)),
  }};
}

}  // namespace defnav::navigation
