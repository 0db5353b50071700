#include "defnav/navigation/definition_info.hpp"

#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace defnav::navigation {

namespace {

auto InnermostIdentifier(const PathNodes& path_nodes)
    -> const analysis::SyntaxNode* {
  for (const auto* node : path_nodes) {
    if (node->IsIdentifier()) {
      return node;
    }
    if (node->IsTypeDeclaration() && node->DeclaredName() != nullptr) {
      return node->DeclaredName();
    }
  }
  return nullptr;
}

auto IsPackageScope(const analysis::Object& object) -> bool {
  return object.kind == analysis::ObjectKind::kPackage ||
         object.kind == analysis::ObjectKind::kModule;
}

}  // namespace

auto ComputeDefinitionInfo(
    const analysis::Package& package, const PathNodes& path_nodes,
    analysis::Pos pos) -> std::expected<DefinitionInfo, NavError> {
  const auto* ident = InnermostIdentifier(path_nodes);
  if (ident == nullptr) {
    return NavError::Unexpected(
        NavErrorCode::kNotFound, "no identifier in node chain");
  }

  const auto* object = package.ObjectOf(*ident);
  if (object == nullptr) {
    return NavError::Unexpected(
        NavErrorCode::kNotFound,
        fmt::format("no object for identifier '{}'", ident->Name()));
  }
  if (object->pos != pos) {
    return NavError::Unexpected(
        NavErrorCode::kNotFound,
        fmt::format(
            "declaration mismatch for '{}': expected {}, found {}",
            object->name, pos, object->pos));
  }
  if (analysis::IsLocal(*object)) {
    return NavError::Unexpected(
        NavErrorCode::kNotFound,
        fmt::format("'{}' is a local declaration", object->name));
  }

  // Scope chain from the declaration outwards
  std::vector<const analysis::Object*> chain;
  for (const auto* scope = object; scope != nullptr; scope = scope->parent) {
    chain.push_back(scope);
  }

  DefinitionInfo info{
      .package_name = std::string(kUnitPackageName),
      .path = "",
      .kind = object->kind,
      .object = object,
  };

  // Fields are everything below the outermost package scope
  auto fields_end = chain.size();
  for (size_t i = chain.size(); i-- > 0;) {
    if (IsPackageScope(*chain[i])) {
      info.package_name = chain[i]->name;
      fields_end = i;
      break;
    }
  }

  std::vector<std::string_view> fields;
  for (size_t i = fields_end; i-- > 0;) {
    fields.push_back(chain[i]->name);
  }
  info.path = fmt::format("{}", fmt::join(fields, " "));
  return info;
}

}  // namespace defnav::navigation
