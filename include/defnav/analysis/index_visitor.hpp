#pragma once

#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>

#include <slang/ast/ASTVisitor.h>
#include <slang/ast/Expression.h>
#include <slang/ast/Symbol.h>
#include <slang/ast/types/AllTypes.h>
#include <slang/ast/types/DeclaredType.h>
#include <slang/ast/types/Type.h>

#include "defnav/analysis/package.hpp"
#include "defnav/analysis/syntax_converter.hpp"

namespace defnav::analysis {

// Walks an elaborated slang compilation and fills the package's use and
// definition indexes. Every slang symbol becomes one analysis Object, every
// slang type one analysis Type, created on first sight.
class IndexVisitor : public slang::ast::ASTVisitor<IndexVisitor, true, true> {
 public:
  IndexVisitor(Package& package, const LocationMapper& mapper);

  // Expression handlers (uses)
  void handle(const slang::ast::NamedValueExpression& expr);
  void handle(const slang::ast::CallExpression& expr);
  void handle(const slang::ast::MemberAccessExpression& expr);

  // Symbols: definitions, and type references in declarations
  template <typename T>
  void handle(const T& node) {
    if constexpr (std::is_base_of_v<slang::ast::Symbol, T>) {
      RecordDefinition(node);
      if (const auto* value = node.template as_if<slang::ast::ValueSymbol>()) {
        if (const auto* declared = value->getDeclaredType()) {
          RecordTypeReference(*declared);
        }
      }
      if constexpr (std::is_same_v<T, slang::ast::TypeAliasType>) {
        RecordTypeReference(node.targetType);
      }
    }
    this->visitDefault(node);
  }

  auto ObjectFor(const slang::ast::Symbol& symbol) -> const Object&;
  auto TypeFor(const slang::ast::Type& type) -> const Type&;

 private:
  void RecordDefinition(const slang::ast::Symbol& symbol);
  // Use of a named type written in a declaration, e.g. `state_t s;`
  void RecordTypeReference(const slang::ast::DeclaredType& declared);
  void RecordUseAt(slang::SourceLocation location, const Object& object);

  auto BuiltinFor(std::string_view name) -> const Object&;
  auto NamedTypeFor(const slang::ast::Symbol& declaration) -> const Type&;

  Package& package_;
  const LocationMapper& mapper_;

  std::unordered_map<const slang::ast::Symbol*, Object*> objects_;
  std::unordered_map<const slang::ast::Type*, const Type*> types_;
  std::unordered_map<const slang::ast::Symbol*, Type*> named_types_;
  std::unordered_map<std::string, Object*> builtins_;
};

}  // namespace defnav::analysis
