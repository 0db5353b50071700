#include "defnav/analysis/index_visitor.hpp"

#include <variant>

#include <slang/ast/expressions/CallExpression.h>
#include <slang/ast/expressions/MiscExpressions.h>
#include <slang/ast/expressions/SelectExpressions.h>
#include <slang/ast/symbols/CompilationUnitSymbols.h>
#include <slang/ast/symbols/MemberSymbols.h>
#include <slang/ast/symbols/SubroutineSymbols.h>
#include <slang/syntax/AllSyntax.h>

namespace defnav::analysis {

namespace {

using slang::ast::SymbolKind;
using slang::syntax::SyntaxKind;

auto KindOf(const slang::ast::Symbol& symbol) -> ObjectKind {
  switch (symbol.kind) {
    case SymbolKind::Parameter:
    case SymbolKind::TypeParameter:
    case SymbolKind::EnumValue:
    case SymbolKind::Specparam:
      return ObjectKind::kConstant;
    case SymbolKind::Subroutine:
    case SymbolKind::MethodPrototype:
      return ObjectKind::kFunction;
    case SymbolKind::TypeAlias:
    case SymbolKind::ClassType:
    case SymbolKind::GenericClassDef:
      return ObjectKind::kTypeName;
    case SymbolKind::Field:
      return ObjectKind::kField;
    case SymbolKind::Package:
      return ObjectKind::kPackage;
    case SymbolKind::InstanceBody:
    case SymbolKind::Definition:
      return ObjectKind::kModule;
    case SymbolKind::StatementBlock:
    case SymbolKind::GenerateBlock:
    case SymbolKind::GenerateBlockArray:
      return ObjectKind::kScope;
    default:
      return ObjectKind::kVariable;
  }
}

auto IsBasicType(const slang::ast::Type& type) -> bool {
  switch (type.getCanonicalType().kind) {
    case SymbolKind::PredefinedIntegerType:
    case SymbolKind::ScalarType:
    case SymbolKind::FloatingType:
    case SymbolKind::StringType:
    case SymbolKind::CHandleType:
    case SymbolKind::VoidType:
    case SymbolKind::EventType:
    case SymbolKind::NullType:
      return true;
    default:
      return false;
  }
}

// Start of the last segment of a possibly scoped name: `pkg::item` -> item
auto RightmostNameLocation(const slang::syntax::NameSyntax& name)
    -> slang::SourceLocation {
  if (name.kind == SyntaxKind::ScopedName) {
    return RightmostNameLocation(
        *name.as<slang::syntax::ScopedNameSyntax>().right);
  }
  return name.sourceRange().start();
}

auto CallNameLocation(const slang::ast::CallExpression& expr)
    -> slang::SourceLocation {
  if (expr.syntax == nullptr ||
      expr.syntax->kind != SyntaxKind::InvocationExpression) {
    return expr.sourceRange.start();
  }

  const auto& left =
      *expr.syntax->as<slang::syntax::InvocationExpressionSyntax>().left;
  if (left.kind == SyntaxKind::MemberAccessExpression) {
    return left.as<slang::syntax::MemberAccessExpressionSyntax>()
        .name.location();
  }
  if (slang::syntax::NameSyntax::isKind(left.kind)) {
    return RightmostNameLocation(left.as<slang::syntax::NameSyntax>());
  }
  return left.sourceRange().start();
}

}  // namespace

IndexVisitor::IndexVisitor(Package& package, const LocationMapper& mapper)
    : package_(package), mapper_(mapper) {
}

void IndexVisitor::handle(const slang::ast::NamedValueExpression& expr) {
  const slang::ast::Symbol* target = &expr.symbol;
  if (target->kind == SymbolKind::ExplicitImport) {
    const auto& import = target->as<slang::ast::ExplicitImportSymbol>();
    if (const auto* imported = import.importedSymbol()) {
      target = imported;
    }
  }

  auto location = expr.sourceRange.start();
  if (expr.syntax != nullptr && expr.syntax->kind == SyntaxKind::ScopedName) {
    location = RightmostNameLocation(
        expr.syntax->as<slang::syntax::ScopedNameSyntax>());
  }
  RecordUseAt(location, ObjectFor(*target));

  this->visitDefault(expr);
}

void IndexVisitor::handle(const slang::ast::CallExpression& expr) {
  if (expr.isSystemCall()) {
    RecordUseAt(expr.sourceRange.start(), BuiltinFor(expr.getSubroutineName()));
    this->visitDefault(expr);
    return;
  }

  const auto* subroutine = std::get_if<0>(&expr.subroutine);
  if (subroutine != nullptr && *subroutine != nullptr) {
    RecordUseAt(CallNameLocation(expr), ObjectFor(**subroutine));
  }

  this->visitDefault(expr);
}

void IndexVisitor::handle(const slang::ast::MemberAccessExpression& expr) {
  RecordUseAt(expr.memberNameRange().start(), ObjectFor(expr.member));
  this->visitDefault(expr);
}

auto IndexVisitor::ObjectFor(const slang::ast::Symbol& symbol)
    -> const Object& {
  if (auto it = objects_.find(&symbol); it != objects_.end()) {
    return *it->second;
  }

  auto pos = mapper_.ToPos(symbol.location);
  auto& object = package_.NewObject(Object{
      .kind = KindOf(symbol),
      .name = std::string(symbol.name),
      .pos = pos,
      .name_end = kNoPos,
      .type = nullptr,
      .parent = nullptr,
  });
  // Registered before recursing: types and parents may lead back here
  objects_[&symbol] = &object;

  // Exact extent of the name token, escaped identifiers included
  if (IsValid(pos)) {
    if (const auto* ident = package_.FindIdentifierAt(pos)) {
      object.name_end = ident->End();
    }
  }

  if (const auto* scope = symbol.getParentScope()) {
    const auto& scope_symbol = scope->asSymbol();
    if (scope_symbol.kind != SymbolKind::CompilationUnit &&
        scope_symbol.kind != SymbolKind::Root) {
      object.parent = &ObjectFor(scope_symbol);
    }
  }

  if (object.kind == ObjectKind::kTypeName) {
    object.type = &NamedTypeFor(symbol);
  } else if (const auto* value = symbol.as_if<slang::ast::ValueSymbol>()) {
    object.type = &TypeFor(value->getType());
  }

  return object;
}

auto IndexVisitor::TypeFor(const slang::ast::Type& type) -> const Type& {
  if (auto it = types_.find(&type); it != types_.end()) {
    return *it->second;
  }

  if (type.isAlias()) {
    const auto& named = NamedTypeFor(type);
    types_[&type] = &named;
    return named;
  }

  auto& result = package_.NewType(Type{
      .kind = TypeKind::kComposite,
      .name = type.toString(),
      .type_name = nullptr,
      .elem = nullptr,
  });
  types_[&type] = &result;

  if (type.isClass()) {
    // Class variables hold handles to objects of the class
    result.kind = TypeKind::kPointer;
    result.elem = &NamedTypeFor(type);
  } else if (IsBasicType(type)) {
    result.kind = TypeKind::kBasic;
  }
  return result;
}

void IndexVisitor::RecordDefinition(const slang::ast::Symbol& symbol) {
  if (symbol.name.empty()) {
    return;
  }
  auto pos = mapper_.ToPos(symbol.location);
  if (!IsValid(pos)) {
    return;
  }
  const auto* ident = package_.FindIdentifierAt(pos);
  if (ident == nullptr || ident->Name() != symbol.name) {
    return;
  }
  package_.RecordDef(*ident, ObjectFor(symbol));
}

void IndexVisitor::RecordTypeReference(
    const slang::ast::DeclaredType& declared) {
  const auto* syntax = declared.getTypeSyntax();
  if (syntax == nullptr || syntax->kind != SyntaxKind::NamedType) {
    return;
  }

  const auto& type = declared.getType();
  if (!type.isAlias() && !type.isClass()) {
    return;
  }

  auto location = RightmostNameLocation(
      *syntax->as<slang::syntax::NamedTypeSyntax>().name);
  RecordUseAt(location, ObjectFor(type));
}

void IndexVisitor::RecordUseAt(
    slang::SourceLocation location, const Object& object) {
  auto pos = mapper_.ToPos(location);
  if (!IsValid(pos)) {
    return;
  }
  const auto* ident = package_.FindIdentifierAt(pos);
  // Guards against expressions whose range starts before the name
  if (ident == nullptr || ident->Name() != object.name) {
    return;
  }
  package_.RecordUse(*ident, object);
}

auto IndexVisitor::BuiltinFor(std::string_view name) -> const Object& {
  auto key = std::string(name);
  if (auto it = builtins_.find(key); it != builtins_.end()) {
    return *it->second;
  }
  auto& object = package_.NewObject(Object{
      .kind = ObjectKind::kBuiltin,
      .name = key,
      .pos = kNoPos,
      .name_end = kNoPos,
      .type = nullptr,
      .parent = nullptr,
  });
  builtins_[key] = &object;
  return object;
}

auto IndexVisitor::NamedTypeFor(const slang::ast::Symbol& declaration)
    -> const Type& {
  if (auto it = named_types_.find(&declaration); it != named_types_.end()) {
    return *it->second;
  }
  auto& type = package_.NewType(Type{
      .kind = TypeKind::kNamed,
      .name = std::string(declaration.name),
      .type_name = nullptr,
      .elem = nullptr,
  });
  named_types_[&declaration] = &type;
  type.type_name = &ObjectFor(declaration);
  return type;
}

}  // namespace defnav::analysis
