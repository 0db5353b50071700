#include "defnav/navigation/definition_resolver.hpp"

#include <exception>
#include <utility>

#include <fmt/format.h>

#include "defnav/navigation/identifier_resolver.hpp"
#include "defnav/navigation/location_builder.hpp"
#include "defnav/navigation/position_resolver.hpp"
#include "defnav/navigation/result_enricher.hpp"
#include "defnav/utils/path_utils.hpp"

namespace defnav::navigation {

DefinitionResolver::DefinitionResolver(
    std::shared_ptr<analysis::TypeChecker> type_checker,
    std::shared_ptr<const PackageCache> package_cache,
    FindPackageFunc find_package, CanonicalPath root,
    std::shared_ptr<spdlog::logger> logger)
    : type_checker_(std::move(type_checker)),
      package_cache_(std::move(package_cache)),
      find_package_(std::move(find_package)),
      root_(std::move(root)),
      logger_(logger ? std::move(logger) : spdlog::default_logger()) {
}

auto DefinitionResolver::Definition(
    const RequestContext& ctx, const lsp::TextDocumentPositionParams& params)
    -> std::expected<std::vector<lsp::Location>, NavError> {
  auto results = Resolve(ctx, params);
  if (!results) {
    return std::unexpected(results.error());
  }

  std::vector<lsp::Location> locations;
  locations.reserve(results->size());
  for (auto& result : *results) {
    locations.push_back(std::move(result.location));
  }
  return locations;
}

auto DefinitionResolver::TypeDefinition(
    const RequestContext& ctx, const lsp::TextDocumentPositionParams& params)
    -> std::expected<std::vector<lsp::Location>, NavError> {
  auto results = Resolve(ctx, params);
  if (!results) {
    return std::unexpected(results.error());
  }

  std::vector<lsp::Location> locations;
  for (auto& result : *results) {
    if (result.typeLocation) {
      locations.push_back(std::move(*result.typeLocation));
    }
  }
  return locations;
}

auto DefinitionResolver::XDefinition(
    const RequestContext& ctx, const lsp::TextDocumentPositionParams& params)
    -> std::expected<std::vector<lsp::SymbolLocationInformation>, NavError> {
  return Resolve(ctx, params);
}

auto DefinitionResolver::CheckWorkspaceUri(
    const RequestContext& ctx,
    const lsp::TextDocumentPositionParams& params) const
    -> std::expected<void, NavError> {
  const auto& uri = params.textDocument.uri;
  if (!IsWorkspaceUri(uri, root_)) {
    return NavError::Unexpected(
        NavErrorCode::kInvalidParams,
        fmt::format(
            "{} not yet supported for out-of-workspace URI (\"{}\")",
            ctx.Method(), uri));
  }
  return {};
}

auto DefinitionResolver::Resolve(
    const RequestContext& ctx, const lsp::TextDocumentPositionParams& params)
    -> std::expected<std::vector<lsp::SymbolLocationInformation>, NavError> {
  logger_->debug(
      "DefinitionResolver {} at {}:{}:{}", ctx.Method(),
      params.textDocument.uri, params.position.line,
      params.position.character);

  if (auto check = CheckWorkspaceUri(ctx, params); !check) {
    return std::unexpected(check.error());
  }

  try {
    auto results = ResolveXDefinition(ctx, params);
    if (!results && results.error().Is(NavErrorCode::kInvalidNode)) {
      logger_->debug(
          "DefinitionResolver no resolvable node: {}",
          results.error().Message());
      return std::vector<lsp::SymbolLocationInformation>{};
    }
    return results;
  } catch (const std::exception& e) {
    logger_->error("DefinitionResolver {} failed: {}", ctx.Method(), e.what());
    return NavError::Unexpected(
        NavErrorCode::kInternalError,
        fmt::format("{} failed: {}", ctx.Method(), e.what()));
  }
}

auto DefinitionResolver::ResolveXDefinition(
    const RequestContext& ctx, const lsp::TextDocumentPositionParams& params)
    -> std::expected<std::vector<lsp::SymbolLocationInformation>, NavError> {
  auto checked = type_checker_->TypeCheck(ctx, params);
  if (!checked) {
    return std::unexpected(checked.error());
  }
  const auto& package = *checked->package;

  auto path_nodes = GetPathNodes(package, checked->pos, checked->pos);
  if (!path_nodes) {
    return std::unexpected(path_nodes.error());
  }

  const auto* node = path_nodes->front();
  const analysis::SyntaxNode* ident = nullptr;
  if (node->IsIdentifier()) {
    ident = node;
  } else if (node->IsTypeDeclaration() && node->DeclaredName() != nullptr) {
    ident = node->DeclaredName();
  } else {
    return NavError::Unexpected(
        NavErrorCode::kInvalidNode,
        fmt::format("unsupported node kind {}", ToString(node->Kind())));
  }

  auto found = LookupIdent(package, *ident);
  if (!found) {
    return std::unexpected(found.error());
  }

  const auto& sources = package.Sources();
  std::vector<lsp::SymbolLocationInformation> results;
  results.reserve(found->size());
  for (const auto& declaration : *found) {
    lsp::SymbolLocationInformation info{
        .location = BuildDeclarationLocation(
            sources, declaration.pos, declaration.name),
        .typeLocation = std::nullopt,
        .symbol = std::nullopt,
    };
    if (declaration.type_name != nullptr) {
      info.typeLocation = BuildTypeLocation(sources, *declaration.type_name);
    }

    auto enrichment = Enrich(
        ctx, package, *path_nodes, declaration.pos, root_, *package_cache_,
        find_package_);
    if (enrichment.diagnostic) {
      logger_->warn(
          "DefinitionResolver no symbol descriptor for '{}': {}",
          declaration.name, enrichment.diagnostic->Message());
    }
    info.symbol = std::move(enrichment.descriptor);

    results.push_back(std::move(info));
  }
  return results;
}

}  // namespace defnav::navigation
