#pragma once

#include <expected>
#include <memory>
#include <vector>

#include <spdlog/spdlog.h>

#include "defnav/analysis/type_checker.hpp"
#include "defnav/core/request_context.hpp"
#include "defnav/error/error.hpp"
#include "defnav/navigation/package_cache.hpp"
#include "defnav/utils/canonical_path.hpp"
#include "lsp/basic.hpp"
#include "lsp/navigation.hpp"

namespace defnav::navigation {

// Serves the definition family of requests from one shared resolution pass:
// type-check, locate the node under the cursor, resolve its declaration,
// build locations and enrich with a symbol descriptor.
//
// Definition and TypeDefinition are projections of XDefinition. A cursor that
// is not on an identifier or type declaration yields an empty result; every
// other failure is returned to the caller.
class DefinitionResolver {
 public:
  DefinitionResolver(
      std::shared_ptr<analysis::TypeChecker> type_checker,
      std::shared_ptr<const PackageCache> package_cache,
      FindPackageFunc find_package, CanonicalPath root,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  auto Definition(
      const RequestContext& ctx, const lsp::TextDocumentPositionParams& params)
      -> std::expected<std::vector<lsp::Location>, NavError>;

  auto TypeDefinition(
      const RequestContext& ctx, const lsp::TextDocumentPositionParams& params)
      -> std::expected<std::vector<lsp::Location>, NavError>;

  auto XDefinition(
      const RequestContext& ctx, const lsp::TextDocumentPositionParams& params)
      -> std::expected<std::vector<lsp::SymbolLocationInformation>, NavError>;

  [[nodiscard]] auto Root() const -> const CanonicalPath& {
    return root_;
  }

 private:
  // kInvalidParams naming the method and URI unless the document is
  // addressable in the workspace
  auto CheckWorkspaceUri(
      const RequestContext& ctx,
      const lsp::TextDocumentPositionParams& params) const
      -> std::expected<void, NavError>;

  // Shared pass behind all three operations. May fail with kInvalidNode.
  auto ResolveXDefinition(
      const RequestContext& ctx, const lsp::TextDocumentPositionParams& params)
      -> std::expected<std::vector<lsp::SymbolLocationInformation>, NavError>;

  // URI check and InvalidNode softening around ResolveXDefinition
  auto Resolve(
      const RequestContext& ctx, const lsp::TextDocumentPositionParams& params)
      -> std::expected<std::vector<lsp::SymbolLocationInformation>, NavError>;

  std::shared_ptr<analysis::TypeChecker> type_checker_;
  std::shared_ptr<const PackageCache> package_cache_;
  FindPackageFunc find_package_;
  CanonicalPath root_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace defnav::navigation
