#pragma once

#include <expected>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

#include "defnav/analysis/compilation_options.hpp"
#include "defnav/analysis/type_checker.hpp"
#include "defnav/navigation/package_cache.hpp"
#include "defnav/services/document_store.hpp"

namespace defnav::analysis {

// TypeChecker backed by the slang front end.
//
// Each request builds a fresh compilation from the requested document and
// every other open document, so references into packages and modules that
// are open in the editor resolve. Packages and modules found along the way
// are registered in the package cache. Documents that are not open are read
// from disk.
class SlangTypeChecker : public TypeChecker {
 public:
  SlangTypeChecker(
      std::shared_ptr<const services::DocumentStore> documents,
      std::shared_ptr<navigation::PackageCache> package_cache,
      AnalysisOptions options,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  auto TypeCheck(
      const RequestContext& ctx, const lsp::TextDocumentPositionParams& params)
      -> std::expected<TypeCheckResult, NavError> override;

 private:
  auto ReadDocument(const std::string& uri) const
      -> std::expected<std::string, NavError>;

  std::shared_ptr<const services::DocumentStore> documents_;
  std::shared_ptr<navigation::PackageCache> package_cache_;
  AnalysisOptions options_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace defnav::analysis
