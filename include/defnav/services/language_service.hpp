#pragma once

#include <algorithm>
#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <thread>

#include <asio.hpp>
#include <spdlog/spdlog.h>

#include "defnav/core/language_service_base.hpp"
#include "defnav/core/request_context.hpp"
#include "defnav/error/error.hpp"
#include "defnav/navigation/definition_resolver.hpp"
#include "defnav/navigation/package_cache.hpp"
#include "defnav/services/document_store.hpp"
#include "defnav/utils/canonical_path.hpp"

namespace defnav::services {

// Protocol-facing error for a resolution failure
auto ToLspError(const NavError& error) -> LspError;

// Runs the definition family of requests on a worker pool against the open
// documents. Requests in flight for a document are cancelled when the
// document changes or closes.
class LanguageService : public LanguageServiceBase {
 public:
  explicit LanguageService(
      asio::any_io_executor executor,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  // Loads <root>/.defnav when present and sets up the resolver. An empty
  // workspace_uri leaves every file:// document addressable.
  auto InitializeWorkspace(std::string workspace_uri)
      -> asio::awaitable<void> override;

  auto GetDefinition(lsp::DefinitionParams params) -> asio::awaitable<
      std::expected<lsp::DefinitionResult, LspError>> override;

  auto GetTypeDefinition(lsp::TypeDefinitionParams params) -> asio::awaitable<
      std::expected<lsp::TypeDefinitionResult, LspError>> override;

  auto GetXDefinition(lsp::XDefinitionParams params) -> asio::awaitable<
      std::expected<lsp::XDefinitionResult, LspError>> override;

  auto OnDocumentOpened(std::string uri, std::string content, int version)
      -> asio::awaitable<void> override;

  auto OnDocumentChanged(std::string uri, std::string content, int version)
      -> asio::awaitable<void> override;

  auto OnDocumentClosed(std::string uri) -> void override;

  auto IsDocumentOpen(const std::string& uri) const -> bool override;

  [[nodiscard]] auto IsInitialized() const -> bool {
    return resolver_ != nullptr;
  }

  [[nodiscard]] auto GetPackageCache() const
      -> std::shared_ptr<const navigation::PackageCache> {
    return package_cache_;
  }

 private:
  // Runs resolve on the worker pool and resumes on executor_
  template <typename T>
  auto RunRequest(
      std::string method, lsp::TextDocumentPositionParams params,
      std::function<std::expected<T, NavError>(
          navigation::DefinitionResolver&, const RequestContext&,
          const lsp::TextDocumentPositionParams&)>
          resolve) -> asio::awaitable<std::expected<T, LspError>>;

  // In-flight bookkeeping, only touched on executor_
  auto TrackRequest(const std::string& uri, const RequestContext& ctx)
      -> uint64_t;
  auto UntrackRequest(const std::string& uri, uint64_t id) -> void;
  auto CancelRequests(const std::string& uri) -> void;

  std::shared_ptr<spdlog::logger> logger_;
  asio::any_io_executor executor_;
  CanonicalPath workspace_root_;

  std::shared_ptr<DocumentStore> documents_;
  std::shared_ptr<navigation::PackageCache> package_cache_;
  std::shared_ptr<navigation::DefinitionResolver> resolver_;

  uint64_t next_request_id_ = 1;
  std::map<std::string, std::map<uint64_t, RequestContext>> in_flight_;

  // Worker pool for type checking
  std::unique_ptr<asio::thread_pool> compilation_pool_;

  // Thread pool size: use half of hardware threads with minimum of 1
  static auto GetThreadPoolSize() -> size_t {
    auto hw_threads = std::thread::hardware_concurrency();
    return std::max(size_t{1}, static_cast<size_t>(hw_threads) / 2);
  }
};

}  // namespace defnav::services
