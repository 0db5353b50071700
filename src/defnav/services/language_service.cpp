#include "defnav/services/language_service.hpp"

#include <exception>
#include <optional>
#include <utility>

#include <fmt/format.h>

#include "defnav/analysis/slang_type_checker.hpp"
#include "defnav/core/config_file.hpp"
#include "defnav/utils/scoped_timer.hpp"

namespace defnav::services {

using lsp::error::LspErrorCode;

auto ToLspError(const NavError& error) -> LspError {
  switch (error.Code()) {
    case NavErrorCode::kInvalidParams:
      return LspError::FromCode(LspErrorCode::kInvalidParams, error.Message());
    case NavErrorCode::kDocumentNotFound:
      return LspError::FromCode(
          LspErrorCode::kDocumentNotFound, error.Message());
    case NavErrorCode::kCancelled:
      return LspError::FromCode(
          LspErrorCode::kRequestCancelled, error.Message());
    case NavErrorCode::kInvalidNode:
    case NavErrorCode::kNotFound:
    case NavErrorCode::kTypeCheckFailed:
    case NavErrorCode::kInternalError:
      return LspError::FromCode(LspErrorCode::kInternalError, error.Message());
  }
  return LspError::FromCode(LspErrorCode::kUnknownError, error.Message());
}

LanguageService::LanguageService(
    asio::any_io_executor executor, std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? logger : spdlog::default_logger()),
      executor_(executor),
      documents_(std::make_shared<DocumentStore>()),
      package_cache_(std::make_shared<navigation::PackageCache>()),
      compilation_pool_(
          std::make_unique<asio::thread_pool>(GetThreadPoolSize())) {
  logger_->debug(
      "LanguageService created with {} compilation threads",
      GetThreadPoolSize());
}

auto LanguageService::InitializeWorkspace(std::string workspace_uri)
    -> asio::awaitable<void> {
  utils::ScopedTimer timer("Workspace initialization", logger_);

  if (!workspace_uri.empty()) {
    workspace_root_ = CanonicalPath::FromUri(workspace_uri);
  }

  std::optional<DefnavConfigFile> config;
  if (!workspace_root_.Empty()) {
    config =
        DefnavConfigFile::LoadFromFile(workspace_root_ / ".defnav", logger_);
  }

  analysis::AnalysisOptions options;
  auto lookup = navigation::PackageLookup::kWorkspace;
  if (config) {
    options = config->ToAnalysisOptions();
    lookup = config->GetPackageLookup();
    logger_->debug(
        "LanguageService loaded config: {} include dirs, {} defines, package "
        "lookup {}",
        options.include_dirs.size(), options.defines.size(),
        navigation::ToString(lookup));
  }

  auto type_checker = std::make_shared<analysis::SlangTypeChecker>(
      documents_, package_cache_, std::move(options), logger_);
  resolver_ = std::make_shared<navigation::DefinitionResolver>(
      std::move(type_checker), package_cache_,
      navigation::MakeFindPackageFunc(lookup), workspace_root_, logger_);

  logger_->info(
      "LanguageService workspace initialized: {} ({})",
      workspace_root_.Empty() ? std::string("<no root>")
                              : workspace_root_.String(),
      utils::ScopedTimer::FormatDuration(timer.GetElapsed()));
  co_return;
}

template <typename T>
auto LanguageService::RunRequest(
    std::string method, lsp::TextDocumentPositionParams params,
    std::function<std::expected<T, NavError>(
        navigation::DefinitionResolver&, const RequestContext&,
        const lsp::TextDocumentPositionParams&)>
        resolve) -> asio::awaitable<std::expected<T, LspError>> {
  utils::ScopedTimer timer(method, logger_);

  if (!IsInitialized()) {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kServerNotInitialized,
        fmt::format("{} received before initialize", method));
  }

  RequestContext ctx(method);
  const auto uri = params.textDocument.uri;
  auto request_id = TrackRequest(uri, ctx);

  auto result = co_await asio::co_spawn(
      compilation_pool_->get_executor(),
      [resolver = resolver_, ctx, params = std::move(params),
       resolve = std::move(resolve)]()
          -> asio::awaitable<std::expected<T, NavError>> {
        // Escaping exceptions would skip untracking below
        try {
          co_return resolve(*resolver, ctx, params);
        } catch (const std::exception& e) {
          co_return NavError::Unexpected(
              NavErrorCode::kInternalError, e.what());
        }
      },
      asio::use_awaitable);

  // Back to the main executor before touching service state
  co_await asio::post(executor_, asio::use_awaitable);
  UntrackRequest(uri, request_id);

  if (!result) {
    if (result.error().Is(NavErrorCode::kNotFound) ||
        result.error().Is(NavErrorCode::kCancelled)) {
      logger_->debug(
          "{} failed for {}: {}", method, uri, result.error().Message());
    } else {
      logger_->warn(
          "{} failed for {}: {}", method, uri, result.error().Message());
    }
    co_return std::unexpected(ToLspError(result.error()));
  }

  co_return std::move(*result);
}

auto LanguageService::GetDefinition(lsp::DefinitionParams params)
    -> asio::awaitable<std::expected<lsp::DefinitionResult, LspError>> {
  co_return co_await RunRequest<lsp::DefinitionResult>(
      "textDocument/definition",
      static_cast<lsp::TextDocumentPositionParams>(params),
      [](navigation::DefinitionResolver& resolver, const RequestContext& ctx,
         const lsp::TextDocumentPositionParams& position) {
        return resolver.Definition(ctx, position);
      });
}

auto LanguageService::GetTypeDefinition(lsp::TypeDefinitionParams params)
    -> asio::awaitable<std::expected<lsp::TypeDefinitionResult, LspError>> {
  co_return co_await RunRequest<lsp::TypeDefinitionResult>(
      "textDocument/typeDefinition",
      static_cast<lsp::TextDocumentPositionParams>(params),
      [](navigation::DefinitionResolver& resolver, const RequestContext& ctx,
         const lsp::TextDocumentPositionParams& position) {
        return resolver.TypeDefinition(ctx, position);
      });
}

auto LanguageService::GetXDefinition(lsp::XDefinitionParams params)
    -> asio::awaitable<std::expected<lsp::XDefinitionResult, LspError>> {
  co_return co_await RunRequest<lsp::XDefinitionResult>(
      "textDocument/xdefinition", std::move(params),
      [](navigation::DefinitionResolver& resolver, const RequestContext& ctx,
         const lsp::TextDocumentPositionParams& position) {
        return resolver.XDefinition(ctx, position);
      });
}

auto LanguageService::OnDocumentOpened(
    std::string uri, std::string content, int version)
    -> asio::awaitable<void> {
  logger_->debug("LanguageService document opened: {} (v{})", uri, version);
  documents_->Update(uri, std::move(content), version);
  co_return;
}

auto LanguageService::OnDocumentChanged(
    std::string uri, std::string content, int version)
    -> asio::awaitable<void> {
  logger_->debug("LanguageService document changed: {} (v{})", uri, version);
  CancelRequests(uri);
  documents_->Update(uri, std::move(content), version);
  co_return;
}

auto LanguageService::OnDocumentClosed(std::string uri) -> void {
  logger_->debug("LanguageService document closed: {}", uri);
  CancelRequests(uri);
  documents_->Remove(uri);
  package_cache_->RemoveDocument(uri);
}

auto LanguageService::IsDocumentOpen(const std::string& uri) const -> bool {
  return documents_->Contains(uri);
}

auto LanguageService::TrackRequest(
    const std::string& uri, const RequestContext& ctx) -> uint64_t {
  auto id = next_request_id_++;
  in_flight_[uri].emplace(id, ctx);
  return id;
}

auto LanguageService::UntrackRequest(const std::string& uri, uint64_t id)
    -> void {
  auto it = in_flight_.find(uri);
  if (it == in_flight_.end()) {
    return;
  }
  it->second.erase(id);
  if (it->second.empty()) {
    in_flight_.erase(it);
  }
}

auto LanguageService::CancelRequests(const std::string& uri) -> void {
  auto it = in_flight_.find(uri);
  if (it == in_flight_.end()) {
    return;
  }
  logger_->debug(
      "LanguageService cancelling {} request(s) for {}", it->second.size(),
      uri);
  for (const auto& [id, ctx] : it->second) {
    ctx.Cancel();
  }
  in_flight_.erase(it);
}

}  // namespace defnav::services
