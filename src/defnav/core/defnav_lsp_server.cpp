#include "defnav/core/defnav_lsp_server.hpp"

#include <spdlog/spdlog.h>

#include "defnav/utils/canonical_path.hpp"

namespace defnav {

using lsp::LspError;
using lsp::LspErrorCode;
using lsp::Ok;

namespace {

constexpr std::string_view kServerName = "defnav";
constexpr std::string_view kServerVersion = "0.1.0";

}  // namespace

DefnavLspServer::DefnavLspServer(
    asio::any_io_executor executor,
    std::unique_ptr<jsonrpc::endpoint::RpcEndpoint> endpoint,
    std::shared_ptr<LanguageServiceBase> language_service,
    std::shared_ptr<spdlog::logger> logger)
    : lsp::LspServer(executor, std::move(endpoint), logger),
      logger_(logger ? logger : spdlog::default_logger()),
      executor_(executor),
      language_service_(std::move(language_service)) {
}

auto DefnavLspServer::WorkspaceUriOf(const lsp::InitializeParams& params)
    -> std::expected<std::string, lsp::LspError> {
  if (const auto& folders = params.workspaceFolders;
      folders && !folders->empty()) {
    if (folders->size() != 1) {
      return LspError::UnexpectedFromCode(
          LspErrorCode::kInvalidRequest, "Only one workspace is supported");
    }
    return folders->front().uri;
  }
  if (params.rootUri) {
    return *params.rootUri;
  }
  // Deprecated rootPath, sent by older clients
  if (params.rootPath && !params.rootPath->empty()) {
    return CanonicalPath(*params.rootPath).ToUri();
  }
  return std::string{};
}

auto DefnavLspServer::OnInitialize(lsp::InitializeParams params)
    -> asio::awaitable<std::expected<lsp::InitializeResult, lsp::LspError>> {
  auto workspace_uri = WorkspaceUriOf(params);
  if (!workspace_uri) {
    co_return std::unexpected(workspace_uri.error());
  }

  // Loads config only, so requests arriving right after initialize see a
  // ready resolver
  co_await language_service_->InitializeWorkspace(*workspace_uri);

  lsp::ServerCapabilities capabilities{
      .textDocumentSync =
          lsp::TextDocumentSyncOptions{
              .openClose = true,
              .change = lsp::TextDocumentSyncKind::kFull,
          },
      .definitionProvider = true,
      .typeDefinitionProvider = true,
      .xdefinitionProvider = true,
  };

  co_return lsp::InitializeResult{
      .capabilities = capabilities,
      .serverInfo = lsp::InitializeResult::ServerInfo{
          .name = std::string(kServerName),
          .version = std::string(kServerVersion)}};
}

auto DefnavLspServer::OnInitialized(lsp::InitializedParams /*unused*/)
    -> asio::awaitable<std::expected<void, lsp::LspError>> {
  Logger()->debug("DefnavLspServer initialized");
  co_return Ok();
}

auto DefnavLspServer::OnShutdown(lsp::ShutdownParams /*unused*/)
    -> asio::awaitable<std::expected<lsp::ShutdownResult, lsp::LspError>> {
  shutdown_requested_ = true;
  co_return lsp::ShutdownResult{};
}

auto DefnavLspServer::OnExit(lsp::ExitParams /*unused*/)
    -> asio::awaitable<std::expected<void, lsp::LspError>> {
  if (!shutdown_requested_) {
    Logger()->warn("DefnavLspServer exit received without shutdown");
  }
  co_return co_await lsp::LspServer::Shutdown();
}

auto DefnavLspServer::OnDidOpenTextDocument(
    lsp::DidOpenTextDocumentParams params)
    -> asio::awaitable<std::expected<void, lsp::LspError>> {
  const auto& text_doc = params.textDocument;
  Logger()->debug("OnDidOpenTextDocument received: {}", text_doc.uri);

  co_await language_service_->OnDocumentOpened(
      text_doc.uri, text_doc.text, text_doc.version);

  co_return Ok();
}

auto DefnavLspServer::OnDidChangeTextDocument(
    lsp::DidChangeTextDocumentParams params)
    -> asio::awaitable<std::expected<void, lsp::LspError>> {
  Logger()->debug(
      "OnDidChangeTextDocument received: {}", params.textDocument.uri);

  if (!language_service_->IsDocumentOpen(params.textDocument.uri)) {
    Logger()->warn(
        "OnDidChangeTextDocument for unopened document {}",
        params.textDocument.uri);
    co_return Ok();
  }

  // Full sync: the last full-content change wins
  for (auto it = params.contentChanges.rbegin();
       it != params.contentChanges.rend(); ++it) {
    if (it->IsFullContent()) {
      co_await language_service_->OnDocumentChanged(
          params.textDocument.uri, it->text, params.textDocument.version);
      co_return Ok();
    }
  }

  if (!params.contentChanges.empty()) {
    Logger()->warn(
        "OnDidChangeTextDocument ignoring ranged changes for {}",
        params.textDocument.uri);
  }
  co_return Ok();
}

auto DefnavLspServer::OnDidCloseTextDocument(
    lsp::DidCloseTextDocumentParams params)
    -> asio::awaitable<std::expected<void, lsp::LspError>> {
  Logger()->debug(
      "OnDidCloseTextDocument received: {}", params.textDocument.uri);
  language_service_->OnDocumentClosed(params.textDocument.uri);
  co_return Ok();
}

auto DefnavLspServer::OnGotoDefinition(lsp::DefinitionParams params)
    -> asio::awaitable<std::expected<lsp::DefinitionResult, lsp::LspError>> {
  Logger()->debug("OnGotoDefinition received: {}", params.textDocument.uri);
  co_return co_await language_service_->GetDefinition(std::move(params));
}

auto DefnavLspServer::OnGotoTypeDefinition(lsp::TypeDefinitionParams params)
    -> asio::awaitable<
        std::expected<lsp::TypeDefinitionResult, lsp::LspError>> {
  Logger()->debug(
      "OnGotoTypeDefinition received: {}", params.textDocument.uri);
  co_return co_await language_service_->GetTypeDefinition(std::move(params));
}

auto DefnavLspServer::OnXDefinition(lsp::XDefinitionParams params)
    -> asio::awaitable<std::expected<lsp::XDefinitionResult, lsp::LspError>> {
  Logger()->debug("OnXDefinition received: {}", params.textDocument.uri);
  co_return co_await language_service_->GetXDefinition(std::move(params));
}

}  // namespace defnav
