#pragma once

#include <memory>
#include <string>

#include <asio.hpp>

#include "defnav/core/language_service_base.hpp"
#include "lsp/lifecycle.hpp"
#include "lsp/lsp_server.hpp"

namespace defnav {

class DefnavLspServer : public lsp::LspServer {
 public:
  DefnavLspServer(
      asio::any_io_executor executor,
      std::unique_ptr<jsonrpc::endpoint::RpcEndpoint> endpoint,
      std::shared_ptr<LanguageServiceBase> language_service,
      std::shared_ptr<spdlog::logger> logger = nullptr);

 private:
  // Server state
  bool shutdown_requested_ = false;

  std::shared_ptr<spdlog::logger> logger_;
  asio::any_io_executor executor_;

  std::shared_ptr<LanguageServiceBase> language_service_{nullptr};

  // Workspace root from rootUri or the single workspace folder
  static auto WorkspaceUriOf(const lsp::InitializeParams& params)
      -> std::expected<std::string, lsp::LspError>;

 protected:
  auto OnInitialize(lsp::InitializeParams params) -> asio::awaitable<
      std::expected<lsp::InitializeResult, lsp::LspError>> override;

  auto OnInitialized(lsp::InitializedParams params)
      -> asio::awaitable<std::expected<void, lsp::LspError>> override;

  auto OnShutdown(lsp::ShutdownParams params) -> asio::awaitable<
      std::expected<lsp::ShutdownResult, lsp::LspError>> override;

  auto OnExit(lsp::ExitParams params)
      -> asio::awaitable<std::expected<void, lsp::LspError>> override;

  auto OnDidOpenTextDocument(lsp::DidOpenTextDocumentParams params)
      -> asio::awaitable<std::expected<void, lsp::LspError>> override;

  auto OnDidChangeTextDocument(lsp::DidChangeTextDocumentParams params)
      -> asio::awaitable<std::expected<void, lsp::LspError>> override;

  auto OnDidCloseTextDocument(lsp::DidCloseTextDocumentParams params)
      -> asio::awaitable<std::expected<void, lsp::LspError>> override;

  auto OnGotoDefinition(lsp::DefinitionParams params) -> asio::awaitable<
      std::expected<lsp::DefinitionResult, lsp::LspError>> override;

  auto OnGotoTypeDefinition(lsp::TypeDefinitionParams params)
      -> asio::awaitable<
          std::expected<lsp::TypeDefinitionResult, lsp::LspError>> override;

  auto OnXDefinition(lsp::XDefinitionParams params) -> asio::awaitable<
      std::expected<lsp::XDefinitionResult, lsp::LspError>> override;
};

}  // namespace defnav
