#pragma once

#include <expected>
#include <memory>

#include <asio.hpp>
#include <jsonrpc/endpoint/endpoint.hpp>
#include <jsonrpc/error/error.hpp>
#include <spdlog/spdlog.h>

#include "lsp/document_sync.hpp"
#include "lsp/error.hpp"
#include "lsp/lifecycle.hpp"
#include "lsp/navigation.hpp"

namespace lsp {

using lsp::error::LspError;
using lsp::error::LspErrorCode;
using lsp::error::Ok;

// Protocol dispatch over a JSON-RPC endpoint. Every handler defaults to
// kMethodNotImplemented; servers override what they support.
class LspServer {
 public:
  LspServer(
      asio::any_io_executor executor,
      std::unique_ptr<jsonrpc::endpoint::RpcEndpoint> endpoint,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  LspServer(const LspServer&) = delete;
  LspServer(LspServer&&) = delete;
  auto operator=(const LspServer&) -> LspServer& = delete;
  auto operator=(LspServer&&) -> LspServer& = delete;

  virtual ~LspServer() = default;

  auto Start() -> asio::awaitable<std::expected<void, LspError>>;
  auto Shutdown() -> asio::awaitable<std::expected<void, LspError>>;
  auto Logger() -> std::shared_ptr<spdlog::logger> {
    return logger_;
  }

 protected:
  void RegisterHandlers();

 private:
  std::shared_ptr<spdlog::logger> logger_;
  std::unique_ptr<jsonrpc::endpoint::RpcEndpoint> endpoint_;
  asio::any_io_executor executor_;
  asio::executor_work_guard<asio::any_io_executor> work_guard_;

  void RegisterLifecycleHandlers();
  void RegisterDocumentSyncHandlers();
  void RegisterLanguageFeatureHandlers();

 protected:
  // Initialize Request
  virtual auto OnInitialize(InitializeParams /*unused*/)
      -> asio::awaitable<std::expected<InitializeResult, LspError>> {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kMethodNotImplemented, "OnInitialize is not implemented");
  }

  // Initialized Notification
  virtual auto OnInitialized(InitializedParams /*unused*/)
      -> asio::awaitable<std::expected<void, LspError>> {
    co_return Ok();
  }

  // Shutdown Request
  virtual auto OnShutdown(ShutdownParams /*unused*/)
      -> asio::awaitable<std::expected<ShutdownResult, LspError>> {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kMethodNotImplemented, "OnShutdown is not implemented");
  }

  // Exit Notification
  virtual auto OnExit(ExitParams /*unused*/)
      -> asio::awaitable<std::expected<void, LspError>> {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kMethodNotImplemented, "OnExit is not implemented");
  }

  // DidOpenTextDocument Notification
  virtual auto OnDidOpenTextDocument(DidOpenTextDocumentParams /*unused*/)
      -> asio::awaitable<std::expected<void, LspError>> {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kMethodNotImplemented,
        "OnDidOpenTextDocument is not implemented");
  }

  // DidChangeTextDocument Notification
  virtual auto OnDidChangeTextDocument(DidChangeTextDocumentParams /*unused*/)
      -> asio::awaitable<std::expected<void, LspError>> {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kMethodNotImplemented,
        "OnDidChangeTextDocument is not implemented");
  }

  // DidCloseTextDocument Notification
  virtual auto OnDidCloseTextDocument(DidCloseTextDocumentParams /*unused*/)
      -> asio::awaitable<std::expected<void, LspError>> {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kMethodNotImplemented,
        "OnDidCloseTextDocument is not implemented");
  }

  // Goto Definition Request
  virtual auto OnGotoDefinition(DefinitionParams /*unused*/)
      -> asio::awaitable<std::expected<DefinitionResult, LspError>> {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kMethodNotImplemented,
        "OnGotoDefinition is not implemented");
  }

  // Goto Type Definition Request
  virtual auto OnGotoTypeDefinition(TypeDefinitionParams /*unused*/)
      -> asio::awaitable<std::expected<TypeDefinitionResult, LspError>> {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kMethodNotImplemented,
        "OnGotoTypeDefinition is not implemented");
  }

  // Extended Definition Request (textDocument/xdefinition)
  virtual auto OnXDefinition(XDefinitionParams /*unused*/)
      -> asio::awaitable<std::expected<XDefinitionResult, LspError>> {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kMethodNotImplemented,
        "OnXDefinition is not implemented");
  }
};

}  // namespace lsp
