#include "lsp/lsp_server.hpp"

#include <asio.hpp>
#include <jsonrpc/endpoint/endpoint.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace lsp {

using lsp::error::LspError;
using lsp::error::Ok;

LspServer::LspServer(
    asio::any_io_executor executor,
    std::unique_ptr<jsonrpc::endpoint::RpcEndpoint> endpoint,
    std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? logger : spdlog::default_logger()),
      endpoint_(std::move(endpoint)),
      executor_(executor),
      work_guard_(asio::make_work_guard(executor)) {
}

auto LspServer::Start() -> asio::awaitable<std::expected<void, LspError>> {
  RegisterHandlers();

  auto result = co_await endpoint_->Start();
  if (!result) {
    Logger()->error("LspServer endpoint error: {}", result.error().Message());
    co_return LspError::UnexpectedFromRpcError(result.error());
  }
  Logger()->debug("LspServer endpoint started");

  auto shutdown_result = co_await endpoint_->WaitForShutdown();
  if (!shutdown_result) {
    Logger()->error(
        "LspServer endpoint wait for shutdown error: {}",
        shutdown_result.error().Message());
    co_return LspError::UnexpectedFromRpcError(shutdown_result.error());
  }
  Logger()->debug("LspServer endpoint wait for shutdown completed");

  co_return Ok();
}

auto LspServer::Shutdown() -> asio::awaitable<std::expected<void, LspError>> {
  Logger()->debug("LspServer shutting down");

  if (endpoint_) {
    auto result = co_await endpoint_->Shutdown();
    if (!result) {
      Logger()->error(
          "LspServer endpoint shutdown error: {}", result.error().Message());
      co_return LspError::UnexpectedFromRpcError(result.error());
    }
    Logger()->debug("LspServer endpoint shutdown");
  }

  // Let the io_context run dry
  work_guard_.reset();

  co_return Ok();
}

void LspServer::RegisterHandlers() {
  RegisterLifecycleHandlers();
  RegisterDocumentSyncHandlers();
  RegisterLanguageFeatureHandlers();
}

void LspServer::RegisterLifecycleHandlers() {
  endpoint_->RegisterMethodCall<InitializeParams, InitializeResult, LspError>(
      "initialize",
      [this](const InitializeParams& params) { return OnInitialize(params); });

  endpoint_->RegisterNotification<InitializedParams, LspError>(
      "initialized", [this](const InitializedParams& params) {
        return OnInitialized(params);
      });

  endpoint_->RegisterMethodCall<ShutdownParams, ShutdownResult, LspError>(
      "shutdown",
      [this](const ShutdownParams& params) { return OnShutdown(params); });

  endpoint_->RegisterNotification<ExitParams, LspError>(
      "exit", [this](const ExitParams& params) { return OnExit(params); });
}

void LspServer::RegisterDocumentSyncHandlers() {
  endpoint_->RegisterNotification<DidOpenTextDocumentParams, LspError>(
      "textDocument/didOpen", [this](const DidOpenTextDocumentParams& params) {
        return OnDidOpenTextDocument(params);
      });

  endpoint_->RegisterNotification<DidChangeTextDocumentParams, LspError>(
      "textDocument/didChange",
      [this](const DidChangeTextDocumentParams& params) {
        return OnDidChangeTextDocument(params);
      });

  endpoint_->RegisterNotification<DidCloseTextDocumentParams, LspError>(
      "textDocument/didClose",
      [this](const DidCloseTextDocumentParams& params) {
        return OnDidCloseTextDocument(params);
      });
}

void LspServer::RegisterLanguageFeatureHandlers() {
  endpoint_->RegisterMethodCall<DefinitionParams, DefinitionResult, LspError>(
      "textDocument/definition", [this](const DefinitionParams& params) {
        return OnGotoDefinition(params);
      });

  endpoint_->RegisterMethodCall<
      TypeDefinitionParams, TypeDefinitionResult, LspError>(
      "textDocument/typeDefinition",
      [this](const TypeDefinitionParams& params) {
        return OnGotoTypeDefinition(params);
      });

  endpoint_->RegisterMethodCall<
      XDefinitionParams, XDefinitionResult, LspError>(
      "textDocument/xdefinition", [this](const XDefinitionParams& params) {
        return OnXDefinition(params);
      });
}

}  // namespace lsp
