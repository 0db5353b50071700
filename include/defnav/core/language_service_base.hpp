#pragma once

#include <expected>
#include <string>
#include <vector>

#include <asio.hpp>
#include <lsp/basic.hpp>
#include <lsp/error.hpp>
#include <lsp/navigation.hpp>

namespace defnav {

using lsp::error::LspError;

// High-level operations the protocol layer delegates to. Keeps the server
// independent of how documents are analyzed.
class LanguageServiceBase {
 public:
  LanguageServiceBase() = default;
  LanguageServiceBase(const LanguageServiceBase&) = delete;
  LanguageServiceBase(LanguageServiceBase&&) = delete;
  auto operator=(const LanguageServiceBase&) -> LanguageServiceBase& = delete;
  auto operator=(LanguageServiceBase&&) -> LanguageServiceBase& = delete;
  virtual ~LanguageServiceBase() = default;

  // Workspace initialization - called during LSP initialize
  virtual auto InitializeWorkspace(std::string workspace_uri)
      -> asio::awaitable<void> = 0;

  virtual auto GetDefinition(lsp::DefinitionParams params) -> asio::awaitable<
      std::expected<lsp::DefinitionResult, LspError>> = 0;

  virtual auto GetTypeDefinition(lsp::TypeDefinitionParams params)
      -> asio::awaitable<
          std::expected<lsp::TypeDefinitionResult, LspError>> = 0;

  // Definition locations enriched with type locations and symbol descriptors
  virtual auto GetXDefinition(lsp::XDefinitionParams params)
      -> asio::awaitable<std::expected<lsp::XDefinitionResult, LspError>> = 0;

  // Document lifecycle events (protocol-level)
  virtual auto OnDocumentOpened(
      std::string uri, std::string content, int version)
      -> asio::awaitable<void> = 0;

  virtual auto OnDocumentChanged(
      std::string uri, std::string content, int version)
      -> asio::awaitable<void> = 0;

  virtual auto OnDocumentClosed(std::string uri) -> void = 0;

  virtual auto IsDocumentOpen(const std::string& uri) const -> bool = 0;
};

}  // namespace defnav
