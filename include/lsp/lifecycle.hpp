#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "lsp/basic.hpp"

namespace lsp {

// Initialize Request
struct InitializeParams : WorkDoneProgressParams {
  std::optional<int> processId;
  struct ClientInfo {
    std::string name;
    std::optional<std::string> version;
  };
  std::optional<ClientInfo> clientInfo;
  std::optional<std::string> rootPath;
  std::optional<DocumentUri> rootUri;
  std::optional<nlohmann::json> initializationOptions;

  // Client capabilities are not consulted; kept verbatim
  std::optional<nlohmann::json> capabilities;
  std::optional<TraceValue> trace;
  std::optional<std::vector<WorkspaceFolder>> workspaceFolders;
};

void to_json(nlohmann::json& j, const InitializeParams::ClientInfo& p);
void from_json(const nlohmann::json& j, InitializeParams::ClientInfo& p);

void to_json(nlohmann::json& j, const InitializeParams& p);
void from_json(const nlohmann::json& j, InitializeParams& p);

enum class TextDocumentSyncKind {
  kNone = 0,
  kFull = 1,
  kIncremental = 2,
};

void to_json(nlohmann::json& j, const TextDocumentSyncKind& k);
void from_json(const nlohmann::json& j, TextDocumentSyncKind& k);

struct TextDocumentSyncOptions {
  std::optional<bool> openClose;
  std::optional<TextDocumentSyncKind> change;
};

void to_json(nlohmann::json& j, const TextDocumentSyncOptions& o);
void from_json(const nlohmann::json& j, TextDocumentSyncOptions& o);

struct ServerCapabilities {
  std::optional<TextDocumentSyncOptions> textDocumentSync;
  std::optional<bool> definitionProvider;
  std::optional<bool> typeDefinitionProvider;

  // Extension capability announcing textDocument/xdefinition
  std::optional<bool> xdefinitionProvider;
};

void to_json(nlohmann::json& j, const ServerCapabilities& c);
void from_json(const nlohmann::json& j, ServerCapabilities& c);

struct InitializeResult {
  ServerCapabilities capabilities;
  struct ServerInfo {
    std::string name;
    std::optional<std::string> version;
  };
  std::optional<ServerInfo> serverInfo;
};

void to_json(nlohmann::json& j, const InitializeResult::ServerInfo& p);
void from_json(const nlohmann::json& j, InitializeResult::ServerInfo& p);

void to_json(nlohmann::json& j, const InitializeResult& p);
void from_json(const nlohmann::json& j, InitializeResult& p);

// Initialized Notification
struct InitializedParams {};

void to_json(nlohmann::json& j, const InitializedParams& p);
void from_json(const nlohmann::json& j, InitializedParams& p);

// Shutdown Request
struct ShutdownParams {};

void to_json(nlohmann::json& j, const ShutdownParams& p);
void from_json(const nlohmann::json& j, ShutdownParams& p);

struct ShutdownResult {};

void to_json(nlohmann::json& j, const ShutdownResult& p);
void from_json(const nlohmann::json& j, ShutdownResult& p);

// Exit Notification
struct ExitParams {};

void to_json(nlohmann::json& j, const ExitParams& p);
void from_json(const nlohmann::json& j, ExitParams& p);

}  // namespace lsp
