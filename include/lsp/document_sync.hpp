#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "lsp/basic.hpp"

namespace lsp {

// DidOpenTextDocument Notification
struct DidOpenTextDocumentParams {
  TextDocumentItem textDocument;
};

void to_json(nlohmann::json& j, const DidOpenTextDocumentParams& p);
void from_json(const nlohmann::json& j, DidOpenTextDocumentParams& p);

// DidChangeTextDocument Notification
//
// The server advertises full synchronization, so a change without a range
// carries the whole document. Ranged changes are decoded but not applied.
struct TextDocumentContentChangeEvent {
  std::optional<Range> range;
  std::string text;

  [[nodiscard]] auto IsFullContent() const -> bool {
    return !range.has_value();
  }
};

void to_json(nlohmann::json& j, const TextDocumentContentChangeEvent& e);
void from_json(const nlohmann::json& j, TextDocumentContentChangeEvent& e);

struct DidChangeTextDocumentParams {
  VersionedTextDocumentIdentifier textDocument;
  std::vector<TextDocumentContentChangeEvent> contentChanges;
};

void to_json(nlohmann::json& j, const DidChangeTextDocumentParams& p);
void from_json(const nlohmann::json& j, DidChangeTextDocumentParams& p);

// DidCloseTextDocument Notification
struct DidCloseTextDocumentParams {
  TextDocumentIdentifier textDocument;
};

void to_json(nlohmann::json& j, const DidCloseTextDocumentParams& p);
void from_json(const nlohmann::json& j, DidCloseTextDocumentParams& p);

}  // namespace lsp
