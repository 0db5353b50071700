#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace lsp {

using ProgressToken = std::string;

// URI
using DocumentUri = std::string;

// Position: zero-based line and character offset
struct Position {
  int line;
  int character;
};

void to_json(nlohmann::json& j, const Position& p);
void from_json(const nlohmann::json& j, Position& p);

// Range: half-open, end is exclusive
struct Range {
  Position start;
  Position end;
};

void to_json(nlohmann::json& j, const Range& r);
void from_json(const nlohmann::json& j, Range& r);

// Text Document Item
struct TextDocumentItem {
  DocumentUri uri;
  std::string languageId;
  int version;
  std::string text;
};

void to_json(nlohmann::json& j, const TextDocumentItem& t);
void from_json(const nlohmann::json& j, TextDocumentItem& t);

// Text Document Identifier
struct TextDocumentIdentifier {
  DocumentUri uri;
};

void to_json(nlohmann::json& j, const TextDocumentIdentifier& t);
void from_json(const nlohmann::json& j, TextDocumentIdentifier& t);

// Versioned Text Document Identifier
struct VersionedTextDocumentIdentifier : TextDocumentIdentifier {
  int version;
};

void to_json(nlohmann::json& j, const VersionedTextDocumentIdentifier& v);
void from_json(const nlohmann::json& j, VersionedTextDocumentIdentifier& v);

// Text Document Position Params
struct TextDocumentPositionParams {
  TextDocumentIdentifier textDocument;
  Position position;
};

void to_json(nlohmann::json& j, const TextDocumentPositionParams& t);
void from_json(const nlohmann::json& j, TextDocumentPositionParams& t);

// Location
struct Location {
  DocumentUri uri;
  Range range;
};

void to_json(nlohmann::json& j, const Location& l);
void from_json(const nlohmann::json& j, Location& l);

// Progress tokens carried by requests. Accepted and ignored.
struct WorkDoneProgressParams {
  std::optional<ProgressToken> workDoneToken;
};

struct PartialResultParams {
  std::optional<ProgressToken> partialResultToken;
};

// Trace Value
enum class TraceValue { kOff, kMessages, kVerbose };

void to_json(nlohmann::json& j, const TraceValue& t);
void from_json(const nlohmann::json& j, TraceValue& t);

// Workspace Folder
struct WorkspaceFolder {
  DocumentUri uri;
  std::string name;
};

void to_json(nlohmann::json& j, const WorkspaceFolder& w);
void from_json(const nlohmann::json& j, WorkspaceFolder& w);

}  // namespace lsp
