#include "lsp/basic.hpp"

#include <stdexcept>

#include "lsp/json_utils.hpp"

namespace lsp {

// Position
void to_json(nlohmann::json& j, const Position& p) {
  j = nlohmann::json{{"line", p.line}, {"character", p.character}};
}

void from_json(const nlohmann::json& j, Position& p) {
  j.at("line").get_to(p.line);
  j.at("character").get_to(p.character);
}

// Range
void to_json(nlohmann::json& j, const Range& r) {
  j = nlohmann::json{{"start", r.start}, {"end", r.end}};
}

void from_json(const nlohmann::json& j, Range& r) {
  j.at("start").get_to(r.start);
  j.at("end").get_to(r.end);
}

// Text Document Item
void to_json(nlohmann::json& j, const TextDocumentItem& t) {
  j = nlohmann::json{
      {"uri", t.uri},
      {"languageId", t.languageId},
      {"version", t.version},
      {"text", t.text}};
}

void from_json(const nlohmann::json& j, TextDocumentItem& t) {
  j.at("uri").get_to(t.uri);
  j.at("languageId").get_to(t.languageId);
  j.at("version").get_to(t.version);
  j.at("text").get_to(t.text);
}

// Text Document Identifier
void to_json(nlohmann::json& j, const TextDocumentIdentifier& t) {
  j = nlohmann::json{{"uri", t.uri}};
}

void from_json(const nlohmann::json& j, TextDocumentIdentifier& t) {
  j.at("uri").get_to(t.uri);
}

// Versioned Text Document Identifier
void to_json(nlohmann::json& j, const VersionedTextDocumentIdentifier& v) {
  j = nlohmann::json{{"uri", v.uri}, {"version", v.version}};
}

void from_json(const nlohmann::json& j, VersionedTextDocumentIdentifier& v) {
  j.at("uri").get_to(v.uri);
  j.at("version").get_to(v.version);
}

// Text Document Position Params
void to_json(nlohmann::json& j, const TextDocumentPositionParams& t) {
  j = nlohmann::json{
      {"textDocument", t.textDocument}, {"position", t.position}};
}

void from_json(const nlohmann::json& j, TextDocumentPositionParams& t) {
  j.at("textDocument").get_to(t.textDocument);
  j.at("position").get_to(t.position);
}

// Location
void to_json(nlohmann::json& j, const Location& l) {
  j = nlohmann::json{{"uri", l.uri}, {"range", l.range}};
}

void from_json(const nlohmann::json& j, Location& l) {
  j.at("uri").get_to(l.uri);
  j.at("range").get_to(l.range);
}

// Trace Value
void to_json(nlohmann::json& j, const TraceValue& t) {
  switch (t) {
    case TraceValue::kOff:
      j = "off";
      break;
    case TraceValue::kMessages:
      j = "messages";
      break;
    case TraceValue::kVerbose:
      j = "verbose";
      break;
  }
}

void from_json(const nlohmann::json& j, TraceValue& t) {
  auto s = j.get<std::string>();
  if (s == "off") {
    t = TraceValue::kOff;
  } else if (s == "messages") {
    t = TraceValue::kMessages;
  } else if (s == "verbose") {
    t = TraceValue::kVerbose;
  } else {
    throw std::runtime_error("Invalid trace value: " + s);
  }
}

// Workspace Folder
void to_json(nlohmann::json& j, const WorkspaceFolder& w) {
  j = nlohmann::json{{"uri", w.uri}, {"name", w.name}};
}

void from_json(const nlohmann::json& j, WorkspaceFolder& w) {
  j.at("uri").get_to(w.uri);
  j.at("name").get_to(w.name);
}

}  // namespace lsp
