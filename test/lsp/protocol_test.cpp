#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

#include "lsp/document_sync.hpp"
#include "lsp/error.hpp"
#include "lsp/lifecycle.hpp"
#include "lsp/navigation.hpp"

TEST_CASE("Location serialization", "[lsp]") {
  lsp::Location location{
      .uri = "file:///ws/rtl/top.sv",
      .range = {
          .start = {.line = 10, .character = 2},
          .end = {.line = 10, .character = 7}}};

  nlohmann::json j = location;

  REQUIRE(j["uri"] == "file:///ws/rtl/top.sv");
  REQUIRE(j["range"]["start"]["line"] == 10);
  REQUIRE(j["range"]["start"]["character"] == 2);
  REQUIRE(j["range"]["end"]["character"] == 7);

  auto decoded = j.get<lsp::Location>();
  REQUIRE(decoded.uri == location.uri);
  REQUIRE(decoded.range.end.character == 7);
}

TEST_CASE("DefinitionParams deserialization", "[lsp]") {
  auto j = nlohmann::json::parse(R"({
    "textDocument": {"uri": "file:///ws/rtl/top.sv"},
    "position": {"line": 3, "character": 14},
    "workDoneToken": "wd-1"
  })");

  auto params = j.get<lsp::DefinitionParams>();
  REQUIRE(params.textDocument.uri == "file:///ws/rtl/top.sv");
  REQUIRE(params.position.line == 3);
  REQUIRE(params.position.character == 14);
  REQUIRE(params.workDoneToken == "wd-1");
  REQUIRE(!params.partialResultToken.has_value());
}

TEST_CASE("SymbolLocationInformation serialization", "[lsp]") {
  lsp::SymbolLocationInformation info{
      .location = {.uri = "file:///ws/rtl/top.sv"},
      .typeLocation = std::nullopt,
      .symbol = lsp::SymbolDescriptor{
          .vendor = false,
          .package = "rtl/top",
          .packageName = "top",
          .recv = "",
          .name = "count",
          .id = "rtl/top/-/count"}};

  nlohmann::json j = info;

  // Absent optionals are omitted rather than null
  REQUIRE(!j.contains("typeLocation"));
  REQUIRE(j["symbol"]["packageName"] == "top");
  REQUIRE(j["symbol"]["id"] == "rtl/top/-/count");
  REQUIRE(j["symbol"]["vendor"] == false);

  auto decoded = j.get<lsp::SymbolLocationInformation>();
  REQUIRE(decoded.symbol.has_value());
  REQUIRE(decoded.symbol->name == "count");
  REQUIRE(!decoded.typeLocation.has_value());
}

TEST_CASE("DidChangeTextDocumentParams full and ranged changes", "[lsp]") {
  auto j = nlohmann::json::parse(R"({
    "textDocument": {"uri": "file:///ws/a.sv", "version": 4},
    "contentChanges": [
      {"text": "module a; endmodule"},
      {"range": {"start": {"line": 0, "character": 0},
                 "end": {"line": 0, "character": 6}}, "text": "module"}
    ]
  })");

  auto params = j.get<lsp::DidChangeTextDocumentParams>();
  REQUIRE(params.textDocument.version == 4);
  REQUIRE(params.contentChanges.size() == 2);
  REQUIRE(params.contentChanges[0].IsFullContent());
  REQUIRE(!params.contentChanges[1].IsFullContent());
}

TEST_CASE("ServerCapabilities advertise the definition family", "[lsp]") {
  lsp::ServerCapabilities capabilities{
      .textDocumentSync =
          lsp::TextDocumentSyncOptions{
              .openClose = true, .change = lsp::TextDocumentSyncKind::kFull},
      .definitionProvider = true,
      .typeDefinitionProvider = true,
      .xdefinitionProvider = true,
  };

  nlohmann::json j = capabilities;
  REQUIRE(j["textDocumentSync"]["change"] == 1);
  REQUIRE(j["definitionProvider"] == true);
  REQUIRE(j["typeDefinitionProvider"] == true);
  REQUIRE(j["xdefinitionProvider"] == true);
}

TEST_CASE("InitializeParams keeps client capabilities verbatim", "[lsp]") {
  auto j = nlohmann::json::parse(R"({
    "processId": 42,
    "rootUri": "file:///ws",
    "capabilities": {"textDocument": {"definition": {"linkSupport": true}}}
  })");

  auto params = j.get<lsp::InitializeParams>();
  REQUIRE(params.processId == 42);
  REQUIRE(params.rootUri == "file:///ws");
  REQUIRE(params.capabilities.has_value());
  REQUIRE(
      (*params.capabilities)["textDocument"]["definition"]["linkSupport"] ==
      true);
  REQUIRE(!params.workspaceFolders.has_value());
}

TEST_CASE("LspError wire codes", "[lsp]") {
  using lsp::error::LspError;
  using lsp::error::LspErrorCode;

  auto invalid = LspError::FromCode(LspErrorCode::kInvalidParams, "bad uri");
  REQUIRE(invalid.ToJson()["code"] == -32602);
  REQUIRE(invalid.ToJson()["message"] == "bad uri");

  REQUIRE(
      LspError::FromCode(LspErrorCode::kInternalError).WireCode() == -32603);
  REQUIRE(
      LspError::FromCode(LspErrorCode::kServerNotInitialized).WireCode() ==
      -32002);
  REQUIRE(
      LspError::FromCode(LspErrorCode::kRequestCancelled).WireCode() == -32800);
  REQUIRE(
      LspError::FromCode(LspErrorCode::kRequestCancelled).Message() ==
      "Request cancelled");
}

TEST_CASE("LspError document errors", "[lsp]") {
  using lsp::error::LspError;
  using lsp::error::LspErrorCode;

  auto missing = LspError::FromCode(LspErrorCode::kDocumentNotFound);
  REQUIRE(missing.Message() == "Document not found");
  REQUIRE(missing.WireCode() == -32001);
  REQUIRE(missing.ToJson()["code"] == -32001);

  // The last enumerator: every code before it has its own default message
  REQUIRE(
      LspError::FromCode(LspErrorCode::kUnknownError).Message() ==
      "Unknown error");
  for (int i = 0; i < static_cast<int>(LspErrorCode::kUnknownError); ++i) {
    auto error = LspError::FromCode(static_cast<LspErrorCode>(i));
    REQUIRE(error.Message() != "Unknown error");
  }
}
