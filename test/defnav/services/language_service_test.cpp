#include "defnav/services/language_service.hpp"

#include <string>

#include <asio.hpp>
#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

#include "../common/async_fixture.hpp"
#include "../common/workspace_fixture.hpp"

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");

  return Catch::Session().run(argc, argv);
}

using defnav::NavError;
using defnav::NavErrorCode;
using defnav::services::LanguageService;
using defnav::services::ToLspError;
using defnav::test::RunAsyncTest;
using defnav::test::WorkspaceFixture;
using lsp::error::LspErrorCode;

namespace {

constexpr std::string_view kCounterSource = R"(module counter;
  logic [7:0] value;
  always_comb begin
    value = 8'h00;
    undeclared_net = 1'b0;
  end
endmodule
)";

auto DefinitionAt(std::string uri, int line, int character)
    -> lsp::DefinitionParams {
  lsp::DefinitionParams params;
  params.textDocument.uri = std::move(uri);
  params.position = {.line = line, .character = character};
  return params;
}

}  // namespace

TEST_CASE(
    "LanguageService rejects requests before initialization",
    "[language_service]") {
  RunAsyncTest([](auto executor) -> asio::awaitable<void> {
    LanguageService service(executor);
    REQUIRE(!service.IsInitialized());

    auto result =
        co_await service.GetDefinition(DefinitionAt("file:///ws/a.sv", 0, 0));
    REQUIRE(!result.has_value());
    REQUIRE(result.error().Code() == LspErrorCode::kServerNotInitialized);
  });
}

TEST_CASE(
    "LanguageService resolves definitions in open documents",
    "[language_service]") {
  WorkspaceFixture workspace("defnav_service_test");
  workspace.CreateFile("rtl/counter.sv", kCounterSource);
  auto uri = workspace.UriOf("rtl/counter.sv");

  RunAsyncTest([&](auto executor) -> asio::awaitable<void> {
    LanguageService service(executor);
    co_await service.InitializeWorkspace(workspace.RootUri());
    REQUIRE(service.IsInitialized());

    co_await service.OnDocumentOpened(uri, std::string(kCounterSource), 1);
    REQUIRE(service.IsDocumentOpen(uri));

    // "value" on line 3
    auto definition = co_await service.GetDefinition(DefinitionAt(uri, 3, 4));
    REQUIRE(definition.has_value());
    REQUIRE(definition->size() == 1);
    REQUIRE(definition->front().uri == uri);
    REQUIRE(definition->front().range.start.line == 1);
    REQUIRE(definition->front().range.start.character == 14);

    lsp::TypeDefinitionParams type_params;
    type_params.textDocument.uri = uri;
    type_params.position = {.line = 3, .character = 4};
    auto type_definition = co_await service.GetTypeDefinition(type_params);
    REQUIRE(type_definition.has_value());
    REQUIRE(type_definition->empty());

    lsp::XDefinitionParams x_params{
        .textDocument = {.uri = uri},
        .position = {.line = 3, .character = 4},
    };
    auto xdefinition = co_await service.GetXDefinition(x_params);
    REQUIRE(xdefinition.has_value());
    REQUIRE(xdefinition->size() == 1);
    REQUIRE(xdefinition->front().symbol.has_value());
    REQUIRE(xdefinition->front().symbol->id == "rtl/counter/-/value");

    auto cached = service.GetPackageCache()->Lookup("counter");
    REQUIRE(cached.has_value());
    REQUIRE(cached->uri == uri);
  });
}

TEST_CASE(
    "LanguageService maps resolution failures to protocol errors",
    "[language_service]") {
  WorkspaceFixture workspace("defnav_service_test");
  workspace.CreateFile("rtl/counter.sv", kCounterSource);
  auto uri = workspace.UriOf("rtl/counter.sv");

  RunAsyncTest([&](auto executor) -> asio::awaitable<void> {
    LanguageService service(executor);
    co_await service.InitializeWorkspace(workspace.RootUri());
    co_await service.OnDocumentOpened(uri, std::string(kCounterSource), 1);

    auto outside = co_await service.GetDefinition(
        DefinitionAt("file:///elsewhere/other.sv", 0, 0));
    REQUIRE(!outside.has_value());
    REQUIRE(outside.error().Code() == LspErrorCode::kInvalidParams);
    REQUIRE_THAT(
        outside.error().Message(),
        Catch::Matchers::ContainsSubstring("textDocument/definition") &&
            Catch::Matchers::ContainsSubstring("file:///elsewhere/other.sv"));

    auto undeclared = co_await service.GetDefinition(DefinitionAt(uri, 4, 4));
    REQUIRE(!undeclared.has_value());
    REQUIRE(undeclared.error().Code() == LspErrorCode::kInternalError);
    REQUIRE(undeclared.error().Message() == "definition not found");

    // Leading whitespace is not a token
    auto whitespace = co_await service.GetDefinition(DefinitionAt(uri, 1, 0));
    REQUIRE(whitespace.has_value());
    REQUIRE(whitespace->empty());
  });
}

TEST_CASE("LanguageService document lifecycle", "[language_service]") {
  WorkspaceFixture workspace("defnav_service_test");
  auto uri = workspace.UriOf("rtl/scratch.sv");

  RunAsyncTest([&](auto executor) -> asio::awaitable<void> {
    LanguageService service(executor);
    co_await service.InitializeWorkspace(workspace.RootUri());

    co_await service.OnDocumentOpened(
        uri, "module scratch;\n  logic b;\nendmodule\n", 1);
    REQUIRE(service.IsDocumentOpen(uri));

    // Analysis registers the module
    auto first = co_await service.GetDefinition(DefinitionAt(uri, 1, 8));
    REQUIRE(first.has_value());
    REQUIRE(service.GetPackageCache()->Lookup("scratch").has_value());

    co_await service.OnDocumentChanged(
        uri, "module scratch2;\n  logic a;\nendmodule\n", 2);
    auto second = co_await service.GetDefinition(DefinitionAt(uri, 1, 8));
    REQUIRE(second.has_value());
    REQUIRE(second->size() == 1);
    REQUIRE(second->front().range.start.line == 1);

    service.OnDocumentClosed(uri);
    REQUIRE(!service.IsDocumentOpen(uri));
    REQUIRE(!service.GetPackageCache()->Lookup("scratch2").has_value());

    // Neither open nor on disk
    auto closed = co_await service.GetDefinition(DefinitionAt(uri, 0, 7));
    REQUIRE(!closed.has_value());
    REQUIRE(closed.error().Code() == LspErrorCode::kDocumentNotFound);
  });
}

TEST_CASE("ToLspError maps every error code", "[language_service]") {
  auto code_of = [](NavErrorCode code) {
    return ToLspError(NavError(code)).Code();
  };

  REQUIRE(
      code_of(NavErrorCode::kInvalidParams) == LspErrorCode::kInvalidParams);
  REQUIRE(
      code_of(NavErrorCode::kDocumentNotFound) ==
      LspErrorCode::kDocumentNotFound);
  REQUIRE(
      code_of(NavErrorCode::kCancelled) == LspErrorCode::kRequestCancelled);
  REQUIRE(code_of(NavErrorCode::kNotFound) == LspErrorCode::kInternalError);
  REQUIRE(
      code_of(NavErrorCode::kTypeCheckFailed) == LspErrorCode::kInternalError);
  REQUIRE(
      code_of(NavErrorCode::kInternalError) == LspErrorCode::kInternalError);

  auto error = ToLspError(NavError(NavErrorCode::kNotFound));
  REQUIRE(error.Message() == "definition not found");
  REQUIRE(error.WireCode() == -32603);
  REQUIRE(ToLspError(NavError(NavErrorCode::kInvalidParams)).WireCode() ==
          -32602);
}
