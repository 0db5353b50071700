#include "defnav/navigation/definition_resolver.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

#include "../common/package_fixture.hpp"

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");

  return Catch::Session().run(argc, argv);
}

namespace {

using defnav::CanonicalPath;
using defnav::NavError;
using defnav::NavErrorCode;
using defnav::RequestContext;
using defnav::analysis::ObjectKind;
using defnav::analysis::SyntaxNodeKind;
using defnav::navigation::DefinitionResolver;
using defnav::navigation::MakeFindPackageFunc;
using defnav::navigation::PackageCache;
using defnav::navigation::PackageInfo;
using defnav::navigation::PackageLookup;
using defnav::test::FixedTypeChecker;
using defnav::test::PackageFixture;

constexpr std::string_view kUri = "file:///ws/rtl/top.sv";

constexpr std::string_view kSource = R"(package pkg;
  typedef struct { int a; } point_t;
endpackage

module top;
  int count;
  pkg::point_t origin;
  // count here
  initial begin
    count = $clog2(origin.a);
    missing_sig = 1;
  end
endmodule
)";

// Hand-built analysis of kSource
struct TopDesign {
  PackageFixture fixture{"top"};
  std::shared_ptr<FixedTypeChecker> checker;
  std::shared_ptr<PackageCache> cache = std::make_shared<PackageCache>();

  TopDesign() {
    auto& root = fixture.AddFile(std::string(kUri), std::string(kSource));

    auto& pkg = fixture.Declare(ObjectKind::kPackage, kUri, "pkg");
    auto& point_t =
        fixture.Declare(ObjectKind::kTypeName, kUri, "point_t", 0, &pkg);
    point_t.type = &fixture.NamedType(point_t);

    auto& top = fixture.Declare(ObjectKind::kModule, kUri, "top");
    auto& count = fixture.Declare(
        ObjectKind::kVariable, kUri, "count", 0, &top,
        &fixture.BasicType("int"));
    auto& origin = fixture.Declare(
        ObjectKind::kVariable, kUri, "origin", 0, &top, point_t.type);
    auto& clog2 = fixture.Builtin("$clog2");

    auto& package = fixture.Get();

    auto& pkg_node = fixture.AddNode(
        root, SyntaxNodeKind::kOther, kUri, "package pkg", "endpackage");
    package.RecordDef(fixture.AddIdent(pkg_node, kUri, "pkg"), pkg);
    auto& typedef_node = fixture.AddNode(
        pkg_node, SyntaxNodeKind::kTypeDeclaration, kUri, "typedef", "point_t",
        "point_t");
    auto& point_t_name = fixture.AddIdent(typedef_node, kUri, "point_t");
    typedef_node.SetDeclaredName(&point_t_name);
    package.RecordDef(point_t_name, point_t);

    auto& module_node = fixture.AddNode(
        root, SyntaxNodeKind::kOther, kUri, "module top", "endmodule");
    package.RecordDef(fixture.AddIdent(module_node, kUri, "top"), top);
    package.RecordDef(fixture.AddIdent(module_node, kUri, "count", 0), count);
    package.RecordUse(fixture.AddIdent(module_node, kUri, "pkg", 1), pkg);
    package.RecordUse(
        fixture.AddIdent(module_node, kUri, "point_t", 1), point_t);
    package.RecordDef(
        fixture.AddIdent(module_node, kUri, "origin", 0), origin);
    package.RecordUse(fixture.AddIdent(module_node, kUri, "count", 2), count);
    package.RecordUse(fixture.AddIdent(module_node, kUri, "$clog2"), clog2);
    package.RecordUse(
        fixture.AddIdent(module_node, kUri, "origin", 1), origin);
    // Unresolved: no index entry
    fixture.AddIdent(module_node, kUri, "missing_sig");

    checker = std::make_shared<FixedTypeChecker>(fixture.Share());
    cache->UpdateDocument(
        kUri, {
                  PackageInfo{
                      .name = "pkg",
                      .kind = ObjectKind::kPackage,
                      .uri = std::string(kUri)},
                  PackageInfo{
                      .name = "top",
                      .kind = ObjectKind::kModule,
                      .uri = std::string(kUri)},
              });
  }

  auto MakeResolver(std::shared_ptr<const PackageCache> package_cache)
      -> DefinitionResolver {
    return DefinitionResolver(
        checker, std::move(package_cache),
        MakeFindPackageFunc(PackageLookup::kWorkspace), CanonicalPath("/ws"));
  }

  auto MakeResolver() -> DefinitionResolver {
    return MakeResolver(cache);
  }
};

auto RangeOf(
    const PackageFixture& fixture, std::string_view text, int occurrence)
    -> lsp::Range {
  auto start = fixture.PositionOf(kUri, text, occurrence);
  return lsp::Range{
      .start = start,
      .end = {
          .line = start.line,
          .character = start.character + static_cast<int>(text.size())}};
}

void RequireRange(const lsp::Range& actual, const lsp::Range& expected) {
  REQUIRE(actual.start.line == expected.start.line);
  REQUIRE(actual.start.character == expected.start.character);
  REQUIRE(actual.end.line == expected.end.line);
  REQUIRE(actual.end.character == expected.end.character);
}

}  // namespace

TEST_CASE(
    "DefinitionResolver variable of basic type has no type definition",
    "[definition_resolver]") {
  TopDesign design;
  auto resolver = design.MakeResolver();
  auto params = design.fixture.Params(kUri, "count", 2);

  auto definition =
      resolver.Definition(RequestContext("textDocument/definition"), params);
  REQUIRE(definition.has_value());
  REQUIRE(definition->size() == 1);
  REQUIRE(definition->front().uri == kUri);
  RequireRange(definition->front().range, RangeOf(design.fixture, "count", 0));

  auto type_definition = resolver.TypeDefinition(
      RequestContext("textDocument/typeDefinition"), params);
  REQUIRE(type_definition.has_value());
  REQUIRE(type_definition->empty());
}

TEST_CASE(
    "DefinitionResolver variable of declared struct type resolves both",
    "[definition_resolver]") {
  TopDesign design;
  auto resolver = design.MakeResolver();
  auto params = design.fixture.Params(kUri, "origin", 1);

  auto definition =
      resolver.Definition(RequestContext("textDocument/definition"), params);
  REQUIRE(definition.has_value());
  REQUIRE(definition->size() == 1);
  RequireRange(
      definition->front().range, RangeOf(design.fixture, "origin", 0));

  auto type_definition = resolver.TypeDefinition(
      RequestContext("textDocument/typeDefinition"), params);
  REQUIRE(type_definition.has_value());
  REQUIRE(type_definition->size() == 1);
  RequireRange(
      type_definition->front().range, RangeOf(design.fixture, "point_t", 0));
}

TEST_CASE(
    "DefinitionResolver type declaration name resolves to itself",
    "[definition_resolver]") {
  TopDesign design;
  auto resolver = design.MakeResolver();
  auto expected = RangeOf(design.fixture, "point_t", 0);

  SECTION("Cursor on the name token") {
    auto definition = resolver.Definition(
        RequestContext("textDocument/definition"),
        design.fixture.Params(kUri, "point_t", 0));
    REQUIRE(definition.has_value());
    REQUIRE(definition->size() == 1);
    RequireRange(definition->front().range, expected);
  }

  SECTION("Cursor elsewhere in the declaration uses its declared name") {
    auto definition = resolver.Definition(
        RequestContext("textDocument/definition"),
        design.fixture.Params(kUri, "typedef", 0));
    REQUIRE(definition.has_value());
    REQUIRE(definition->size() == 1);
    RequireRange(definition->front().range, expected);
  }
}

TEST_CASE(
    "DefinitionResolver cursor on a comment yields empty results",
    "[definition_resolver]") {
  TopDesign design;
  auto resolver = design.MakeResolver();
  auto params = design.fixture.Params(kUri, "count here");

  auto definition =
      resolver.Definition(RequestContext("textDocument/definition"), params);
  REQUIRE(definition.has_value());
  REQUIRE(definition->empty());

  auto type_definition = resolver.TypeDefinition(
      RequestContext("textDocument/typeDefinition"), params);
  REQUIRE(type_definition.has_value());
  REQUIRE(type_definition->empty());
}

TEST_CASE(
    "DefinitionResolver builtin call yields empty results",
    "[definition_resolver]") {
  TopDesign design;
  auto resolver = design.MakeResolver();
  auto params = design.fixture.Params(kUri, "$clog2");

  auto definition =
      resolver.Definition(RequestContext("textDocument/definition"), params);
  REQUIRE(definition.has_value());
  REQUIRE(definition->empty());

  auto type_definition = resolver.TypeDefinition(
      RequestContext("textDocument/typeDefinition"), params);
  REQUIRE(type_definition.has_value());
  REQUIRE(type_definition->empty());

  auto xdefinition =
      resolver.XDefinition(RequestContext("textDocument/xdefinition"), params);
  REQUIRE(xdefinition.has_value());
  REQUIRE(xdefinition->empty());
}

TEST_CASE(
    "DefinitionResolver rejects URIs outside the workspace",
    "[definition_resolver]") {
  TopDesign design;
  auto resolver = design.MakeResolver();
  lsp::TextDocumentPositionParams params{
      .textDocument = {.uri = "file:///elsewhere/other.sv"},
      .position = {.line = 0, .character = 0},
  };

  auto definition =
      resolver.Definition(RequestContext("textDocument/definition"), params);
  REQUIRE(!definition.has_value());
  REQUIRE(definition.error().Is(NavErrorCode::kInvalidParams));
  REQUIRE_THAT(
      definition.error().Message(),
      Catch::Matchers::ContainsSubstring("textDocument/definition") &&
          Catch::Matchers::ContainsSubstring("file:///elsewhere/other.sv"));

  auto type_definition = resolver.TypeDefinition(
      RequestContext("textDocument/typeDefinition"), params);
  REQUIRE(!type_definition.has_value());
  REQUIRE(type_definition.error().Is(NavErrorCode::kInvalidParams));
  REQUIRE_THAT(
      type_definition.error().Message(),
      Catch::Matchers::ContainsSubstring("textDocument/typeDefinition"));

  // Rejected before any analysis
  REQUIRE(design.checker->CallCount() == 0);
}

TEST_CASE(
    "DefinitionResolver rejects URIs that are not file URIs",
    "[definition_resolver]") {
  TopDesign design;
  auto resolver = design.MakeResolver();
  lsp::TextDocumentPositionParams params{
      .textDocument = {.uri = "untitled:Untitled-1"},
      .position = {.line = 0, .character = 0},
  };

  auto definition =
      resolver.Definition(RequestContext("textDocument/definition"), params);
  REQUIRE(!definition.has_value());
  REQUIRE(definition.error().Is(NavErrorCode::kInvalidParams));
}

TEST_CASE(
    "DefinitionResolver unresolved identifier is a hard error",
    "[definition_resolver]") {
  TopDesign design;
  auto resolver = design.MakeResolver();

  auto definition = resolver.Definition(
      RequestContext("textDocument/definition"),
      design.fixture.Params(kUri, "missing_sig"));
  REQUIRE(!definition.has_value());
  REQUIRE(definition.error().Is(NavErrorCode::kNotFound));
  REQUIRE(definition.error().Message() == "definition not found");
}

TEST_CASE(
    "DefinitionResolver propagates type checker failures",
    "[definition_resolver]") {
  TopDesign design;
  auto resolver = design.MakeResolver();
  design.checker->FailWith(
      NavError(NavErrorCode::kTypeCheckFailed, "elaboration blew up"));

  auto definition = resolver.Definition(
      RequestContext("textDocument/definition"),
      design.fixture.Params(kUri, "count", 2));
  REQUIRE(!definition.has_value());
  REQUIRE(definition.error().Is(NavErrorCode::kTypeCheckFailed));
  REQUIRE(definition.error().Message() == "elaboration blew up");
}

TEST_CASE(
    "DefinitionResolver reports type checker exceptions as internal errors",
    "[definition_resolver]") {
  TopDesign design;
  auto resolver = design.MakeResolver();
  design.checker->ThrowWith("out of memory");

  auto definition = resolver.Definition(
      RequestContext("textDocument/definition"),
      design.fixture.Params(kUri, "count", 2));
  REQUIRE(!definition.has_value());
  REQUIRE(definition.error().Is(NavErrorCode::kInternalError));
  REQUIRE_THAT(
      definition.error().Message(),
      Catch::Matchers::ContainsSubstring("textDocument/definition") &&
          Catch::Matchers::ContainsSubstring("out of memory"));

  auto xdefinition = resolver.XDefinition(
      RequestContext("textDocument/xdefinition"),
      design.fixture.Params(kUri, "origin", 1));
  REQUIRE(!xdefinition.has_value());
  REQUIRE(xdefinition.error().Is(NavErrorCode::kInternalError));
  REQUIRE(design.checker->CallCount() == 2);
}

TEST_CASE(
    "DefinitionResolver XDefinition attaches symbol descriptors",
    "[definition_resolver]") {
  TopDesign design;
  auto resolver = design.MakeResolver();

  SECTION("Module member") {
    auto result = resolver.XDefinition(
        RequestContext("textDocument/xdefinition"),
        design.fixture.Params(kUri, "origin", 1));
    REQUIRE(result.has_value());
    REQUIRE(result->size() == 1);

    const auto& info = result->front();
    REQUIRE(info.typeLocation.has_value());
    REQUIRE(info.symbol.has_value());
    REQUIRE(info.symbol->packageName == "top");
    REQUIRE(info.symbol->package == "rtl/top");
    REQUIRE(info.symbol->name == "origin");
    REQUIRE(info.symbol->recv.empty());
    REQUIRE(info.symbol->id == "rtl/top/-/origin");
    REQUIRE(!info.symbol->vendor);
  }

  SECTION("Package member") {
    auto result = resolver.XDefinition(
        RequestContext("textDocument/xdefinition"),
        design.fixture.Params(kUri, "point_t", 1));
    REQUIRE(result.has_value());
    REQUIRE(result->size() == 1);
    REQUIRE(result->front().symbol.has_value());
    REQUIRE(result->front().symbol->id == "rtl/pkg/-/point_t");
  }
}

TEST_CASE(
    "DefinitionResolver enrichment failure only omits the descriptor",
    "[definition_resolver]") {
  TopDesign design;
  auto enriched = design.MakeResolver();
  auto bare = design.MakeResolver(std::make_shared<PackageCache>());
  auto params = design.fixture.Params(kUri, "origin", 1);

  auto with_cache =
      enriched.XDefinition(RequestContext("textDocument/xdefinition"), params);
  auto without_cache =
      bare.XDefinition(RequestContext("textDocument/xdefinition"), params);

  REQUIRE(with_cache.has_value());
  REQUIRE(without_cache.has_value());
  REQUIRE(with_cache->size() == without_cache->size());
  REQUIRE(with_cache->front().symbol.has_value());
  REQUIRE(!without_cache->front().symbol.has_value());

  REQUIRE(with_cache->front().location.uri ==
          without_cache->front().location.uri);
  RequireRange(
      without_cache->front().location.range,
      with_cache->front().location.range);
  REQUIRE(without_cache->front().typeLocation.has_value());
}

TEST_CASE(
    "DefinitionResolver type definitions never outnumber definitions",
    "[definition_resolver]") {
  TopDesign design;
  auto resolver = design.MakeResolver();

  auto [text, occurrence] = GENERATE(
      std::pair<std::string_view, int>{"count", 0},
      std::pair<std::string_view, int>{"count", 2},
      std::pair<std::string_view, int>{"origin", 1},
      std::pair<std::string_view, int>{"point_t", 0},
      std::pair<std::string_view, int>{"pkg", 1},
      std::pair<std::string_view, int>{"$clog2", 0},
      std::pair<std::string_view, int>{"count here", 0});

  CAPTURE(text, occurrence);
  auto params = design.fixture.Params(kUri, text, occurrence);

  auto definition =
      resolver.Definition(RequestContext("textDocument/definition"), params);
  auto type_definition = resolver.TypeDefinition(
      RequestContext("textDocument/typeDefinition"), params);
  REQUIRE(definition.has_value());
  REQUIRE(type_definition.has_value());
  REQUIRE(type_definition->size() <= definition->size());
}

TEST_CASE(
    "DefinitionResolver runs one analysis pass per request",
    "[definition_resolver]") {
  TopDesign design;
  auto resolver = design.MakeResolver();
  auto params = design.fixture.Params(kUri, "origin", 1);

  REQUIRE(resolver
              .Definition(RequestContext("textDocument/definition"), params)
              .has_value());
  REQUIRE(design.checker->CallCount() == 1);

  REQUIRE(resolver
              .TypeDefinition(
                  RequestContext("textDocument/typeDefinition"), params)
              .has_value());
  REQUIRE(design.checker->CallCount() == 2);
}

TEST_CASE(
    "DefinitionResolver cancelled request fails during analysis",
    "[definition_resolver]") {
  TopDesign design;
  auto resolver = design.MakeResolver();

  RequestContext ctx("textDocument/definition");
  ctx.Cancel();
  auto definition =
      resolver.Definition(ctx, design.fixture.Params(kUri, "count", 2));
  REQUIRE(!definition.has_value());
  REQUIRE(definition.error().Is(NavErrorCode::kCancelled));
}
