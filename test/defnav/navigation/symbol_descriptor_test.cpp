#include "defnav/navigation/symbol_descriptor.hpp"

#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

#include "../common/package_fixture.hpp"

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");

  return Catch::Session().run(argc, argv);
}

using defnav::CanonicalPath;
using defnav::NavErrorCode;
using defnav::RequestContext;
using defnav::analysis::ObjectKind;
using defnav::navigation::DefinitionInfo;
using defnav::navigation::DescribeSymbol;
using defnav::navigation::kUnitPackageName;
using defnav::navigation::MakeFindPackageFunc;
using defnav::navigation::PackageCache;
using defnav::navigation::PackageInfo;
using defnav::navigation::PackageLookup;
using defnav::navigation::ParsePackageLookup;
using defnav::test::PackageFixture;

namespace {

constexpr std::string_view kUtilUri = "file:///ws/rtl/util_pkg.sv";

void Populate(PackageCache& cache) {
  cache.UpdateDocument(
      kUtilUri, {PackageInfo{
                    .name = "util",
                    .kind = ObjectKind::kPackage,
                    .uri = std::string(kUtilUri)}});
  cache.UpdateDocument(
      "file:///ws/vendor/uart/uart_pkg.sv",
      {PackageInfo{
          .name = "uart",
          .kind = ObjectKind::kPackage,
          .uri = "file:///ws/vendor/uart/uart_pkg.sv"}});
  cache.UpdateDocument(
      "file:///ws/chip.sv", {PackageInfo{
                                .name = "chip",
                                .kind = ObjectKind::kModule,
                                .uri = "file:///ws/chip.sv"}});
  cache.UpdateDocument(
      "file:///opt/uvm/uvm_pkg.sv", {PackageInfo{
                                        .name = "uvm_pkg",
                                        .kind = ObjectKind::kPackage,
                                        .uri = "file:///opt/uvm/uvm_pkg.sv"}});
}

auto InfoFor(std::string package_name, std::string path) -> DefinitionInfo {
  return DefinitionInfo{
      .package_name = std::move(package_name),
      .path = std::move(path),
      .kind = ObjectKind::kVariable,
      .object = nullptr,
  };
}

}  // namespace

TEST_CASE("DescribeSymbol builds descriptors", "[symbol_descriptor]") {
  PackageFixture fixture;
  PackageCache cache;
  Populate(cache);
  CanonicalPath root("/ws");
  auto find = MakeFindPackageFunc(PackageLookup::kWorkspace);
  RequestContext ctx("textDocument/xdefinition");

  SECTION("Nested member") {
    auto descriptor = DescribeSymbol(
        ctx, fixture.Get(), cache, root, InfoFor("util", "Stack depth"), find);
    REQUIRE(descriptor.has_value());
    REQUIRE(!descriptor->vendor);
    REQUIRE(descriptor->package == "rtl/util");
    REQUIRE(descriptor->packageName == "util");
    REQUIRE(descriptor->recv == "Stack");
    REQUIRE(descriptor->name == "depth");
    REQUIRE(descriptor->id == "rtl/util/-/Stack/depth");
  }

  SECTION("Single field has no receiver") {
    auto descriptor = DescribeSymbol(
        ctx, fixture.Get(), cache, root, InfoFor("util", "MAX_DEPTH"), find);
    REQUIRE(descriptor.has_value());
    REQUIRE(descriptor->recv.empty());
    REQUIRE(descriptor->name == "MAX_DEPTH");
    REQUIRE(descriptor->id == "rtl/util/-/MAX_DEPTH");
  }

  SECTION("Package itself has no id") {
    auto descriptor = DescribeSymbol(
        ctx, fixture.Get(), cache, root, InfoFor("util", ""), find);
    REQUIRE(descriptor.has_value());
    REQUIRE(descriptor->package == "rtl/util");
    REQUIRE(descriptor->name.empty());
    REQUIRE(descriptor->id.empty());
  }

  SECTION("Vendored package") {
    auto descriptor = DescribeSymbol(
        ctx, fixture.Get(), cache, root, InfoFor("uart", "baud_t"), find);
    REQUIRE(descriptor.has_value());
    REQUIRE(descriptor->vendor);
    REQUIRE(descriptor->package == "vendor/uart/uart");
  }

  SECTION("Module at the workspace root") {
    auto descriptor = DescribeSymbol(
        ctx, fixture.Get(), cache, root, InfoFor("chip", "clk"), find);
    REQUIRE(descriptor.has_value());
    REQUIRE(descriptor->package == "chip");
    REQUIRE(descriptor->id == "chip/-/clk");
  }
}

TEST_CASE(
    "DescribeSymbol places compilation-unit members in their file directory",
    "[symbol_descriptor]") {
  PackageFixture fixture;
  constexpr std::string_view kDefsUri = "file:///ws/rtl/defs.svh";
  fixture.AddFile(std::string(kDefsUri), "typedef logic [31:0] word_t;\n");
  auto& word_t = fixture.Declare(ObjectKind::kTypeName, kDefsUri, "word_t");

  PackageCache cache;
  auto info = DefinitionInfo{
      .package_name = std::string(kUnitPackageName),
      .path = "word_t",
      .kind = ObjectKind::kTypeName,
      .object = &word_t,
  };

  auto descriptor = DescribeSymbol(
      RequestContext("textDocument/xdefinition"), fixture.Get(), cache,
      CanonicalPath("/ws"), info,
      MakeFindPackageFunc(PackageLookup::kWorkspace));
  REQUIRE(descriptor.has_value());
  REQUIRE(descriptor->packageName == "$unit");
  REQUIRE(descriptor->package == "rtl/$unit");
  REQUIRE(descriptor->id == "rtl/$unit/-/word_t");
}

TEST_CASE("DescribeSymbol package lookup failures", "[symbol_descriptor]") {
  PackageFixture fixture;
  PackageCache cache;
  Populate(cache);
  CanonicalPath root("/ws");
  RequestContext ctx("textDocument/xdefinition");

  SECTION("Unknown package") {
    auto descriptor = DescribeSymbol(
        ctx, fixture.Get(), cache, root, InfoFor("missing", "x"),
        MakeFindPackageFunc(PackageLookup::kWorkspace));
    REQUIRE(!descriptor.has_value());
    REQUIRE(descriptor.error().Is(NavErrorCode::kNotFound));
  }

  SECTION("Package outside the workspace") {
    auto descriptor = DescribeSymbol(
        ctx, fixture.Get(), cache, root, InfoFor("uvm_pkg", "uvm_object"),
        MakeFindPackageFunc(PackageLookup::kWorkspace));
    REQUIRE(!descriptor.has_value());
    REQUIRE(descriptor.error().Is(NavErrorCode::kNotFound));
  }

  SECTION("Package outside the workspace with any lookup") {
    auto descriptor = DescribeSymbol(
        ctx, fixture.Get(), cache, root, InfoFor("uvm_pkg", "uvm_object"),
        MakeFindPackageFunc(PackageLookup::kAny));
    REQUIRE(descriptor.has_value());
    REQUIRE(descriptor->package == "/opt/uvm/uvm_pkg");
    REQUIRE(descriptor->name == "uvm_object");
  }

  SECTION("Cancelled request") {
    ctx.Cancel();
    auto descriptor = DescribeSymbol(
        ctx, fixture.Get(), cache, root, InfoFor("util", "x"),
        MakeFindPackageFunc(PackageLookup::kWorkspace));
    REQUIRE(!descriptor.has_value());
    REQUIRE(descriptor.error().Is(NavErrorCode::kCancelled));
  }

  SECTION("Compilation-unit member without a declaring file") {
    auto descriptor = DescribeSymbol(
        ctx, fixture.Get(), cache, root,
        InfoFor(std::string(kUnitPackageName), "word_t"),
        MakeFindPackageFunc(PackageLookup::kWorkspace));
    REQUIRE(!descriptor.has_value());
    REQUIRE(descriptor.error().Is(NavErrorCode::kNotFound));
  }
}

TEST_CASE("PackageCache tracks packages per document", "[package_cache]") {
  PackageCache cache;
  cache.UpdateDocument(
      "file:///ws/a.sv",
      {PackageInfo{.name = "a_pkg", .uri = "file:///ws/a.sv"},
       PackageInfo{
           .name = "a_top",
           .kind = ObjectKind::kModule,
           .uri = "file:///ws/a.sv"}});
  REQUIRE(cache.Size() == 2);

  SECTION("Lookup by name") {
    auto found = cache.Lookup("a_top");
    REQUIRE(found.has_value());
    REQUIRE(found->kind == ObjectKind::kModule);
    REQUIRE(found->uri == "file:///ws/a.sv");
    REQUIRE(!cache.Lookup("b_pkg").has_value());
  }

  SECTION("Update replaces the document's entries") {
    cache.UpdateDocument(
        "file:///ws/a.sv",
        {PackageInfo{.name = "a2_pkg", .uri = "file:///ws/a.sv"}});
    REQUIRE(cache.Size() == 1);
    REQUIRE(!cache.Lookup("a_pkg").has_value());
    REQUIRE(cache.Lookup("a2_pkg").has_value());
  }

  SECTION("Remove drops only that document") {
    cache.UpdateDocument(
        "file:///ws/b.sv",
        {PackageInfo{.name = "b_pkg", .uri = "file:///ws/b.sv"}});
    cache.RemoveDocument("file:///ws/a.sv");
    REQUIRE(cache.Size() == 1);
    REQUIRE(cache.Lookup("b_pkg").has_value());
  }

  SECTION("Later declaration of the same name wins") {
    cache.UpdateDocument(
        "file:///ws/b.sv",
        {PackageInfo{.name = "a_pkg", .uri = "file:///ws/b.sv"}});
    REQUIRE(cache.Lookup("a_pkg")->uri == "file:///ws/b.sv");
  }
}

TEST_CASE("ParsePackageLookup", "[package_cache]") {
  REQUIRE(ParsePackageLookup("workspace") == PackageLookup::kWorkspace);
  REQUIRE(ParsePackageLookup("any") == PackageLookup::kAny);
  REQUIRE(!ParsePackageLookup("global").has_value());
  REQUIRE(defnav::navigation::ToString(PackageLookup::kAny) == "any");
}
