#include "defnav/navigation/symbol_descriptor.hpp"

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "defnav/utils/path_utils.hpp"

namespace defnav::navigation {

namespace {

auto SplitFields(std::string_view path) -> std::vector<std::string_view> {
  std::vector<std::string_view> fields;
  while (!path.empty()) {
    auto space = path.find(' ');
    auto field = path.substr(0, space);
    if (!field.empty()) {
      fields.push_back(field);
    }
    if (space == std::string_view::npos) {
      break;
    }
    path.remove_prefix(space + 1);
  }
  return fields;
}

auto PackagePath(const CanonicalPath& file, const CanonicalPath& root,
                 std::string_view package_name) -> std::string {
  auto dir = file.RelativeTo(root).parent_path().generic_string();
  if (dir.empty() || dir == ".") {
    return std::string(package_name);
  }
  return fmt::format("{}/{}", dir, package_name);
}

}  // namespace

auto DescribeSymbol(
    const RequestContext& ctx, const analysis::Package& package,
    const PackageCache& cache, const CanonicalPath& root,
    const DefinitionInfo& info, const FindPackageFunc& find_package)
    -> std::expected<lsp::SymbolDescriptor, NavError> {
  if (ctx.IsCancelled()) {
    return NavError::Unexpected(NavErrorCode::kCancelled);
  }

  PackageInfo owner;
  if (info.package_name == kUnitPackageName) {
    const analysis::SourceFile* file = nullptr;
    if (info.object != nullptr) {
      file = package.Sources().FileFor(info.object->pos);
    }
    if (file == nullptr) {
      return NavError::Unexpected(
          NavErrorCode::kNotFound, "declaring file of $unit member not found");
    }
    owner = PackageInfo{
        .name = info.package_name,
        .kind = analysis::ObjectKind::kPackage,
        .uri = file->Uri(),
    };
  } else {
    auto found = find_package(ctx, cache, info.package_name, root);
    if (!found) {
      return std::unexpected(found.error());
    }
    owner = std::move(*found);
  }

  auto file = CanonicalPath::FromUri(owner.uri);
  auto fields = SplitFields(info.path);

  lsp::SymbolDescriptor descriptor{
      .vendor = HasPathComponent(file.Path(), "vendor"),
      .package = PackagePath(file, root, owner.name),
      .packageName = owner.name,
      .recv = "",
      .name = "",
      .id = "",
  };

  if (fields.empty()) {
    return descriptor;
  }

  descriptor.name = std::string(fields.back());
  if (fields.size() >= 2) {
    descriptor.recv = std::string(fields.front());
  }
  descriptor.id =
      fmt::format("{}/-/{}", descriptor.package, fmt::join(fields, "/"));
  return descriptor;
}

}  // namespace defnav::navigation
