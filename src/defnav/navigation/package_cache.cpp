#include "defnav/navigation/package_cache.hpp"

#include <mutex>
#include <utility>

#include <fmt/format.h>

#include "defnav/utils/path_utils.hpp"

namespace defnav::navigation {

void PackageCache::UpdateDocument(
    std::string_view uri, std::vector<PackageInfo> packages) {
  std::unique_lock lock(mutex_);
  RemoveDocumentLocked(uri);
  for (auto& package : packages) {
    auto name = package.name;
    packages_.insert_or_assign(std::move(name), std::move(package));
  }
}

void PackageCache::RemoveDocument(std::string_view uri) {
  std::unique_lock lock(mutex_);
  RemoveDocumentLocked(uri);
}

void PackageCache::RemoveDocumentLocked(std::string_view uri) {
  std::erase_if(
      packages_, [uri](const auto& entry) { return entry.second.uri == uri; });
}

auto PackageCache::Lookup(std::string_view name) const
    -> std::optional<PackageInfo> {
  std::shared_lock lock(mutex_);
  if (auto it = packages_.find(std::string(name)); it != packages_.end()) {
    return it->second;
  }
  return std::nullopt;
}

auto PackageCache::Size() const -> size_t {
  std::shared_lock lock(mutex_);
  return packages_.size();
}

auto ParsePackageLookup(std::string_view text) -> std::optional<PackageLookup> {
  if (text == "workspace") {
    return PackageLookup::kWorkspace;
  }
  if (text == "any") {
    return PackageLookup::kAny;
  }
  return std::nullopt;
}

auto ToString(PackageLookup lookup) -> std::string_view {
  switch (lookup) {
    case PackageLookup::kWorkspace:
      return "workspace";
    case PackageLookup::kAny:
      return "any";
  }
  return "unknown";
}

auto MakeFindPackageFunc(PackageLookup lookup) -> FindPackageFunc {
  return [lookup](
             const RequestContext& ctx, const PackageCache& cache,
             std::string_view name, const CanonicalPath& root)
             -> std::expected<PackageInfo, NavError> {
    if (ctx.IsCancelled()) {
      return NavError::Unexpected(NavErrorCode::kCancelled);
    }

    auto package = cache.Lookup(name);
    if (!package) {
      return NavError::Unexpected(
          NavErrorCode::kNotFound,
          fmt::format("package '{}' is not in the package cache", name));
    }

    if (lookup == PackageLookup::kWorkspace &&
        !IsWorkspaceUri(package->uri, root)) {
      return NavError::Unexpected(
          NavErrorCode::kNotFound,
          fmt::format(
              "package '{}' is declared outside the workspace ({})", name,
              package->uri));
    }

    return *package;
  };
}

}  // namespace defnav::navigation
