#pragma once

#include <cstddef>
#include <expected>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "defnav/analysis/objects.hpp"
#include "defnav/core/request_context.hpp"
#include "defnav/error/error.hpp"
#include "defnav/utils/canonical_path.hpp"

namespace defnav::navigation {

// Package, module, interface or program seen by the analyzer
struct PackageInfo {
  std::string name;
  analysis::ObjectKind kind = analysis::ObjectKind::kPackage;

  // Document that declares it
  std::string uri;
};

// Registry of packages across all analyzed documents. Written by the
// analysis backend, read by symbol description. Thread-safe.
class PackageCache {
 public:
  PackageCache() = default;

  PackageCache(const PackageCache&) = delete;
  PackageCache(PackageCache&&) = delete;
  auto operator=(const PackageCache&) -> PackageCache& = delete;
  auto operator=(PackageCache&&) -> PackageCache& = delete;
  ~PackageCache() = default;

  // Replace every entry declared by uri with packages
  void UpdateDocument(std::string_view uri, std::vector<PackageInfo> packages);

  void RemoveDocument(std::string_view uri);

  [[nodiscard]] auto Lookup(std::string_view name) const
      -> std::optional<PackageInfo>;

  [[nodiscard]] auto Size() const -> size_t;

 private:
  void RemoveDocumentLocked(std::string_view uri);

  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, PackageInfo> packages_;
};

// Strategy for locating the package a descriptor refers to
using FindPackageFunc = std::function<std::expected<PackageInfo, NavError>(
    const RequestContext& ctx, const PackageCache& cache,
    std::string_view name, const CanonicalPath& root)>;

enum class PackageLookup {
  // Cached and declared under the workspace root
  kWorkspace,
  // Cached anywhere
  kAny,
};

auto ParsePackageLookup(std::string_view text) -> std::optional<PackageLookup>;
auto ToString(PackageLookup lookup) -> std::string_view;

auto MakeFindPackageFunc(PackageLookup lookup) -> FindPackageFunc;

}  // namespace defnav::navigation
