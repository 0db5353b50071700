#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "defnav/utils/canonical_path.hpp"

namespace defnav {

// URI operations
[[nodiscard]] auto UriToPath(std::string_view uri) -> std::filesystem::path;
[[nodiscard]] auto PathToUri(std::filesystem::path path) -> std::string;
[[nodiscard]] auto NormalizePath(std::filesystem::path path)
    -> std::filesystem::path;

[[nodiscard]] auto IsFileUri(std::string_view uri) -> bool;

// A file:// URI that lies under root. With an empty root every file:// URI
// is addressable.
[[nodiscard]] auto IsWorkspaceUri(
    std::string_view uri, const CanonicalPath& root) -> bool;

// True when any directory component of path equals component
[[nodiscard]] auto HasPathComponent(
    const std::filesystem::path& path, std::string_view component) -> bool;

}  // namespace defnav
