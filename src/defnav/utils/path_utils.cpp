#include "defnav/utils/path_utils.hpp"

#include <algorithm>
#include <regex>

#include <fmt/format.h>

namespace defnav {

auto UriToPath(std::string_view uri) -> std::filesystem::path {
  if (!IsFileUri(uri)) {
    return {uri};
  }

  // Strip "file://"
  std::string path(uri.substr(7));

  // Handle Windows: file:///C:/path -> C:/path
  if (path.size() >= 3 && path[0] == '/' && path[2] == ':') {
    path = path.substr(1);
  }

  // Replace percent-encoded sequences
  static const std::regex kEscapeRegex("%([0-9A-Fa-f]{2})");

  std::string result;
  std::regex_iterator<std::string::iterator> it(
      path.begin(), path.end(), kEscapeRegex);
  std::regex_iterator<std::string::iterator> end;

  std::size_t last_pos = 0;
  while (it != end) {
    result.append(path, last_pos, it->position() - last_pos);
    std::string hex = (*it)[1];
    result += static_cast<char>(std::stoi(hex, nullptr, 16));
    last_pos = it->position() + it->length();
    ++it;
  }

  result.append(path, last_pos, path.length() - last_pos);
  return NormalizePath(result);
}

auto PathToUri(std::filesystem::path path) -> std::string {
  std::string result = "file://";

  if (path.string().size() >= 2 && path.string()[1] == ':') {
    result += '/';
  }

  for (char c : path.string()) {
    if (c == ' ' || c == '%' || c == '#' || c == '?' ||
        static_cast<unsigned char>(c) > 127 ||
        static_cast<unsigned char>(c) < 32) {
      result += fmt::format("%{:02X}", static_cast<unsigned char>(c));
    } else {
      result += c;
    }
  }

  return result;
}

auto NormalizePath(std::filesystem::path path) -> std::filesystem::path {
  // Only canonicalize if the file actually exists. In-memory documents keep
  // their lexical form.
  std::error_code ec;
  if (std::filesystem::exists(path, ec)) {
    auto canonical = std::filesystem::canonical(path, ec);
    if (!ec) {
      return canonical;
    }
  }
  return path.lexically_normal();
}

auto IsFileUri(std::string_view uri) -> bool {
  return uri.starts_with("file://");
}

auto IsWorkspaceUri(std::string_view uri, const CanonicalPath& root) -> bool {
  if (!IsFileUri(uri)) {
    return false;
  }
  if (root.Empty()) {
    return true;
  }
  return CanonicalPath::FromUri(uri).IsSubPathOf(root);
}

auto HasPathComponent(
    const std::filesystem::path& path, std::string_view component) -> bool {
  auto parent = path.parent_path();
  return std::ranges::any_of(parent, [component](const auto& part) {
    return part.string() == component;
  });
}

}  // namespace defnav
