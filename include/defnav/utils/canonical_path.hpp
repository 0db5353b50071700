#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include <fmt/format.h>

namespace defnav {

// Normalized filesystem path. Existing paths are resolved to their canonical
// form; paths that do not exist (in-memory documents, tests) are kept as-is
// with lexical normalization.
class CanonicalPath {
 public:
  CanonicalPath() = default;

  explicit CanonicalPath(std::filesystem::path path);

  static auto FromUri(std::string_view uri) -> CanonicalPath;

  auto ToUri() const -> std::string;

  auto Path() const -> const std::filesystem::path&;
  auto String() const -> const std::string&;

  auto Empty() const -> bool;

  auto IsSubPathOf(const CanonicalPath& other) const -> bool;

  // Path relative to base, or the path itself when it is not under base
  auto RelativeTo(const CanonicalPath& base) const -> std::filesystem::path;

  explicit operator std::string() const {
    return String();
  }

  friend auto operator==(const CanonicalPath& lhs, const CanonicalPath& rhs)
      -> bool {
    return lhs.String() == rhs.String();
  }

  friend auto operator!=(const CanonicalPath& lhs, const CanonicalPath& rhs)
      -> bool {
    return !(lhs == rhs);
  }

  auto operator/(std::filesystem::path rhs) const -> CanonicalPath;

 private:
  std::filesystem::path path_;
  mutable std::string cached_string_;
};

}  // namespace defnav

// Format support for logging
template <>
struct fmt::formatter<defnav::CanonicalPath> : fmt::formatter<std::string> {
  template <typename FormatContext>
  auto format(const defnav::CanonicalPath& p, FormatContext& ctx) const {
    return fmt::formatter<std::string>::format(p.String(), ctx);
  }
};
