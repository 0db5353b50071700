#include "defnav/utils/canonical_path.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

#include "defnav/utils/path_utils.hpp"

namespace defnav {

CanonicalPath::CanonicalPath(std::filesystem::path path)
    : path_(NormalizePath(std::move(path))) {
}

auto CanonicalPath::FromUri(std::string_view uri) -> CanonicalPath {
  return CanonicalPath(UriToPath(uri));
}

auto CanonicalPath::ToUri() const -> std::string {
  return PathToUri(path_);
}

auto CanonicalPath::Path() const -> const std::filesystem::path& {
  return path_;
}

auto CanonicalPath::String() const -> const std::string& {
  if (cached_string_.empty()) {
    cached_string_ = path_.string();
  }
  return cached_string_;
}

auto CanonicalPath::Empty() const -> bool {
  return path_.empty();
}

auto CanonicalPath::IsSubPathOf(const CanonicalPath& other) const -> bool {
  if (other.Empty()) {
    return false;
  }
  // Trailing separators produce an empty last component; ignore it
  auto other_end = other.path_.end();
  if (other_end != other.path_.begin() &&
      std::prev(other_end)->empty()) {
    --other_end;
  }
  auto [mismatch, _] = std::mismatch(
      other.path_.begin(), other_end, path_.begin(), path_.end());
  return mismatch == other_end;
}

auto CanonicalPath::RelativeTo(const CanonicalPath& base) const
    -> std::filesystem::path {
  if (!IsSubPathOf(base)) {
    return path_;
  }
  return path_.lexically_relative(base.path_);
}

auto CanonicalPath::operator/(std::filesystem::path rhs) const
    -> CanonicalPath {
  return CanonicalPath(path_ / rhs);
}

}  // namespace defnav
