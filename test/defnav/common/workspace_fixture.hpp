#pragma once

#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>

#include "defnav/utils/canonical_path.hpp"

namespace defnav::test {

// Temporary workspace directory on disk, removed on destruction
class WorkspaceFixture {
 public:
  explicit WorkspaceFixture(std::string_view name = "defnav_test") {
    root_ = std::filesystem::temp_directory_path() / name;
    std::filesystem::remove_all(root_);
    std::filesystem::create_directories(root_);
  }

  ~WorkspaceFixture() {
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
  }

  WorkspaceFixture(const WorkspaceFixture&) = delete;
  auto operator=(const WorkspaceFixture&) -> WorkspaceFixture& = delete;
  WorkspaceFixture(WorkspaceFixture&&) = delete;
  auto operator=(WorkspaceFixture&&) -> WorkspaceFixture& = delete;

  [[nodiscard]] auto Root() const -> CanonicalPath {
    return CanonicalPath(root_);
  }

  [[nodiscard]] auto RootUri() const -> std::string {
    return Root().ToUri();
  }

  // Write a file relative to the workspace root, creating parent directories
  auto CreateFile(std::string_view relative, std::string_view content)
      -> CanonicalPath {
    auto path = root_ / relative;
    std::filesystem::create_directories(path.parent_path());
    std::ofstream file(path);
    file << content;
    file.close();
    return CanonicalPath(path);
  }

  [[nodiscard]] auto UriOf(std::string_view relative) const -> std::string {
    return (Root() / std::filesystem::path(relative)).ToUri();
  }

 private:
  std::filesystem::path root_;
};

}  // namespace defnav::test
