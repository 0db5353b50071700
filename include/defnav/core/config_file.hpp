#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "defnav/analysis/compilation_options.hpp"
#include "defnav/navigation/package_cache.hpp"
#include "defnav/utils/canonical_path.hpp"

namespace defnav {

// Represents the contents of a .defnav configuration file
//
//   IncludeDirs: [rtl/include]
//   Defines: [SIM, {WIDTH: 8}]
//   PackageLookup: workspace   # or: any
class DefnavConfigFile {
 public:
  explicit DefnavConfigFile(std::shared_ptr<spdlog::logger> logger = nullptr);

  // Load the configuration from a .defnav file. Relative include directories
  // are resolved against the file's directory. Returns std::nullopt if the
  // file doesn't exist or cannot be parsed.
  static auto LoadFromFile(
      const CanonicalPath& config_path,
      std::shared_ptr<spdlog::logger> logger = nullptr)
      -> std::optional<DefnavConfigFile>;

  [[nodiscard]] auto GetIncludeDirs() const
      -> const std::vector<CanonicalPath>& {
    return include_dirs_;
  }

  [[nodiscard]] auto GetDefines() const -> const std::vector<std::string>& {
    return defines_;
  }

  [[nodiscard]] auto GetPackageLookup() const -> navigation::PackageLookup {
    return package_lookup_;
  }

  [[nodiscard]] auto ToAnalysisOptions() const -> analysis::AnalysisOptions;

 private:
  std::shared_ptr<spdlog::logger> logger_;

  // Include directories for `include files
  std::vector<CanonicalPath> include_dirs_;

  // Macro definitions (NAME or NAME=value)
  std::vector<std::string> defines_;

  navigation::PackageLookup package_lookup_ =
      navigation::PackageLookup::kWorkspace;
};

}  // namespace defnav
