#include "defnav/core/config_file.hpp"

#include <filesystem>
#include <utility>

#include <yaml-cpp/yaml.h>

namespace defnav {

DefnavConfigFile::DefnavConfigFile(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? std::move(logger) : spdlog::default_logger()) {
}

auto DefnavConfigFile::LoadFromFile(
    const CanonicalPath& config_path, std::shared_ptr<spdlog::logger> logger)
    -> std::optional<DefnavConfigFile> {
  DefnavConfigFile config(std::move(logger));

  std::error_code ec;
  if (!std::filesystem::exists(config_path.Path(), ec)) {
    config.logger_->debug(
        "No .defnav configuration file found at {}", config_path);
    return std::nullopt;
  }

  auto base_dir = config_path.Path().parent_path();

  try {
    YAML::Node yaml = YAML::LoadFile(config_path.String());

    if (yaml["IncludeDirs"]) {
      for (const auto& dir : yaml["IncludeDirs"]) {
        std::filesystem::path raw = dir.as<std::string>();
        if (raw.is_relative()) {
          raw = base_dir / raw;
        }
        config.include_dirs_.emplace_back(raw);
      }
    }

    if (yaml["Defines"]) {
      for (const auto& define : yaml["Defines"]) {
        if (define.IsMap()) {
          // WIDTH: 8 -> "WIDTH=8"
          for (const auto& kv : define) {
            config.defines_.push_back(
                kv.first.as<std::string>() + "=" + kv.second.as<std::string>());
          }
        } else {
          config.defines_.push_back(define.as<std::string>());
        }
      }
    }

    if (yaml["PackageLookup"]) {
      auto raw = yaml["PackageLookup"].as<std::string>();
      if (auto lookup = navigation::ParsePackageLookup(raw)) {
        config.package_lookup_ = *lookup;
      } else {
        config.logger_->warn(
            "Unknown PackageLookup '{}' in {}, using '{}'", raw, config_path,
            navigation::ToString(config.package_lookup_));
      }
    }

    config.logger_->debug(
        "Loaded .defnav configuration from {} ({} include dirs, {} defines)",
        config_path, config.include_dirs_.size(), config.defines_.size());
    return config;

  } catch (const YAML::Exception& e) {
    config.logger_->error(
        "Error parsing .defnav configuration file: {}", e.what());
    return std::nullopt;
  }
}

auto DefnavConfigFile::ToAnalysisOptions() const -> analysis::AnalysisOptions {
  analysis::AnalysisOptions options;
  options.defines = defines_;
  for (const auto& dir : include_dirs_) {
    options.include_dirs.push_back(dir.String());
  }
  return options;
}

}  // namespace defnav
