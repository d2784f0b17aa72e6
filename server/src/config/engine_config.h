#pragma once

#include <filesystem>
#include <string>
#include <toml++/toml.hpp>

#include "wtt/service_extractor.h"

namespace rakelink {

// Inputs of one reconciliation run.
//
//   stations = "western_line.toml"
//   summary = "summary.csv"
//   summary_skip_rows = 2
//
//   [grids]
//   up = "wtt_up.csv"
//   down = "wtt_down.csv"
//   skip_rows = 4
//
//   [extract]
//   header_rows = 6
//   default_car_count = 15
//
// Paths are relative to the config file.
struct EngineConfig {
  std::string stations_path;
  std::string up_grid_path;
  std::string down_grid_path;
  std::string summary_path;
  int grid_skip_rows = 4;
  int summary_skip_rows = 2;
  ExtractOptions extract;
};

// Paths in `table` are resolved against `base_dir`. Throws
// std::runtime_error when a path is missing or a number is negative.
EngineConfig EngineConfigFromToml(
    const toml::table& table, const std::filesystem::path& base_dir
);

// Parse a TOML config file into an EngineConfig.
EngineConfig EngineConfigLoad(const std::string& config_path);

}  // namespace rakelink
