#include "config/engine_config.h"

#include <stdexcept>

namespace rakelink {

namespace {

std::string RequirePath(
    const toml::node_view<const toml::node>& node,
    const std::string& key,
    const std::filesystem::path& base_dir
) {
  std::optional<std::string> value = node.value<std::string>();
  if (!value.has_value() || value->empty()) {
    throw std::runtime_error("Config is missing " + key);
  }
  return (base_dir / *value).string();
}

int NonNegative(
    const toml::node_view<const toml::node>& node,
    const std::string& key,
    int default_value
) {
  int value = node.value_or(default_value);
  if (value < 0) {
    throw std::runtime_error(key + " must not be negative");
  }
  return value;
}

}  // namespace

EngineConfig EngineConfigFromToml(
    const toml::table& table, const std::filesystem::path& base_dir
) {
  EngineConfig config;
  config.stations_path = RequirePath(table["stations"], "stations", base_dir);
  config.summary_path = RequirePath(table["summary"], "summary", base_dir);
  config.up_grid_path = RequirePath(table["grids"]["up"], "grids.up", base_dir);
  config.down_grid_path =
      RequirePath(table["grids"]["down"], "grids.down", base_dir);

  config.grid_skip_rows = NonNegative(
      table["grids"]["skip_rows"], "grids.skip_rows", config.grid_skip_rows
  );
  config.summary_skip_rows = NonNegative(
      table["summary_skip_rows"], "summary_skip_rows", config.summary_skip_rows
  );
  config.extract.header_rows = NonNegative(
      table["extract"]["header_rows"],
      "extract.header_rows",
      config.extract.header_rows
  );
  config.extract.default_car_count = NonNegative(
      table["extract"]["default_car_count"],
      "extract.default_car_count",
      config.extract.default_car_count
  );
  return config;
}

EngineConfig EngineConfigLoad(const std::string& config_path) {
  toml::table table;
  try {
    table = toml::parse_file(config_path);
  } catch (const toml::parse_error& e) {
    throw std::runtime_error(
        "Could not parse config " + config_path + ": " +
        std::string(e.description())
    );
  }

  // Resolve paths relative to the config file's directory.
  std::filesystem::path config_dir =
      std::filesystem::weakly_canonical(config_path).parent_path();
  return EngineConfigFromToml(table, config_dir);
}

}  // namespace rakelink
