#include "network/station_directory.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "util/strings.h"

namespace rakelink {

std::string NormalizeLabel(std::string_view label) {
  std::string result(TrimWhitespace(label));
  std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  return result;
}

StationDirectory::StationDirectory(
    std::vector<Station> stations,
    std::unordered_map<std::string, std::string> aliases,
    std::unordered_map<std::string, std::string> codes
)
    : stations_(std::move(stations)) {
  for (size_t i = 0; i < stations_.size(); ++i) {
    stations_[i].name = NormalizeLabel(stations_[i].name);
    index_by_name_.emplace(stations_[i].name, i);
  }
  for (const auto& [label, target] : aliases) {
    aliases_[NormalizeLabel(label)] = NormalizeLabel(target);
  }
  for (const auto& [code, target] : codes) {
    codes_[NormalizeLabel(code)] = NormalizeLabel(target);
  }
}

std::optional<std::string> StationDirectory::Resolve(std::string_view label
) const {
  std::string name = NormalizeLabel(label);
  if (name.empty()) {
    return std::nullopt;
  }
  auto alias_it = aliases_.find(name);
  if (alias_it != aliases_.end()) {
    name = alias_it->second;
  }
  if (!index_by_name_.contains(name)) {
    return std::nullopt;
  }
  return name;
}

std::optional<std::string> StationDirectory::ResolveCode(std::string_view code
) const {
  auto it = codes_.find(NormalizeLabel(code));
  if (it == codes_.end()) {
    return std::nullopt;
  }
  return it->second;
}

const Station* StationDirectory::Find(std::string_view canonical_name) const {
  auto it = index_by_name_.find(std::string(canonical_name));
  if (it == index_by_name_.end()) {
    return nullptr;
  }
  return &stations_[it->second];
}

double StationDirectory::ChainageKm(std::string_view canonical_name) const {
  const Station* station = Find(canonical_name);
  if (station == nullptr) {
    throw std::runtime_error(
        "Station '" + std::string(canonical_name) + "' not in directory"
    );
  }
  return station->chainage_km;
}

StationDirectory StationDirectoryFromToml(const toml::table& table) {
  const toml::array* stations_array = table["stations"].as_array();
  if (!stations_array || stations_array->empty()) {
    throw std::runtime_error(
        "Station directory must contain a non-empty stations array"
    );
  }

  std::vector<Station> stations;
  std::unordered_map<std::string, std::string> codes;
  for (const auto& elem : *stations_array) {
    const toml::table* station_table = elem.as_table();
    if (!station_table) {
      throw std::runtime_error("Invalid entry in stations array");
    }
    auto name = (*station_table)["name"].value<std::string>();
    auto chainage = (*station_table)["chainage_km"].value<double>();
    if (!name || !chainage) {
      throw std::runtime_error(
          "Every station needs a name and a chainage_km"
      );
    }
    stations.push_back(Station{NormalizeLabel(*name), *chainage});

    if (const toml::array* station_codes = (*station_table)["codes"].as_array()) {
      for (const auto& code : *station_codes) {
        if (auto code_str = code.value<std::string>()) {
          codes[*code_str] = *name;
        }
      }
    }
  }

  std::unordered_map<std::string, std::string> aliases;
  if (const toml::table* alias_table = table["aliases"].as_table()) {
    for (const auto& [label, target] : *alias_table) {
      auto target_str = target.value<std::string>();
      if (!target_str) {
        throw std::runtime_error(
            "Alias '" + std::string(label.str()) + "' must map to a string"
        );
      }
      aliases[std::string(label.str())] = *target_str;
    }
  }

  if (const toml::table* code_table = table["codes"].as_table()) {
    for (const auto& [code, target] : *code_table) {
      if (auto target_str = target.value<std::string>()) {
        codes[std::string(code.str())] = *target_str;
      }
    }
  }

  StationDirectory directory(
      std::move(stations), std::move(aliases), std::move(codes)
  );

  // Aliases exist only to canonicalize grid labels, so each must land on a
  // listed station.
  if (const toml::table* alias_table = table["aliases"].as_table()) {
    for (const auto& [label, target] : *alias_table) {
      if (!directory.Resolve(label.str())) {
        throw std::runtime_error(
            "Alias '" + std::string(label.str()) + "' points to unknown station '" +
            target.value_or(std::string{}) + "'"
        );
      }
    }
  }

  return directory;
}

StationDirectory StationDirectoryLoad(const std::string& toml_path) {
  toml::table table;
  try {
    table = toml::parse_file(toml_path);
  } catch (const toml::parse_error& err) {
    throw std::runtime_error(
        "Failed to parse station directory '" + toml_path +
        "': " + std::string(err.what())
    );
  }
  return StationDirectoryFromToml(table);
}

}  // namespace rakelink
