#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <toml++/toml.hpp>
#include <unordered_map>
#include <vector>

namespace rakelink {

struct Station {
  std::string name;
  double chainage_km = 0.0;

  bool operator==(const Station& other) const {
    return name == other.name && chainage_km == other.chainage_km;
  }
};

// Uppercases and strips surrounding whitespace. All station lookups go through
// this first.
std::string NormalizeLabel(std::string_view label);

// Reference table of the stations on the line.
//
// Three lookup tables:
// - stations: canonical name -> chainage.
// - aliases: non-canonical grid label -> canonical name (misspellings,
//   duplicate spellings of the same platform).
// - codes: short station codes (as written next to "ARR" markers) -> name.
//   A code may name a terminal that is not on the line, in which case it has
//   no chainage.
class StationDirectory {
 public:
  StationDirectory() = default;
  StationDirectory(
      std::vector<Station> stations,
      std::unordered_map<std::string, std::string> aliases,
      std::unordered_map<std::string, std::string> codes
  );

  // Canonical name for a grid label, if it names a station on the line.
  std::optional<std::string> Resolve(std::string_view label) const;

  // Station name for a short code like "BVI".
  std::optional<std::string> ResolveCode(std::string_view code) const;

  const Station* Find(std::string_view canonical_name) const;

  // Throws if `canonical_name` is not on the line.
  double ChainageKm(std::string_view canonical_name) const;

  const std::vector<Station>& stations() const { return stations_; }
  bool empty() const { return stations_.empty(); }

 private:
  std::vector<Station> stations_;
  std::unordered_map<std::string, size_t> index_by_name_;
  std::unordered_map<std::string, std::string> aliases_;
  std::unordered_map<std::string, std::string> codes_;
};

// Builds a directory from a parsed TOML table of the form
//
//   [[stations]]
//   name = "CHURCHGATE"
//   chainage_km = 0.0
//   codes = ["CCG"]
//
//   [aliases]
//   "KANDIVLI" = "KANDIVALI"
//
//   [codes]
//   "PNVL" = "PANVEL"
//
// Throws std::runtime_error when the stations array is missing or empty, or
// when an alias points to a station that is not listed.
StationDirectory StationDirectoryFromToml(const toml::table& table);

// Loads and validates a station directory TOML file.
StationDirectory StationDirectoryLoad(const std::string& toml_path);

}  // namespace rakelink
