#include "wtt/service_extractor.h"

#include <cctype>
#include <regex>

#include "util/clock_time.h"

namespace rakelink {

namespace {

// Uppercase alphanumeric runs of `cell`: "CCG ARR." -> {"CCG", "ARR"}.
std::vector<std::string> Tokens(std::string_view cell) {
  std::vector<std::string> tokens;
  std::string current;
  for (char c : cell) {
    if (std::isalnum(static_cast<unsigned char>(c))) {
      current += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    } else if (!current.empty()) {
      tokens.push_back(std::move(current));
      current.clear();
    }
  }
  if (!current.empty()) {
    tokens.push_back(std::move(current));
  }
  return tokens;
}

bool IsArrivalMarker(std::string_view cell) {
  for (const std::string& token : Tokens(cell)) {
    if (token == "ARR" || token == "ARRL") return true;
  }
  return false;
}

std::optional<int> DetectCarCount(std::string_view cell) {
  static const std::regex pattern(R"(\b(\d{1,2})\s*CAR\b)", std::regex::icase);
  std::string text(cell);
  std::smatch match;
  if (std::regex_search(text, match, pattern)) {
    return std::stoi(match[1].str());
  }
  return std::nullopt;
}

bool MentionsAirConditioning(std::string_view cell) {
  return cell.find("Air") != std::string_view::npos ||
         cell.find("Condition") != std::string_view::npos ||
         cell.find("AC") != std::string_view::npos;
}

std::optional<std::string> FirstStation(
    const Grid& grid,
    const std::vector<TimedCell>& timed_cells,
    const StationDirectory& directory
) {
  if (timed_cells.empty()) {
    return std::nullopt;
  }
  return directory.Resolve(LabelNear(grid, timed_cells.front().row));
}

std::optional<std::string> StationFromArrivalMarker(
    const Grid& grid, int column, const StationDirectory& directory
) {
  for (int row = 0; row < grid.NumRows(); ++row) {
    if (!IsArrivalMarker(grid.Cell(row, column))) {
      continue;
    }
    // The station code is written in the marker cell or right next to it.
    for (int r : {row, row - 1, row + 1}) {
      for (const std::string& token : Tokens(grid.Cell(r, column))) {
        if (std::optional<std::string> name = directory.ResolveCode(token)) {
          return name;
        }
      }
    }
    return std::nullopt;
  }
  return std::nullopt;
}

std::optional<std::string> LastStation(
    const Grid& grid,
    int column,
    const std::vector<TimedCell>& timed_cells,
    const StationDirectory& directory
) {
  if (std::optional<std::string> name =
          StationFromArrivalMarker(grid, column, directory)) {
    return name;
  }
  for (auto it = timed_cells.rbegin(); it != timed_cells.rend(); ++it) {
    std::string label = LabelNear(grid, it->row);
    if (IsReversalLabel(label)) {
      // The time on the reversal row belongs to the station above it.
      label = LabelNear(grid, it->row - 1);
    }
    if (std::optional<std::string> name = directory.Resolve(label)) {
      return name;
    }
  }
  return std::nullopt;
}

}  // namespace

std::string LabelNear(const Grid& grid, int row) {
  for (int r = row; r >= 0 && r >= row - 2; --r) {
    const std::string& label = grid.StationLabel(r);
    if (!IsBlankCell(label)) {
      return label;
    }
  }
  return "";
}

bool IsReversalLabel(std::string_view label) {
  return NormalizeLabel(label).find("REVERSED") != std::string::npos;
}

bool IsIndicatorColumn(const Grid& grid, int column) {
  std::string previous;
  for (int row = 0; row < grid.NumRows(); ++row) {
    const std::string& cell = grid.Cell(row, column);
    if (IsBlankCell(cell)) {
      continue;
    }
    std::string value = NormalizeLabel(cell);
    if (previous == "A" && value == "D") {
      return true;
    }
    previous = std::move(value);
  }
  return false;
}

std::optional<ServiceId> FindSuccessor(const Grid& grid, int column) {
  for (int row = 0; row < grid.NumRows(); ++row) {
    if (NormalizeLabel(grid.StationLabel(row)).find("REVERSED AS") ==
        std::string::npos) {
      continue;
    }
    // On the UP sheet the departure time sits on the marker row and the
    // successor below it; on the DOWN sheet both move up one row.
    int successor_row = grid.direction == Direction::kUp ? row + 1 : row;
    const std::string& departure = grid.Cell(successor_row - 1, column);
    const std::string& successor = grid.Cell(successor_row, column);
    if (IsBlankCell(departure) || !IsFiveDigitNumeral(successor)) {
      return std::nullopt;
    }
    return ServiceId{NormalizeLabel(successor)};
  }
  return std::nullopt;
}

std::optional<Service> ExtractService(
    const Grid& grid,
    int column,
    const StationDirectory& directory,
    const ExtractOptions& options
) {
  bool all_blank = true;
  for (int row = 0; row < grid.NumRows() && all_blank; ++row) {
    all_blank = IsBlankCell(grid.Cell(row, column));
  }
  if (all_blank) {
    return std::nullopt;
  }
  if (NormalizeLabel(grid.Cell(0, column)) == "STATIONS") {
    return std::nullopt;
  }
  if (IsIndicatorColumn(grid, column)) {
    return std::nullopt;
  }

  Service service;
  service.direction = grid.direction;
  service.column = column;
  service.car_count = options.default_car_count;

  std::vector<ServiceId> ids;
  int ac_mentions = 0;
  for (int row = 0; row < options.header_rows; ++row) {
    const std::string& cell = grid.Cell(row, column);
    if (IsBlankCell(cell)) {
      continue;
    }
    if (std::optional<ServiceId> id = ParseServiceIdCell(cell)) {
      ids.push_back(*id);
    }
    if (std::optional<int> car_count = DetectCarCount(cell)) {
      service.car_count = *car_count;
      service.car_count_declared = true;
    }
    if (MentionsAirConditioning(cell)) {
      ++ac_mentions;
    }
  }
  // A single stray "AC" is not enough; AC workings are announced twice.
  service.needs_ac = ac_mentions >= 2;

  if (ids.empty()) {
    service.kind = StablingService{};
  } else if (ids.size() == 1) {
    service.kind = RegularService{ids.front()};
  } else {
    service.kind = MultiIdService{std::move(ids)};
  }

  for (int row = 0; row < grid.NumRows(); ++row) {
    const std::string& cell = grid.Cell(row, column);
    if (IsClockTime(cell)) {
      service.timed_cells.push_back(TimedCell{row, cell});
    }
  }

  service.successor = FindSuccessor(grid, column);
  service.first_station = FirstStation(grid, service.timed_cells, directory);
  service.last_station =
      LastStation(grid, column, service.timed_cells, directory);

  return service;
}

std::vector<Service> ExtractServices(
    const Grid& grid,
    const StationDirectory& directory,
    const ExtractOptions& options
) {
  std::vector<Service> services;
  for (int column = Grid::kFirstServiceColumn; column < grid.NumColumns();
       ++column) {
    if (std::optional<Service> service =
            ExtractService(grid, column, directory, options)) {
      services.push_back(std::move(*service));
    }
  }
  return services;
}

}  // namespace rakelink
