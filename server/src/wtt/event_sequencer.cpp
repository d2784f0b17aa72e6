#include "wtt/event_sequencer.h"

#include <optional>
#include <string>

#include "util/clock_time.h"
#include "wtt/service_extractor.h"

namespace rakelink {

std::vector<Event> SequenceEvents(
    const Service& service, const Grid& grid, const StationDirectory& directory
) {
  std::vector<Event> events;
  const std::vector<TimedCell>& cells = service.timed_cells;

  for (size_t i = 0; i < cells.size(); ++i) {
    const TimedCell& cell = cells[i];
    std::optional<TrafficTime> time = ParseClockTime(cell.text);
    if (!time.has_value()) {
      continue;
    }

    std::string label = LabelNear(grid, cell.row);
    std::optional<std::string> station;
    if (IsReversalLabel(label)) {
      if (events.empty()) {
        continue;
      }
      station = events.back().station;
    } else {
      station = directory.Resolve(label);
    }
    if (!station.has_value()) {
      continue;
    }

    events.push_back(Event{*station, *time, EventKind::kArrival});
    if (NormalizeLabel(grid.Indicator(cell.row)) != "A") {
      continue;
    }

    // Dwell: the departure is printed on the row below the arrival.
    if (i + 1 < cells.size() && cells[i + 1].row == cell.row + 1 &&
        NormalizeLabel(grid.Indicator(cell.row + 1)) == "D") {
      if (std::optional<TrafficTime> departure =
              ParseClockTime(cells[i + 1].text)) {
        events.push_back(Event{*station, *departure, EventKind::kDeparture});
        ++i;
      }
    }
  }

  return events;
}

}  // namespace rakelink
