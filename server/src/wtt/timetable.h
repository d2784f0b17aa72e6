#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

#include "util/clock_time.h"
#include "wtt/grid.h"
#include "wtt/service_id.h"

namespace rakelink {

// Index of a Service in Timetable::services.
struct ServiceIdx {
  int v;

  bool operator==(const ServiceIdx& other) const { return v == other.v; }
  bool operator!=(const ServiceIdx& other) const { return v != other.v; }
  bool operator<(const ServiceIdx& other) const { return v < other.v; }
};

enum class EventKind { kArrival, kDeparture };

struct Event {
  std::string station;
  TrafficTime time;
  EventKind kind;

  bool operator==(const Event& other) const {
    return station == other.station && time == other.time &&
           kind == other.kind;
  }
};

// A cell of a service column that holds a clock time.
struct TimedCell {
  int row;
  std::string text;

  bool operator==(const TimedCell& other) const {
    return row == other.row && text == other.text;
  }
};

// A revenue working with a single identifier.
struct RegularService {
  ServiceId id;
};

// A non-revenue working (empty stock movement) without an identifier.
struct StablingService {};

// A column printing several identifiers, e.g. a working that runs under
// different numbers on different days.
struct MultiIdService {
  std::vector<ServiceId> ids;
};

using ServiceKind =
    std::variant<RegularService, StablingService, MultiIdService>;

inline constexpr int kDefaultCarCount = 15;

struct Service {
  ServiceKind kind = StablingService{};
  Direction direction = Direction::kUp;
  // Column of the service in its grid.
  int column = 0;

  bool needs_ac = false;
  int car_count = kDefaultCarCount;
  bool car_count_declared = false;

  // Identifier of the service this train becomes after reversing at its last
  // station.
  std::optional<ServiceId> successor;

  std::optional<std::string> first_station;
  std::optional<std::string> last_station;

  std::vector<TimedCell> timed_cells;

  // Empty unless the service is on a valid itinerary.
  std::vector<Event> events;
  double length_km = 0.0;

  // All identifiers, in header order. Empty for stabling workings.
  std::vector<ServiceId> Ids() const;

  // The first identifier, as used in summary sequences.
  std::optional<ServiceId> PrimaryId() const;

  bool HasId(const ServiceId& id) const;

  // Primary id, or "STABLING@<DIR>:<column>" for workings without one.
  std::string Label() const;
};

enum class ItineraryStatus {
  kValid,
  // The summary declares an identifier that no service carries.
  kInvalid,
  // The summary and the grid disagree; see Timetable::conflicts.
  kConflicting,
};

std::string_view ItineraryStatusName(ItineraryStatus status);

struct Rake {
  int rake_id = 0;
  bool is_ac = false;
  int car_count = kDefaultCarCount;

  bool operator==(const Rake& other) const {
    return rake_id == other.rake_id && is_ac == other.is_ac &&
           car_count == other.car_count;
  }
};

// A rake-cycle ("link"): the services one rake performs in a day.
struct Itinerary {
  std::string link_name;

  // From the summary.
  std::vector<ServiceId> declared_ids;
  // FAST/SLOW label printed under each declared id, if any.
  std::vector<std::optional<std::string>> declared_lines;

  std::vector<ServiceId> undefined_ids;
  std::vector<ServiceIdx> service_path;
  ItineraryStatus status = ItineraryStatus::kValid;
  double length_km = 0.0;
  std::optional<Rake> rake;

  bool IsValid() const { return status == ItineraryStatus::kValid; }
};

enum class ConflictReason {
  kSequenceMismatch,
  kServiceAlreadyAssigned,
  kNoStationEvents,
};

std::string_view ConflictReasonName(ConflictReason reason);

struct Conflict {
  std::string link_name;
  std::vector<ServiceId> declared;
  // Labels of the services found by following the grid.
  std::vector<std::string> derived;
  ConflictReason reason = ConflictReason::kSequenceMismatch;
};

// The reconciled working timetable.
struct Timetable {
  std::vector<Service> services;
  std::vector<Itinerary> itineraries;
  std::vector<Conflict> conflicts;

  const Service& service(ServiceIdx idx) const { return services[idx.v]; }
  Service& service(ServiceIdx idx) { return services[idx.v]; }

  const Itinerary* FindItinerary(std::string_view link_name) const;
  std::optional<ServiceIdx> FindService(const ServiceId& id) const;
};

// Output operators for debugging/logging
inline std::ostream& operator<<(std::ostream& os, const ServiceIdx& value) {
  return os << "ServiceIdx{" << value.v << "}";
}

inline std::ostream& operator<<(std::ostream& os, const Event& value) {
  return os << "Event{" << value.station << " " << value.time.ToString()
            << (value.kind == EventKind::kArrival ? " arr" : " dep") << "}";
}

inline void PrintTo(const Event& event, std::ostream* os) { *os << event; }

inline void PrintTo(const TimedCell& cell, std::ostream* os) {
  *os << "TimedCell{" << cell.row << ", \"" << cell.text << "\"}";
}

inline void PrintTo(const Rake& rake, std::ostream* os) {
  *os << "Rake{" << rake.rake_id << ", " << (rake.is_ac ? "AC" : "NON-AC")
      << ", " << rake.car_count << "-car}";
}

}  // namespace rakelink

namespace std {
template <>
struct hash<rakelink::ServiceIdx> {
  size_t operator()(const rakelink::ServiceIdx& idx) const {
    return hash<int>()(idx.v);
  }
};
}  // namespace std
