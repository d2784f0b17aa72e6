#include "wtt/timetable.h"

#include <algorithm>

namespace rakelink {

std::vector<ServiceId> Service::Ids() const {
  if (const auto* regular = std::get_if<RegularService>(&kind)) {
    return {regular->id};
  }
  if (const auto* multi = std::get_if<MultiIdService>(&kind)) {
    return multi->ids;
  }
  return {};
}

std::optional<ServiceId> Service::PrimaryId() const {
  if (const auto* regular = std::get_if<RegularService>(&kind)) {
    return regular->id;
  }
  if (const auto* multi = std::get_if<MultiIdService>(&kind)) {
    return multi->ids.front();
  }
  return std::nullopt;
}

bool Service::HasId(const ServiceId& id) const {
  if (const auto* regular = std::get_if<RegularService>(&kind)) {
    return regular->id == id;
  }
  if (const auto* multi = std::get_if<MultiIdService>(&kind)) {
    return std::find(multi->ids.begin(), multi->ids.end(), id) !=
           multi->ids.end();
  }
  return false;
}

std::string Service::Label() const {
  if (std::optional<ServiceId> id = PrimaryId()) {
    return id->v;
  }
  return "STABLING@" + std::string(DirectionName(direction)) + ":" +
         std::to_string(column);
}

std::string_view ItineraryStatusName(ItineraryStatus status) {
  switch (status) {
    case ItineraryStatus::kValid:
      return "valid";
    case ItineraryStatus::kInvalid:
      return "invalid";
    case ItineraryStatus::kConflicting:
      return "conflicting";
  }
  return "";
}

std::string_view ConflictReasonName(ConflictReason reason) {
  switch (reason) {
    case ConflictReason::kSequenceMismatch:
      return "sequence_mismatch";
    case ConflictReason::kServiceAlreadyAssigned:
      return "service_already_assigned";
    case ConflictReason::kNoStationEvents:
      return "no_station_events";
  }
  return "";
}

const Itinerary* Timetable::FindItinerary(std::string_view link_name) const {
  for (const Itinerary& itinerary : itineraries) {
    if (itinerary.link_name == link_name) {
      return &itinerary;
    }
  }
  return nullptr;
}

std::optional<ServiceIdx> Timetable::FindService(const ServiceId& id) const {
  for (size_t i = 0; i < services.size(); ++i) {
    if (services[i].HasId(id)) {
      return ServiceIdx{static_cast<int>(i)};
    }
  }
  return std::nullopt;
}

}  // namespace rakelink
