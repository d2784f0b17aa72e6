#include "reconcile/rake_assignor.h"

namespace rakelink {

void AssignRakes(Timetable& timetable) {
  int next_rake_id = 1;
  for (Itinerary& itinerary : timetable.itineraries) {
    if (!itinerary.IsValid() || itinerary.service_path.empty()) {
      itinerary.rake = std::nullopt;
      continue;
    }

    Rake rake{.rake_id = next_rake_id++};
    rake.car_count = timetable.service(itinerary.service_path.front()).car_count;
    for (ServiceIdx idx : itinerary.service_path) {
      if (timetable.service(idx).needs_ac) {
        rake.is_ac = true;
        break;
      }
    }
    itinerary.rake = rake;
  }
}

AcConversion ConvertLinksToAc(
    const Timetable& timetable, const std::vector<std::string>& link_names
) {
  AcConversion result{.timetable = timetable};
  for (const std::string& link_name : link_names) {
    Itinerary* itinerary = nullptr;
    for (Itinerary& candidate : result.timetable.itineraries) {
      if (candidate.link_name == link_name) {
        itinerary = &candidate;
        break;
      }
    }
    if (itinerary == nullptr || !itinerary->IsValid() ||
        !itinerary->rake.has_value() || itinerary->rake->is_ac) {
      result.skipped.push_back(link_name);
      continue;
    }

    itinerary->rake->is_ac = true;
    for (ServiceIdx idx : itinerary->service_path) {
      result.timetable.service(idx).needs_ac = true;
    }
    result.converted.push_back(link_name);
  }
  return result;
}

}  // namespace rakelink
