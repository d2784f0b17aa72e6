#include "reconcile/length.h"

#include <cmath>

namespace rakelink {

double ServiceLengthKm(
    const std::vector<Event>& events, const StationDirectory& directory
) {
  double length_km = 0.0;
  for (size_t i = 1; i < events.size(); ++i) {
    length_km += std::abs(
        directory.ChainageKm(events[i].station) -
        directory.ChainageKm(events[i - 1].station)
    );
  }
  return length_km;
}

double ItineraryLengthKm(
    const std::vector<ServiceIdx>& path, const std::vector<Service>& services
) {
  double length_km = 0.0;
  for (ServiceIdx idx : path) {
    length_km += services[idx.v].length_km;
  }
  return length_km;
}

}  // namespace rakelink
