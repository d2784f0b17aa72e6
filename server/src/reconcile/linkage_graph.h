#pragma once

#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "wtt/service_id.h"
#include "wtt/timetable.h"

namespace rakelink {

// "Rolls into" graph over the service arena. A service has at most one
// outgoing edge, to the service owning its successor identifier.
struct LinkageGraph {
  // Indexed by ServiceIdx::v.
  std::vector<std::optional<ServiceIdx>> next;
  std::vector<int> in_degree;

  // Identifier -> first service (in arena order) declaring it.
  std::unordered_map<ServiceId, ServiceIdx> owner;

  // Every identifier named as some service's successor, resolved or not.
  std::unordered_set<ServiceId> successor_ids;

  std::optional<ServiceIdx> Owner(const ServiceId& id) const;
  bool IsSuccessorOfAnother(const ServiceId& id) const {
    return successor_ids.contains(id);
  }
  int NumServices() const { return static_cast<int>(next.size()); }
};

LinkageGraph MakeLinkageGraph(const std::vector<Service>& services);

// As above, restricted to services carrying at least one of `declared_ids`.
// Other services keep their arena slot but own no identifier and take part in
// no edge, so a chain never runs into or out of them.
LinkageGraph MakeLinkageGraph(
    const std::vector<Service>& services,
    const std::unordered_set<ServiceId>& declared_ids
);

// Maximal chains obtained by walking forward from every service that has an
// outgoing edge but no incoming one, in arena order. A service is visited at
// most once across all chains, so successor cycles are cut where the walk
// re-enters them. Services without edges are not chains.
std::vector<std::vector<ServiceIdx>> FindCandidateChains(
    const LinkageGraph& graph
);

}  // namespace rakelink
