#include "reconcile/linkage_graph.h"

namespace rakelink {

std::optional<ServiceIdx> LinkageGraph::Owner(const ServiceId& id) const {
  auto it = owner.find(id);
  if (it == owner.end()) {
    return std::nullopt;
  }
  return it->second;
}

namespace {

bool IsDeclared(
    const Service& service, const std::unordered_set<ServiceId>* declared_ids
) {
  if (declared_ids == nullptr) {
    return true;
  }
  for (const ServiceId& id : service.Ids()) {
    if (declared_ids->contains(id)) {
      return true;
    }
  }
  return false;
}

LinkageGraph BuildGraph(
    const std::vector<Service>& services,
    const std::unordered_set<ServiceId>* declared_ids
) {
  LinkageGraph graph;
  graph.next.resize(services.size());
  graph.in_degree.resize(services.size(), 0);

  std::vector<bool> included(services.size());
  for (size_t i = 0; i < services.size(); ++i) {
    included[i] = IsDeclared(services[i], declared_ids);
    if (!included[i]) {
      continue;
    }
    for (const ServiceId& id : services[i].Ids()) {
      graph.owner.try_emplace(id, ServiceIdx{static_cast<int>(i)});
    }
  }

  for (size_t i = 0; i < services.size(); ++i) {
    const std::optional<ServiceId>& successor = services[i].successor;
    if (!included[i] || !successor.has_value()) {
      continue;
    }
    graph.successor_ids.insert(*successor);
    std::optional<ServiceIdx> target = graph.Owner(*successor);
    if (!target.has_value()) {
      // Rolls into a working outside this timetable.
      continue;
    }
    graph.next[i] = *target;
    graph.in_degree[target->v]++;
  }

  return graph;
}

}  // namespace

LinkageGraph MakeLinkageGraph(const std::vector<Service>& services) {
  return BuildGraph(services, nullptr);
}

LinkageGraph MakeLinkageGraph(
    const std::vector<Service>& services,
    const std::unordered_set<ServiceId>& declared_ids
) {
  return BuildGraph(services, &declared_ids);
}

std::vector<std::vector<ServiceIdx>> FindCandidateChains(
    const LinkageGraph& graph
) {
  std::vector<std::vector<ServiceIdx>> chains;
  std::unordered_set<ServiceIdx> visited;

  for (int i = 0; i < graph.NumServices(); ++i) {
    const ServiceIdx start{i};
    if (graph.in_degree[i] != 0 || !graph.next[i].has_value() ||
        visited.contains(start)) {
      continue;
    }

    std::vector<ServiceIdx>& chain = chains.emplace_back();
    std::optional<ServiceIdx> current = start;
    while (current.has_value() && !visited.contains(*current)) {
      visited.insert(*current);
      chain.push_back(*current);
      current = graph.next[current->v];
    }
  }

  return chains;
}

}  // namespace rakelink
