#include "reconcile/reconciler.h"

#include <algorithm>
#include <format>
#include <unordered_map>
#include <unordered_set>

#include "reconcile/length.h"
#include "reconcile/linkage_graph.h"
#include "wtt/event_sequencer.h"

namespace rakelink {

namespace {

std::string JoinIds(const std::vector<ServiceId>& ids) {
  std::string result;
  for (size_t i = 0; i < ids.size(); ++i) {
    if (i > 0) result += " ";
    result += ids[i].v;
  }
  return result;
}

std::string JoinLabels(const std::vector<std::string>& labels) {
  std::string result;
  for (size_t i = 0; i < labels.size(); ++i) {
    if (i > 0) result += " ";
    result += labels[i];
  }
  return result;
}

std::vector<std::string> Labels(
    const std::vector<ServiceIdx>& path, const std::vector<Service>& services
) {
  std::vector<std::string> labels;
  labels.reserve(path.size());
  for (ServiceIdx idx : path) {
    labels.push_back(services[idx.v].Label());
  }
  return labels;
}

class Reconciler {
 public:
  Reconciler(
      std::vector<Service> services,
      const std::unordered_set<ServiceId>& declared_ids,
      const ScheduleGrids& grids,
      const StationDirectory& directory,
      const TextLogger& log
  )
      : grids_(grids), directory_(directory), log_(log) {
    timetable_.services = std::move(services);
    graph_ = MakeLinkageGraph(timetable_.services, declared_ids);
    for (std::vector<ServiceIdx>& chain : FindCandidateChains(graph_)) {
      std::optional<ServiceId> start =
          timetable_.service(chain.front()).PrimaryId();
      if (start.has_value()) {
        chain_by_start_.try_emplace(*start, std::move(chain));
      }
    }
    log_(std::format(
        "{} services, {} candidate chains",
        timetable_.services.size(),
        chain_by_start_.size()
    ));
  }

  void AddLink(const SummaryLink& link) {
    Itinerary itinerary{
        .link_name = link.link_name,
        .declared_ids = link.ids,
        .declared_lines = link.line_labels,
    };

    for (const ServiceId& id : link.ids) {
      if (!graph_.Owner(id).has_value()) {
        itinerary.undefined_ids.push_back(id);
      }
    }
    if (!itinerary.undefined_ids.empty()) {
      itinerary.status = ItineraryStatus::kInvalid;
      log_(std::format(
          "Link {}: invalid, undefined services {}",
          link.link_name,
          JoinIds(itinerary.undefined_ids)
      ));
      timetable_.itineraries.push_back(std::move(itinerary));
      return;
    }

    std::optional<std::vector<ServiceIdx>> path = FindPath(link);
    if (!path.has_value()) {
      itinerary.status = ItineraryStatus::kConflicting;
      timetable_.itineraries.push_back(std::move(itinerary));
      return;
    }

    if (!Claimable(*path)) {
      AddConflict(link, Labels(*path, timetable_.services),
                  ConflictReason::kServiceAlreadyAssigned);
      itinerary.status = ItineraryStatus::kConflicting;
      timetable_.itineraries.push_back(std::move(itinerary));
      return;
    }

    // Nothing is written to the services until every one of them sequences.
    std::vector<std::vector<Event>> staged;
    staged.reserve(path->size());
    for (ServiceIdx idx : *path) {
      const Service& service = timetable_.service(idx);
      std::vector<Event> events = SequenceEvents(
          service, grids_.ForDirection(service.direction), directory_
      );
      if (events.empty()) {
        log_(std::format(
            "Link {}: service {} has no station events",
            link.link_name,
            service.Label()
        ));
        AddConflict(link, Labels(*path, timetable_.services),
                    ConflictReason::kNoStationEvents);
        itinerary.status = ItineraryStatus::kConflicting;
        timetable_.itineraries.push_back(std::move(itinerary));
        return;
      }
      staged.push_back(std::move(events));
    }

    for (size_t i = 0; i < path->size(); ++i) {
      Service& service = timetable_.service((*path)[i]);
      service.events = std::move(staged[i]);
      service.first_station = service.events.front().station;
      service.last_station = service.events.back().station;
      service.length_km = ServiceLengthKm(service.events, directory_);
      claimed_.insert((*path)[i]);
    }
    itinerary.service_path = std::move(*path);
    itinerary.length_km =
        ItineraryLengthKm(itinerary.service_path, timetable_.services);
    itinerary.status = ItineraryStatus::kValid;
    log_(std::format(
        "Link {}: valid, {} services, {:.2f} km",
        link.link_name,
        itinerary.service_path.size(),
        itinerary.length_km
    ));
    timetable_.itineraries.push_back(std::move(itinerary));
  }

  Timetable Finish() && { return std::move(timetable_); }

 private:
  // The service path for `link`, or nullopt after recording a Conflict.
  std::optional<std::vector<ServiceIdx>> FindPath(const SummaryLink& link) {
    const ServiceId& first = link.ids.front();

    auto chain_it = chain_by_start_.find(first);
    if (chain_it != chain_by_start_.end()) {
      const std::vector<ServiceIdx>& chain = chain_it->second;
      std::vector<std::optional<ServiceId>> chain_ids;
      for (ServiceIdx idx : chain) {
        chain_ids.push_back(timetable_.service(idx).PrimaryId());
      }
      switch (CompareWithChain(link.ids, chain_ids)) {
        case ChainMatch::kExact:
          return chain;
        case ChainMatch::kTrailingPlaceholders:
          log_(std::format(
              "Link {}: accepted without trailing placeholders",
              link.link_name
          ));
          return chain;
        case ChainMatch::kMismatch:
          break;
      }
      std::vector<std::string> derived = Labels(chain, timetable_.services);
      log_(std::format(
          "Link {}: conflict, summary [{}] grid [{}]",
          link.link_name,
          JoinIds(link.ids),
          JoinLabels(derived)
      ));
      AddConflict(link, std::move(derived), ConflictReason::kSequenceMismatch);
      return std::nullopt;
    }

    if (graph_.IsSuccessorOfAnother(first)) {
      // Some other working rolls into the first service, so the grid chain
      // starts elsewhere. Take the summary's order as given.
      log_(std::format(
          "Link {}: {} is another service's successor, using summary order",
          link.link_name,
          first.v
      ));
      std::vector<ServiceIdx> path;
      for (const ServiceId& id : link.ids) {
        path.push_back(*graph_.Owner(id));
      }
      return path;
    }

    log_(std::format(
        "Link {}: conflict, no grid chain starts with {}",
        link.link_name,
        first.v
    ));
    AddConflict(link, {}, ConflictReason::kSequenceMismatch);
    return std::nullopt;
  }

  bool Claimable(const std::vector<ServiceIdx>& path) const {
    std::unordered_set<ServiceIdx> seen;
    for (ServiceIdx idx : path) {
      if (claimed_.contains(idx) || !seen.insert(idx).second) {
        log_(std::format(
            "Service {} is already part of a link",
            timetable_.service(idx).Label()
        ));
        return false;
      }
    }
    return true;
  }

  void AddConflict(
      const SummaryLink& link,
      std::vector<std::string> derived,
      ConflictReason reason
  ) {
    timetable_.conflicts.push_back(Conflict{
        .link_name = link.link_name,
        .declared = link.ids,
        .derived = std::move(derived),
        .reason = reason,
    });
  }

  const ScheduleGrids& grids_;
  const StationDirectory& directory_;
  const TextLogger& log_;

  Timetable timetable_;
  LinkageGraph graph_;
  std::unordered_map<ServiceId, std::vector<ServiceIdx>> chain_by_start_;
  std::unordered_set<ServiceIdx> claimed_;
};

}  // namespace

ChainMatch CompareWithChain(
    const std::vector<ServiceId>& declared,
    const std::vector<std::optional<ServiceId>>& chain_ids
) {
  if (declared.size() < chain_ids.size()) {
    return ChainMatch::kMismatch;
  }
  for (size_t i = 0; i < chain_ids.size(); ++i) {
    if (chain_ids[i] != declared[i]) {
      return ChainMatch::kMismatch;
    }
  }
  const size_t missing = declared.size() - chain_ids.size();
  if (missing == 0) {
    return ChainMatch::kExact;
  }
  if (missing > 2) {
    return ChainMatch::kMismatch;
  }
  for (size_t i = chain_ids.size(); i < declared.size(); ++i) {
    if (!IsStablingPlaceholder(declared[i])) {
      return ChainMatch::kMismatch;
    }
  }
  return ChainMatch::kTrailingPlaceholders;
}

Timetable Reconcile(
    std::vector<Service> services,
    const std::vector<SummaryLink>& links,
    const ScheduleGrids& grids,
    const StationDirectory& directory,
    const TextLogger& log
) {
  // Only workings some link names take part in chains.
  std::unordered_set<ServiceId> declared_ids;
  for (const SummaryLink& link : links) {
    declared_ids.insert(link.ids.begin(), link.ids.end());
  }

  Reconciler reconciler(
      std::move(services), declared_ids, grids, directory, log
  );
  for (const SummaryLink& link : links) {
    if (link.ids.empty()) {
      continue;
    }
    reconciler.AddLink(link);
  }
  Timetable timetable = std::move(reconciler).Finish();

  int num_valid = 0;
  for (const Itinerary& itinerary : timetable.itineraries) {
    if (itinerary.IsValid()) ++num_valid;
  }
  log(std::format(
      "{} of {} links valid, {} conflicts",
      num_valid,
      timetable.itineraries.size(),
      timetable.conflicts.size()
  ));
  return timetable;
}

}  // namespace rakelink
