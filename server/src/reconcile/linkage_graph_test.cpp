#include "reconcile/linkage_graph.h"

#include <gtest/gtest.h>

namespace rakelink {
namespace {

Service MakeService(
    const std::string& id, const std::optional<std::string>& successor
) {
  Service service;
  if (!id.empty()) {
    service.kind = RegularService{ServiceId{id}};
  }
  if (successor.has_value()) {
    service.successor = ServiceId{*successor};
  }
  return service;
}

using Chains = std::vector<std::vector<ServiceIdx>>;

std::vector<ServiceIdx> Idx(std::initializer_list<int> values) {
  std::vector<ServiceIdx> result;
  for (int v : values) {
    result.push_back(ServiceIdx{v});
  }
  return result;
}

TEST(LinkageGraphTest, EdgesFollowSuccessorIdentifiers) {
  std::vector<Service> services = {
      MakeService("93001", "93002"),
      MakeService("93002", "93003"),
      MakeService("93003", std::nullopt),
      MakeService("93004", "99999"),
  };
  LinkageGraph graph = MakeLinkageGraph(services);

  EXPECT_EQ(graph.next[0], ServiceIdx{1});
  EXPECT_EQ(graph.next[1], ServiceIdx{2});
  EXPECT_EQ(graph.next[2], std::nullopt);
  EXPECT_EQ(graph.next[3], std::nullopt);
  EXPECT_EQ(graph.in_degree, (std::vector<int>{0, 1, 1, 0}));
  EXPECT_TRUE(graph.IsSuccessorOfAnother(ServiceId{"99999"}));
  EXPECT_FALSE(graph.IsSuccessorOfAnother(ServiceId{"93001"}));
}

TEST(LinkageGraphTest, FirstDeclaringServiceOwnsAnIdentifier) {
  std::vector<Service> services = {
      MakeService("93001", "93002"),
      MakeService("93002", std::nullopt),
      MakeService("93002", std::nullopt),
  };
  LinkageGraph graph = MakeLinkageGraph(services);
  EXPECT_EQ(graph.Owner(ServiceId{"93002"}), ServiceIdx{1});
  EXPECT_EQ(graph.next[0], ServiceIdx{1});
}

TEST(LinkageGraphTest, MultiIdServiceIsReachableByAnyId) {
  Service multi;
  multi.kind = MultiIdService{{ServiceId{"93010"}, ServiceId{"93110"}}};
  std::vector<Service> services = {MakeService("93009", "93110"), multi};

  LinkageGraph graph = MakeLinkageGraph(services);
  EXPECT_EQ(graph.next[0], ServiceIdx{1});
  EXPECT_EQ(FindCandidateChains(graph), Chains{Idx({0, 1})});
}

TEST(LinkageGraphTest, ChainsStartAtServicesWithoutPredecessor) {
  std::vector<Service> services = {
      MakeService("93002", "93003"),
      MakeService("93005", std::nullopt),
      MakeService("93001", "93002"),
      MakeService("93003", std::nullopt),
      MakeService("93004", "93005"),
  };
  LinkageGraph graph = MakeLinkageGraph(services);

  Chains chains = FindCandidateChains(graph);
  EXPECT_EQ(chains, (Chains{Idx({2, 0, 3}), Idx({4, 1})}));
}

TEST(LinkageGraphTest, IsolatedServicesAreNotChains) {
  std::vector<Service> services = {
      MakeService("93001", std::nullopt),
      MakeService("", std::nullopt),
  };
  EXPECT_TRUE(FindCandidateChains(MakeLinkageGraph(services)).empty());
}

TEST(LinkageGraphTest, CycleIsCutAtTheFirstRevisit) {
  // 93001 -> 93002 -> 93003 -> 93002
  std::vector<Service> services = {
      MakeService("93001", "93002"),
      MakeService("93002", "93003"),
      MakeService("93003", "93002"),
  };
  EXPECT_EQ(
      FindCandidateChains(MakeLinkageGraph(services)),
      Chains{Idx({0, 1, 2})}
  );
}

TEST(LinkageGraphTest, PureCycleHasNoStart) {
  std::vector<Service> services = {
      MakeService("93001", "93002"),
      MakeService("93002", "93001"),
  };
  EXPECT_TRUE(FindCandidateChains(MakeLinkageGraph(services)).empty());
}

TEST(LinkageGraphTest, MergingChainsShareTheVisitedSet) {
  // 93001 -> 93003 <- 93002; the second walk stops before 93003.
  std::vector<Service> services = {
      MakeService("93001", "93003"),
      MakeService("93002", "93003"),
      MakeService("93003", std::nullopt),
  };
  EXPECT_EQ(
      FindCandidateChains(MakeLinkageGraph(services)),
      (Chains{Idx({0, 2}), Idx({1})})
  );
}

TEST(LinkageGraphTest, UndeclaredServicesTakeNoPartInChains) {
  // 91234 -> 93001 -> 93002 -> 93500; only 93001 and 93002 are declared.
  std::vector<Service> services = {
      MakeService("91234", "93001"),
      MakeService("93001", "93002"),
      MakeService("93002", "93500"),
      MakeService("93500", std::nullopt),
  };
  LinkageGraph graph = MakeLinkageGraph(
      services, {ServiceId{"93001"}, ServiceId{"93002"}}
  );

  EXPECT_EQ(graph.NumServices(), 4);
  EXPECT_EQ(graph.next[0], std::nullopt);
  EXPECT_EQ(graph.next[2], std::nullopt);
  EXPECT_EQ(graph.in_degree, (std::vector<int>{0, 0, 1, 0}));
  EXPECT_EQ(graph.Owner(ServiceId{"93500"}), std::nullopt);
  EXPECT_FALSE(graph.IsSuccessorOfAnother(ServiceId{"93001"}));
  EXPECT_EQ(FindCandidateChains(graph), Chains{Idx({1, 2})});
}

TEST(LinkageGraphTest, MultiIdServiceIsDeclaredByAnyOfItsIds) {
  Service multi;
  multi.kind = MultiIdService{{ServiceId{"93010"}, ServiceId{"93110"}}};
  multi.successor = ServiceId{"93011"};
  std::vector<Service> services = {multi, MakeService("93011", std::nullopt)};

  LinkageGraph graph = MakeLinkageGraph(
      services, {ServiceId{"93110"}, ServiceId{"93011"}}
  );
  EXPECT_EQ(graph.Owner(ServiceId{"93010"}), ServiceIdx{0});
  EXPECT_EQ(FindCandidateChains(graph), Chains{Idx({0, 1})});
}

}  // namespace
}  // namespace rakelink
