#include "report/report.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "reconcile/test_util/sample_timetable.h"

namespace rakelink {
namespace {

using ::testing::HasSubstr;
using ::testing::Not;

std::vector<std::string> Labels(const std::vector<StationVisit>& visits) {
  std::vector<std::string> labels;
  for (const StationVisit& visit : visits) {
    labels.push_back(visit.label);
  }
  return labels;
}

// Two links that could not be reconciled and nothing else.
Timetable BrokenTimetable() {
  Timetable timetable;
  timetable.itineraries.push_back(Itinerary{
      .link_name = "C",
      .declared_ids = {ServiceId{"93001"}, ServiceId{"93009"}},
      .status = ItineraryStatus::kConflicting,
  });
  timetable.itineraries.push_back(Itinerary{
      .link_name = "D",
      .declared_ids = {ServiceId{"93011"}, ServiceId{"93013"}},
      .undefined_ids = {ServiceId{"93013"}},
      .status = ItineraryStatus::kInvalid,
  });
  timetable.conflicts.push_back(Conflict{
      .link_name = "C",
      .declared = {ServiceId{"93001"}, ServiceId{"93009"}},
      .derived = {"93001", "93002"},
      .reason = ConflictReason::kSequenceMismatch,
  });
  return timetable;
}

TEST(SummaryStatisticsTest, DefaultQuery) {
  const Timetable& timetable = SampleTimetable();
  SummaryStatistics stats = ComputeSummaryStatistics(
      timetable, EvaluateRenderQuery(timetable, RenderQuery{})
  );
  EXPECT_EQ(stats.parsed_services, 6);
  EXPECT_EQ(stats.visible_services, 4);
  EXPECT_EQ(stats.ac_services, 1);
  EXPECT_EQ(stats.non_ac_services, 3);
  EXPECT_EQ(stats.parsed_links, 2);
  EXPECT_EQ(stats.conflicts, 0);
  EXPECT_EQ(stats.visible_links, 2);
  EXPECT_EQ(
      stats.shortest_links,
      (std::vector<LinkLength>{{"A", 120.0}, {"B", 120.0}})
  );
  EXPECT_EQ(
      stats.longest_links, (std::vector<LinkLength>{{"B", 120.0}, {"A", 120.0}})
  );
}

TEST(SummaryStatisticsTest, OnlyVisibleLinksAreRanked) {
  const Timetable& timetable = SampleTimetable();
  SummaryStatistics stats = ComputeSummaryStatistics(
      timetable,
      EvaluateRenderQuery(timetable, RenderQuery{.ac = AcFilter::kAc})
  );
  EXPECT_EQ(stats.visible_services, 1);
  EXPECT_EQ(stats.ac_services, 1);
  EXPECT_EQ(stats.non_ac_services, 0);
  EXPECT_EQ(stats.visible_links, 1);
  EXPECT_EQ(stats.shortest_links, (std::vector<LinkLength>{{"B", 120.0}}));
}

TEST(SummaryStatisticsTest, ToJson) {
  const Timetable& timetable = SampleTimetable();
  nlohmann::json j = ComputeSummaryStatistics(
      timetable, EvaluateRenderQuery(timetable, RenderQuery{})
  );
  EXPECT_EQ(j["parsed_services"], 6);
  EXPECT_EQ(j["longest_links"][0]["link_name"], "B");
}

TEST(PassingThroughTimesTest, SortedByLastVisit) {
  const Timetable& timetable = SampleTimetable();
  std::vector<StationVisit> visits = PassingThroughTimes(
      timetable, EvaluateRenderQuery(timetable, RenderQuery{}), "dadar"
  );
  EXPECT_EQ(
      Labels(visits),
      (std::vector<std::string>{"93001", "93002", "93003", "93004"})
  );
  ASSERT_TRUE(visits[0].time.has_value());
  EXPECT_EQ(visits[0].time->ToString(), "08:45");
  EXPECT_EQ(visits[3].time->ToString(), "11:35");
}

TEST(PassingThroughTimesTest, MissingVisitsComeLast) {
  const Timetable& timetable = SampleTimetable();
  std::vector<StationVisit> visits = PassingThroughTimes(
      timetable, EvaluateRenderQuery(timetable, RenderQuery{}), "PANVEL"
  );
  EXPECT_EQ(
      Labels(visits),
      (std::vector<std::string>{"93001", "93003", "93002", "93004"})
  );
  for (const StationVisit& visit : visits) {
    EXPECT_FALSE(visit.time.has_value());
  }
}

TEST(HeadwayGapTest, CountsGapsLongerThanSize) {
  // DADAR: 08:45 09:35 10:45 11:35. VIRAR: 08:00 10:00 10:30 12:30.
  std::map<std::string, int> gaps = CountHeadwayGaps(
      SampleTimetable(), {"Dadar", "VIRAR"}, TrafficTime{kTrafficDayStartMinutes},
      TrafficTime{kTrafficDayStartMinutes + kMinutesPerDay}, 60
  );
  EXPECT_EQ(gaps, (std::map<std::string, int>{{"DADAR", 1}, {"VIRAR", 2}}));
}

TEST(HeadwayGapTest, OnlyEventsInsideTheWindow) {
  std::map<std::string, int> gaps = CountHeadwayGaps(
      SampleTimetable(), {"DADAR"}, TrafficTime{480}, TrafficTime{600}, 30
  );
  EXPECT_EQ(gaps.at("DADAR"), 1);

  gaps = CountHeadwayGaps(
      SampleTimetable(), {"DADAR"}, TrafficTime{480}, TrafficTime{600}, 60
  );
  EXPECT_EQ(gaps.at("DADAR"), 0);
}

TEST(HeadwayGapTest, UnknownStationHasNoGaps) {
  std::map<std::string, int> gaps = CountHeadwayGaps(
      SampleTimetable(), {"PANVEL"}, TrafficTime{480}, TrafficTime{600}, 5
  );
  EXPECT_EQ(gaps.at("PANVEL"), 0);
}

TEST(TextReportTest, ServiceModeListsServicesAndPassingThrough) {
  const Timetable& timetable = SampleTimetable();
  RenderQuery query{.passing_through = {"DADAR"}};
  std::string report =
      TextReport(timetable, query, EvaluateRenderQuery(timetable, query));
  EXPECT_THAT(report, HasSubstr("Query: mode=service"));
  EXPECT_THAT(report, HasSubstr("No inconsistencies found."));
  EXPECT_THAT(report, HasSubstr("Link A: 93001 93002\n"));
  EXPECT_THAT(report, HasSubstr("Link B: 93003 93004\n"));
  EXPECT_THAT(report, HasSubstr("=== Passing Through DADAR ==="));
  EXPECT_THAT(report, HasSubstr("93001                   08:45\n"));
  EXPECT_THAT(report, Not(HasSubstr("Undefined")));
}

TEST(TextReportTest, RakeLinkModeDescribesLinks) {
  const Timetable& timetable = SampleTimetable();
  RenderQuery query{.mode = RenderMode::kRakeLink, .ac = AcFilter::kAc};
  std::string report =
      TextReport(timetable, query, EvaluateRenderQuery(timetable, query));
  EXPECT_THAT(report, HasSubstr("=== Rake Links Shown ==="));
  EXPECT_THAT(
      report, HasSubstr("Link B: 93003 93004 (120.0 km, rake 2 AC 15-car)")
  );
  EXPECT_THAT(report, Not(HasSubstr("Link A:")));
}

TEST(TextReportTest, ReportsConflictsAndUndefinedServices) {
  Timetable timetable = BrokenTimetable();
  RenderQuery query{.mode = RenderMode::kRakeLink};
  std::string report =
      TextReport(timetable, query, EvaluateRenderQuery(timetable, query));
  EXPECT_THAT(report, HasSubstr("Link C (sequence_mismatch)\n"));
  EXPECT_THAT(report, HasSubstr("  Summary: 93001 93009\n"));
  EXPECT_THAT(report, HasSubstr("  WTT:     93001 93002\n"));
  EXPECT_THAT(report, HasSubstr("Link D: 93013\n"));
  EXPECT_THAT(report, HasSubstr("No rake links match."));
}

}  // namespace
}  // namespace rakelink
