#include "wtt/event_sequencer.h"

#include <gtest/gtest.h>

#include "wtt/service_extractor.h"
#include "wtt/test_util/synthetic_grid.h"

namespace rakelink {
namespace {

Event Arr(const std::string& station, int minutes) {
  return Event{station, TrafficTime{minutes}, EventKind::kArrival};
}

Event Dep(const std::string& station, int minutes) {
  return Event{station, TrafficTime{minutes}, EventKind::kDeparture};
}

std::vector<Event> SequenceColumn(const Grid& grid, int column) {
  StationDirectory directory = MakeTestDirectory();
  std::optional<Service> service =
      ExtractService(grid, column, directory, TestExtractOptions());
  EXPECT_TRUE(service.has_value());
  if (!service.has_value()) {
    return {};
  }
  return SequenceEvents(*service, grid, directory);
}

TEST(EventSequencerTest, UpWorkingWithDwellsAndReversal) {
  Grid grid = MakeGrid(
      Direction::kUp, UpRows(), {UpWorking("93001", 480, "93002")}
  );
  EXPECT_EQ(
      SequenceColumn(grid, 2),
      (std::vector<Event>{
          Arr("VIRAR", 480),
          Arr("BORIVALI", 500),
          Dep("BORIVALI", 501),
          Arr("ANDHERI", 512),
          Arr("DADAR", 525),
          Arr("CHURCHGATE", 540),
          Dep("CHURCHGATE", 550),
      })
  );
}

TEST(EventSequencerTest, TerminalArrivalHasNoDeparture) {
  Grid grid =
      MakeGrid(Direction::kUp, UpRows(), {UpWorking("93001", 480)});
  std::vector<Event> events = SequenceColumn(grid, 2);
  ASSERT_EQ(events.size(), 6u);
  EXPECT_EQ(events.back(), Arr("CHURCHGATE", 540));
}

TEST(EventSequencerTest, DwellPairAtOneStation) {
  Grid grid = MakeGrid(
      Direction::kDown, DownRows(), {DownWorking("93002", 560)}
  );
  std::vector<Event> events = SequenceColumn(grid, 2);

  std::vector<Event> at_borivali;
  for (const Event& event : events) {
    if (event.station == "BORIVALI") {
      at_borivali.push_back(event);
    }
  }
  ASSERT_EQ(at_borivali.size(), 2u);
  EXPECT_EQ(at_borivali[0].kind, EventKind::kArrival);
  EXPECT_EQ(at_borivali[1].kind, EventKind::kDeparture);
  EXPECT_LE(at_borivali[0].time, at_borivali[1].time);
}

TEST(EventSequencerTest, ReversalRowUsesPreviousStation) {
  ColumnCells cells = DownWorking("93002", 560, "93003");
  cells[8] = "10:40";
  Grid grid = MakeGrid(Direction::kDown, DownRows(), {cells});

  std::vector<Event> events = SequenceColumn(grid, 2);
  ASSERT_FALSE(events.empty());
  EXPECT_EQ(events.back(), Arr("VIRAR", 640));
}

TEST(EventSequencerTest, ReversalRowWithoutPreviousEventIsSkipped) {
  Grid grid = MakeGrid(
      Direction::kDown,
      {{"", ""}, {"", ""}, {"Reversed as", ""}, {"DADAR", ""}},
      {{{0, "93004"}, {2, "09:00"}, {3, "09:10"}}}
  );
  EXPECT_EQ(SequenceColumn(grid, 2), (std::vector<Event>{Arr("DADAR", 550)}));
}

TEST(EventSequencerTest, UnresolvableLabelsAreSkipped) {
  Grid grid = MakeGrid(
      Direction::kDown,
      {{"", ""}, {"", ""}, {"DADAR", ""}, {"SIDING 4", ""}, {"ANDHERI (L)", ""}},
      {{{0, "93005"}, {2, "09:00"}, {3, "09:05"}, {4, "09:12"}}}
  );
  EXPECT_EQ(
      SequenceColumn(grid, 2),
      (std::vector<Event>{Arr("DADAR", 540), Arr("ANDHERI", 552)})
  );
}

TEST(EventSequencerTest, TimesAfterMidnightStayOnTheTrafficDay) {
  Grid grid = MakeGrid(
      Direction::kDown, DownRows(), {DownWorking("93006", 1430)}
  );
  std::vector<Event> events = SequenceColumn(grid, 2);
  ASSERT_EQ(events.size(), 6u);
  EXPECT_EQ(events.front().time, TrafficTime{1430});
  EXPECT_EQ(events.back().time, TrafficTime{1500});
  for (size_t i = 1; i < events.size(); ++i) {
    EXPECT_LE(events[i - 1].time, events[i].time);
  }
}

}  // namespace
}  // namespace rakelink
