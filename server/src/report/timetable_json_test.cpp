#include "report/timetable_json.h"

#include <gtest/gtest.h>

#include "reconcile/test_util/sample_timetable.h"

namespace rakelink {
namespace {

TEST(TimetableJsonTest, ServiceOnALink) {
  nlohmann::json j = ServiceToJson(SampleTimetable(), ServiceIdx{0});
  EXPECT_EQ(j["label"], "93001");
  EXPECT_EQ(j["kind"], "regular");
  EXPECT_EQ(j["direction"], "UP");
  EXPECT_EQ(j["successor"], "93002");
  EXPECT_EQ(j["first_station"], "VIRAR");
  EXPECT_EQ(j["last_station"], "CHURCHGATE");
  EXPECT_EQ(j["link_name"], "A");
  EXPECT_EQ(j["length_km"], 60.0);
  ASSERT_EQ(j["events"].size(), 7u);
  EXPECT_EQ(
      j["events"][0],
      nlohmann::json::parse(
          R"({"station": "VIRAR", "time": "08:00", "kind": "arrival"})"
      )
  );
}

TEST(TimetableJsonTest, ServiceWithoutLink) {
  nlohmann::json j = ServiceToJson(SampleTimetable(), ServiceIdx{2});
  EXPECT_EQ(j["label"], "93005");
  EXPECT_TRUE(j["link_name"].is_null());
  EXPECT_TRUE(j["successor"].is_null());
  EXPECT_TRUE(j["events"].empty());
}

TEST(TimetableJsonTest, Itinerary) {
  const Timetable& timetable = SampleTimetable();
  nlohmann::json j = ItineraryToJson(timetable, timetable.itineraries[1]);
  EXPECT_EQ(j["link_name"], "B");
  EXPECT_EQ(j["status"], "valid");
  EXPECT_EQ(j["services"], nlohmann::json::parse("[1, 4]"));
  EXPECT_EQ(j["service_labels"], nlohmann::json::parse(R"(["93003", "93004"])"));
  EXPECT_EQ(j["rake"]["is_ac"], true);
}

TEST(TimetableJsonTest, Timetable) {
  nlohmann::json j = TimetableToJson(SampleTimetable());
  EXPECT_EQ(j["services"].size(), 6u);
  EXPECT_EQ(j["itineraries"].size(), 2u);
  EXPECT_TRUE(j["conflicts"].empty());
}

TEST(RenderQueryJsonTest, EmptyObjectIsDefaultQuery) {
  RenderQuery query = RenderQueryFromJson(nlohmann::json::object());
  EXPECT_EQ(query.mode, RenderMode::kService);
  EXPECT_EQ(query.ac, AcFilter::kAll);
  EXPECT_EQ(query.window_start.minutes, kTrafficDayStartMinutes);
  EXPECT_EQ(
      query.window_end.minutes, kTrafficDayStartMinutes + kMinutesPerDay
  );
}

TEST(RenderQueryJsonTest, AllFields) {
  RenderQuery query = RenderQueryFromJson(nlohmann::json::parse(R"({
    "mode": "rakelink",
    "start_station": "VIRAR",
    "passing_through": ["DADAR"],
    "window_start": "08:00",
    "window_end": 1500,
    "directions": ["DOWN"],
    "ac": "nonac",
    "link_names": ["A"],
    "service_ids": ["93001"]
  })"));
  EXPECT_EQ(query.mode, RenderMode::kRakeLink);
  EXPECT_EQ(query.start_station, "VIRAR");
  EXPECT_FALSE(query.end_station.has_value());
  EXPECT_EQ(query.passing_through, std::vector<std::string>{"DADAR"});
  EXPECT_EQ(query.window_start.minutes, 480);
  EXPECT_EQ(query.window_end.minutes, 1500);
  EXPECT_EQ(query.directions, std::vector<Direction>{Direction::kDown});
  EXPECT_EQ(query.ac, AcFilter::kNonAc);
  EXPECT_EQ(query.link_names, std::vector<std::string>{"A"});
  EXPECT_EQ(query.service_ids, std::vector<ServiceId>{ServiceId{"93001"}});
}

TEST(RenderQueryJsonTest, RoundTripsThroughToJson) {
  RenderQuery query{
      .mode = RenderMode::kStation,
      .end_station = "CHURCHGATE",
      .window_start = TrafficTime{500},
      .ac = AcFilter::kAc,
  };
  RenderQuery parsed = RenderQueryFromJson(RenderQueryToJson(query));
  EXPECT_EQ(parsed.mode, query.mode);
  EXPECT_EQ(parsed.end_station, query.end_station);
  EXPECT_EQ(parsed.window_start, query.window_start);
  EXPECT_EQ(parsed.window_end, query.window_end);
  EXPECT_EQ(parsed.ac, query.ac);
}

TEST(RenderQueryJsonTest, RejectsBadInput) {
  EXPECT_THROW(
      RenderQueryFromJson(nlohmann::json::array()), std::runtime_error
  );
  EXPECT_THROW(
      RenderQueryFromJson(nlohmann::json::parse(R"({"mode": "timeline"})")),
      std::runtime_error
  );
  EXPECT_THROW(
      RenderQueryFromJson(nlohmann::json::parse(R"({"ac": "maybe"})")), std::runtime_error
  );
  EXPECT_THROW(
      RenderQueryFromJson(nlohmann::json::parse(R"({"directions": ["SIDEWAYS"]})")),
      std::runtime_error
  );
  EXPECT_THROW(
      RenderQueryFromJson(nlohmann::json::parse(R"({"window_start": "noon"})")),
      std::runtime_error
  );
  EXPECT_THROW(
      RenderQueryFromJson(nlohmann::json::parse(R"({"start_station": 12})")),
      std::runtime_error
  );
  EXPECT_THROW(
      RenderQueryFromJson(
          nlohmann::json::parse(R"({"window_start": 900, "window_end": 600})")
      ),
      std::runtime_error
  );
}

TEST(VisibilityJsonTest, ListsVisibleLabels) {
  const Timetable& timetable = SampleTimetable();
  nlohmann::json j = VisibilityToJson(
      timetable,
      EvaluateRenderQuery(timetable, RenderQuery{.link_names = {"B"}})
  );
  EXPECT_EQ(j["visible_services"], nlohmann::json::parse(R"(["93003", "93004"])"));
  EXPECT_EQ(j["visible_links"], nlohmann::json::parse(R"(["B"])"));
  EXPECT_EQ(j["itineraries"], nlohmann::json::parse("[false, true]"));
}

}  // namespace
}  // namespace rakelink
