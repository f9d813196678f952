#include <catch2/catch_all.hpp>

#include "schedule_extractor.hpp"

#include <string>
#include <vector>

namespace {

Row makeRow(std::array<std::string, kWeekdayCount> cells, std::string area = "") {
  Row r;
  r.cells = std::move(cells);
  r.areaText = std::move(area);
  return r;
}

ClassifiedRow content(const Row& row) {
  ClassifiedRow c;
  c.row = &row;
  return c;
}

ClassifiedRow shift(const Row& row, DayRanges ranges) {
  ClassifiedRow c;
  c.row = &row;
  c.kind = RowKind::ShiftTime;
  c.ranges = std::move(ranges);
  return c;
}

DayRanges allDay(const std::string& start, const std::string& end) {
  DayRanges r;
  for (auto& d : r) d = TimeRange{start, end};
  return r;
}

}

TEST_CASE("content rows before the first shift-time row are ignored", "[extract]") {
  Row early = makeRow({"Rohan", "Rohan ATM", "", "", ""}, "Front");
  ScheduleExtractor extractor("Rohan", "ATM");
  extractor.feed(content(early));

  REQUIRE_FALSE(extractor.hasActiveShift());
  REQUIRE(extractor.currentArea() == "Front");
  for (size_t i = 0; i < kWeekdayCount; ++i) {
    REQUIRE(extractor.result().captures[i].empty());
    REQUIRE(extractor.result().flags[i].empty());
  }
}

TEST_CASE("a name under an active shift is captured with the current area", "[extract]") {
  DayRanges ranges;
  ranges[0] = TimeRange{"9:00", "17:00"};
  ranges[2] = TimeRange{"9:30", "18:00"};
  ranges[3] = TimeRange{"9:00", "17:00"};

  Row times = makeRow({"9:00-17:00", "", "9:30-18:00", "9:00-17:00", "off"}, "Front");
  Row names = makeRow({"Alice", "rohan", "Jane Rohan ATM", "", ""});

  ScheduleExtractor extractor("Rohan", "ATM");
  extractor.feed(shift(times, ranges));
  REQUIRE(extractor.hasActiveShift());
  // the shift-time row itself is never scanned for names
  REQUIRE(extractor.result().captures[2].empty());

  extractor.feed(content(names));
  const auto& out = extractor.result();

  REQUIRE(out.captures[0].empty());
  REQUIRE(out.captures[1].empty()); // no active range in that column
  REQUIRE(out.captures[2].size() == 1);
  REQUIRE(out.captures[2][0].column == 2);
  REQUIRE(out.captures[2][0].range.start == "9:30");
  REQUIRE(out.captures[2][0].range.end == "18:00");
  REQUIRE(out.captures[2][0].area == "Front");
  REQUIRE(out.captures[2][0].flagged);
  REQUIRE(out.flags[2] == std::vector<std::string>{"ATM"});
}

TEST_CASE("the flag is recorded even when the column has no active range", "[extract]") {
  DayRanges ranges;
  ranges[0] = TimeRange{"9:00", "17:00"};
  Row times = makeRow({"9:00-17:00", "", "", "", ""});
  Row names = makeRow({"", "Rohan (atm)", "", "", ""});

  ScheduleExtractor extractor("Rohan", "ATM");
  extractor.feed(shift(times, ranges));
  extractor.feed(content(names));
  REQUIRE(extractor.result().captures[1].empty());
  REQUIRE(extractor.result().flags[1] == std::vector<std::string>{"ATM"});
}

TEST_CASE("area labels stick until a row carries a new one", "[extract]") {
  Row times = makeRow({"7:00-15:00", "7:00-15:00", "7:00-15:00", "", ""}, "Kitchen");
  Row r1 = makeRow({"Rohan", "", "", "", ""});
  Row r2 = makeRow({"", "Rohan", "", "", ""});
  Row r3 = makeRow({"", "", "Rohan", "", ""});
  Row relabel = makeRow({"", "", "", "", ""}, "Bar");
  Row r4 = makeRow({"Rohan", "", "", "", ""});

  std::vector<ClassifiedRow> rows = {
    shift(times, allDay("7:00", "15:00")), content(r1), content(r2), content(r3), content(relabel), content(r4),
  };
  ExtractionOptions options;
  auto out = extractSchedule(rows, options);

  REQUIRE(out.captures[0].size() == 2);
  REQUIRE(out.captures[0][0].area == "Kitchen");
  REQUIRE(out.captures[1][0].area == "Kitchen");
  REQUIRE(out.captures[2][0].area == "Kitchen");
  REQUIRE(out.captures[0][1].area == "Bar");
}

TEST_CASE("a later shift-time row replaces the active ranges", "[extract]") {
  Row morning = makeRow({}, "");
  Row names1 = makeRow({"", "", "", "Rohan ATM", ""});
  Row evening = makeRow({}, "Back");
  Row names2 = makeRow({"", "", "", "Rohan", ""});

  std::vector<ClassifiedRow> rows = {
    shift(morning, allDay("9:00", "17:00")), content(names1),
    shift(evening, allDay("13:00", "21:00")), content(names2),
  };
  ExtractionOptions options;
  auto out = extractSchedule(rows, options);

  REQUIRE(out.captures[3].size() == 2);
  REQUIRE(out.captures[3][0].range.start == "9:00");
  REQUIRE(out.captures[3][0].area.empty());
  REQUIRE(out.captures[3][1].range.start == "13:00");
  REQUIRE(out.captures[3][1].area == "Back");
  REQUIRE_FALSE(out.captures[3][1].flagged);
  REQUIRE(out.flags[3].size() == 1);
}
