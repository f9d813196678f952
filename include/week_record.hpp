#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

constexpr size_t kWeekdayCount = 5;

// One word as delivered by the token source. Coordinates are in page units
// with the origin at the top-left corner.
struct PositionedToken {
  std::string text;
  double x0 = 0.0;
  double x1 = 0.0;
  double top = 0.0;
  double bottom = 0.0;
};

struct PageContent {
  std::string text;
  std::vector<PositionedToken> tokens;
};

// Six increasing x coordinates; column i covers [bounds[i], bounds[i+1]).
struct ColumnBoundaries {
  std::array<double, kWeekdayCount + 1> bounds{};
};

struct Row {
  long key = 0; // rounded top
  std::array<std::string, kWeekdayCount> cells;
  std::string areaText;
};

struct TimeRange {
  std::string start;
  std::string end;
};

struct Capture {
  size_t column = 0;
  TimeRange range;
  std::string area;
  bool flagged = false;
};

struct DayInfo {
  std::string weekday;
  std::optional<std::string> start;
  std::optional<std::string> end;
  std::optional<std::string> note;
  std::string date;
  std::optional<std::string> area;
};

struct WeekRecord {
  std::optional<std::string> weekEnding;
  std::array<std::string, kWeekdayCount> dates;
  std::vector<DayInfo> days; // column order, Monday first

  // Returns nullptr when no day carries that name.
  const DayInfo* day(const std::string& weekday) const;
};
