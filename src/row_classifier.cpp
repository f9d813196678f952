#include "row_classifier.hpp"

#include <algorithm>
#include <string>

RowPatterns compilePatterns(const ExtractionOptions& options) {
  auto compile = [](const std::string& pattern, const char* name) {
    try {
      return std::regex(pattern);
    } catch (const std::regex_error& e) {
      throw ExtractionError(ExtractionError::Kind::MalformedInput,
                            std::string("invalid ") + name + " pattern '" + pattern + "': " + e.what());
    }
  };

  RowPatterns patterns{
    compile(options.datePattern, "date"),
    compile(options.timeRangePattern, "time range"),
    compile(options.weekEndingPattern, "week ending"),
  };
  if (patterns.date.mark_count() < 1 || patterns.weekEnding.mark_count() < 1) {
    throw ExtractionError(ExtractionError::Kind::MalformedInput,
                          "date patterns need a capture group for the date");
  }
  if (patterns.timeRange.mark_count() < 2) {
    throw ExtractionError(ExtractionError::Kind::MalformedInput,
                          "time range pattern needs start and end capture groups");
  }
  return patterns;
}

std::optional<std::array<std::string, kWeekdayCount>> parseDateRow(
  const Row& row, const std::regex& datePattern, size_t minCells) {
  std::array<std::string, kWeekdayCount> dates;
  size_t found = 0;
  for (size_t i = 0; i < kWeekdayCount; ++i) {
    std::smatch m;
    if (!std::regex_search(row.cells[i], m, datePattern)) continue;
    std::string date = m[1].str();
    std::replace(date.begin(), date.end(), '-', '.');
    dates[i] = std::move(date);
    found++;
  }
  if (found < minCells) return std::nullopt;
  return dates;
}

std::optional<DayRanges> parseShiftTimeRow(
  const Row& row, const std::regex& timeRangePattern, size_t minCells) {
  DayRanges ranges;
  size_t found = 0;
  for (size_t i = 0; i < kWeekdayCount; ++i) {
    std::smatch m;
    if (!std::regex_search(row.cells[i], m, timeRangePattern)) continue;
    ranges[i] = TimeRange{m[1].str(), m[2].str()};
    found++;
  }
  if (found < minCells) return std::nullopt;
  return ranges;
}

std::vector<ClassifiedRow> classifyRows(const std::vector<Row>& rows,
                                        const RowPatterns& patterns,
                                        const ExtractionOptions& options) {
  std::vector<ClassifiedRow> out;
  out.reserve(rows.size());
  for (const auto& row : rows) {
    ClassifiedRow c;
    c.row = &row;
    if (auto ranges = parseShiftTimeRow(row, patterns.timeRange, options.minTimeCells)) {
      c.kind = RowKind::ShiftTime;
      c.ranges = *ranges;
    } else if (auto dates = parseDateRow(row, patterns.date, options.minDateCells)) {
      c.kind = RowKind::DateHeader;
      c.dates = *dates;
    }
    out.push_back(std::move(c));
  }
  return out;
}

std::array<std::string, kWeekdayCount> headerDates(const std::vector<ClassifiedRow>& rows) {
  for (const auto& r : rows) {
    if (r.kind == RowKind::DateHeader) return r.dates;
  }
  return {};
}
