#pragma once

#include "rota.hpp"
#include "week_record.hpp"

#include <array>
#include <optional>
#include <regex>
#include <vector>

enum class RowKind {
  Content,
  DateHeader,
  ShiftTime,
};

using DayRanges = std::array<std::optional<TimeRange>, kWeekdayCount>;

struct RowPatterns {
  std::regex date;
  std::regex timeRange;
  std::regex weekEnding;
};

// Throws ExtractionError(MalformedInput) if a pattern does not compile.
RowPatterns compilePatterns(const ExtractionOptions& options);

// Date of each cell with '-' turned into '.', or std::nullopt when fewer than
// minCells cells hold a date.
std::optional<std::array<std::string, kWeekdayCount>> parseDateRow(
  const Row& row, const std::regex& datePattern, size_t minCells);

std::optional<DayRanges> parseShiftTimeRow(
  const Row& row, const std::regex& timeRangePattern, size_t minCells);

struct ClassifiedRow {
  const Row* row = nullptr;
  RowKind kind = RowKind::Content;
  DayRanges ranges;                               // ShiftTime only
  std::array<std::string, kWeekdayCount> dates;   // DateHeader only
};

// A shift-time row takes precedence, so a row is never both kinds.
std::vector<ClassifiedRow> classifyRows(const std::vector<Row>& rows,
                                        const RowPatterns& patterns,
                                        const ExtractionOptions& options);

// Dates of the first date-header row, five empty strings if there is none.
std::array<std::string, kWeekdayCount> headerDates(const std::vector<ClassifiedRow>& rows);
