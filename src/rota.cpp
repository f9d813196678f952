#include "rota.hpp"

#include "column_layout.hpp"
#include "row_classifier.hpp"
#include "row_grouper.hpp"
#include "schedule_extractor.hpp"
#include "text_util.hpp"
#include "week_resolver.hpp"

#include <algorithm>

namespace {

void validateOptions(const ExtractionOptions& options) {
  if (trim(options.targetName).empty()) {
    throw ExtractionError(ExtractionError::Kind::MalformedInput, "target name is empty");
  }
  for (size_t i = 0; i < kWeekdayCount; ++i) {
    if (options.weekdays[i].empty()) {
      throw ExtractionError(ExtractionError::Kind::MalformedInput, "weekday name is empty");
    }
    for (size_t j = 0; j < i; ++j) {
      if (options.weekdays[i] == options.weekdays[j]) {
        throw ExtractionError(ExtractionError::Kind::MalformedInput,
                              "weekday '" + options.weekdays[i] + "' given twice");
      }
    }
  }
}

ColumnBoundaries requireLayout(const PageContent& page, const ExtractionOptions& options) {
  auto layout = detectColumnLayout(page.tokens, options.weekdays);
  if (!layout) {
    throw ExtractionError(ExtractionError::Kind::LayoutNotDetected,
                          "could not find all five weekday column headers");
  }
  return *layout;
}

} // namespace

const DayInfo* WeekRecord::day(const std::string& weekday) const {
  auto it = std::find_if(days.begin(), days.end(), [&](const DayInfo& d) { return d.weekday == weekday; });
  return it == days.end() ? nullptr : &*it;
}

const char* toString(ExtractionError::Kind kind) {
  switch (kind) {
    case ExtractionError::Kind::NoPages: return "NoPages";
    case ExtractionError::Kind::TargetNotPresent: return "TargetNotPresent";
    case ExtractionError::Kind::LayoutNotDetected: return "LayoutNotDetected";
    case ExtractionError::Kind::MalformedInput: return "MalformedInput";
  }
  return "Unknown";
}

std::vector<Row> reconstructGrid(const PageContent& page,
                                 const ExtractionOptions& options,
                                 ColumnBoundaries* layout) {
  validateOptions(options);
  ColumnBoundaries bounds = requireLayout(page, options);
  if (layout) *layout = bounds;
  return groupRows(page.tokens, bounds, options.weekdays);
}

WeekRecord extractWeek(const PageContent& page, const ExtractionOptions& options,
                       ExtractionStats* stats) {
  validateOptions(options);
  RowPatterns patterns = compilePatterns(options);

  if (!containsIgnoreCase(page.text, options.targetName)) {
    throw ExtractionError(ExtractionError::Kind::TargetNotPresent,
                          "'" + options.targetName + "' does not appear on the page");
  }
  auto weekEnding = findWeekEnding(page.text, patterns.weekEnding);

  ColumnBoundaries layout = requireLayout(page, options);
  std::vector<Row> rows = groupRows(page.tokens, layout, options.weekdays);
  std::vector<ClassifiedRow> classified = classifyRows(rows, patterns, options);

  ScheduleCaptures captures = extractSchedule(classified, options);
  if (stats) {
    stats->layout = layout;
    stats->rows = rows.size();
    stats->shiftTimeRows = static_cast<size_t>(std::count_if(
      classified.begin(), classified.end(), [](const ClassifiedRow& r) { return r.kind == RowKind::ShiftTime; }));
    for (size_t i = 0; i < kWeekdayCount; ++i) stats->captures[i] = captures.captures[i].size();
  }
  return resolveWeek(captures, headerDates(classified), options.weekdays, std::move(weekEnding));
}

WeekRecord extractWeek(const std::vector<PageContent>& pages, const ExtractionOptions& options,
                       ExtractionStats* stats) {
  if (pages.empty()) {
    throw ExtractionError(ExtractionError::Kind::NoPages, "document has no pages");
  }
  return extractWeek(pages.front(), options, stats);
}

std::optional<WeekRecord> tryExtractWeek(const std::vector<PageContent>& pages,
                                         const ExtractionOptions& options,
                                         std::string* error,
                                         ExtractionStats* stats) {
  try {
    return extractWeek(pages, options, stats);
  } catch (const std::exception& ex) {
    if (error) *error = ex.what();
    return std::nullopt;
  }
}
