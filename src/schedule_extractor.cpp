#include "schedule_extractor.hpp"

#include "text_util.hpp"

#include <utility>

ScheduleExtractor::ScheduleExtractor(std::string targetName, std::string flagMarker)
  : targetName_(std::move(targetName)), flagMarker_(std::move(flagMarker)) {}

void ScheduleExtractor::feed(const ClassifiedRow& row) {
  if (!row.row) return;
  if (!row.row->areaText.empty()) currentArea_ = row.row->areaText;

  switch (row.kind) {
    case RowKind::ShiftTime:
      lastTimeRanges_ = row.ranges;
      break;
    case RowKind::DateHeader:
    case RowKind::Content:
      if (lastTimeRanges_) scanContentRow(*row.row);
      break;
  }
}

void ScheduleExtractor::scanContentRow(const Row& row) {
  for (size_t col = 0; col < kWeekdayCount; ++col) {
    std::string cell = trim(row.cells[col]);
    if (cell.empty() || !containsIgnoreCase(cell, targetName_)) continue;

    bool flagged = !flagMarker_.empty() && containsIgnoreCase(cell, flagMarker_);
    if (flagged) result_.flags[col].push_back(flagMarker_);

    const auto& range = (*lastTimeRanges_)[col];
    if (range) {
      result_.captures[col].push_back(Capture{col, *range, currentArea_, flagged});
    }
  }
}

ScheduleCaptures extractSchedule(const std::vector<ClassifiedRow>& rows,
                                 const ExtractionOptions& options) {
  ScheduleExtractor extractor(options.targetName, options.flagMarker);
  for (const auto& row : rows) extractor.feed(row);
  return extractor.result();
}
