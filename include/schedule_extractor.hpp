#pragma once

#include "row_classifier.hpp"
#include "week_record.hpp"

#include <array>
#include <optional>
#include <string>
#include <vector>

struct ScheduleCaptures {
  std::array<std::vector<Capture>, kWeekdayCount> captures;
  std::array<std::vector<std::string>, kWeekdayCount> flags;
};

// Single top-to-bottom pass. Content rows are only scanned once a shift-time
// row has been seen; the area label sticks until a row carries a new one.
class ScheduleExtractor {
public:
  ScheduleExtractor(std::string targetName, std::string flagMarker);

  void feed(const ClassifiedRow& row);

  bool hasActiveShift() const { return lastTimeRanges_.has_value(); }
  const std::optional<DayRanges>& lastTimeRanges() const { return lastTimeRanges_; }
  const std::string& currentArea() const { return currentArea_; }
  const ScheduleCaptures& result() const { return result_; }

private:
  void scanContentRow(const Row& row);

  std::string targetName_;
  std::string flagMarker_;
  std::optional<DayRanges> lastTimeRanges_;
  std::string currentArea_;
  ScheduleCaptures result_;
};

ScheduleCaptures extractSchedule(const std::vector<ClassifiedRow>& rows,
                                 const ExtractionOptions& options);
