#pragma once

#include "week_record.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

struct ExtractionOptions {
  std::string targetName = "Rohan";
  std::array<std::string, kWeekdayCount> weekdays{
    "Monday", "Tuesday", "Wednesday", "Thursday", "Friday"};
  std::string datePattern = "(\\d{2}[./-]\\d{2}[./-]\\d{4})";
  std::string timeRangePattern = "(\\d{1,2}:\\d{2})\\s*-\\s*(\\d{1,2}:\\d{2})";
  std::string weekEndingPattern = "Week ending\\s+(\\d{2}[./-]\\d{2}[./-]\\d{4})";
  std::string flagMarker = "ATM";
  size_t minDateCells = 4;
  size_t minTimeCells = 3;
};

class ExtractionError : public std::runtime_error {
public:
  enum class Kind {
    NoPages,
    TargetNotPresent,
    LayoutNotDetected,
    MalformedInput,
  };

  ExtractionError(Kind kind, const std::string& what)
    : std::runtime_error(what), kind_(kind) {}

  Kind kind() const { return kind_; }

private:
  Kind kind_;
};

const char* toString(ExtractionError::Kind kind);

// What each stage produced, filled in as the stages run.
struct ExtractionStats {
  ColumnBoundaries layout;
  size_t rows = 0;
  size_t shiftTimeRows = 0;
  std::array<size_t, kWeekdayCount> captures{};
};

// Reconstructs the target's week from the first page.
// Throws ExtractionError on structural failures.
WeekRecord extractWeek(const std::vector<PageContent>& pages, const ExtractionOptions& options,
                       ExtractionStats* stats = nullptr);
WeekRecord extractWeek(const PageContent& page, const ExtractionOptions& options,
                       ExtractionStats* stats = nullptr);

// Same as extractWeek but never throws; on failure returns std::nullopt and
// stores the reason in *error when given.
std::optional<WeekRecord> tryExtractWeek(const std::vector<PageContent>& pages,
                                         const ExtractionOptions& options,
                                         std::string* error = nullptr,
                                         ExtractionStats* stats = nullptr);

// Column detection and row grouping only, for inspecting a document's grid.
// Throws ExtractionError(LayoutNotDetected) when the headers are missing.
std::vector<Row> reconstructGrid(const PageContent& page,
                                 const ExtractionOptions& options,
                                 ColumnBoundaries* layout = nullptr);
