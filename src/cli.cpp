#include "cli.hpp"

#include "week_output.hpp"

#include <sstream>
#include <stdexcept>

namespace {

bool splitWeekdays(const std::string& list, std::array<std::string, kWeekdayCount>& out) {
  std::array<std::string, kWeekdayCount> names;
  std::stringstream ss(list);
  std::string item;
  size_t n = 0;
  while (std::getline(ss, item, ',')) {
    if (n == kWeekdayCount || item.empty()) return false;
    names[n++] = item;
  }
  if (n != kWeekdayCount) return false;
  out = names;
  return true;
}

void printStats(std::ostream& err, const ExtractionStats& stats, const std::array<std::string, kWeekdayCount>& weekdays) {
  err << "boundaries:";
  for (double b : stats.layout.bounds) err << ' ' << b;
  err << "\nrows: " << stats.rows << "\nshift-time rows: " << stats.shiftTimeRows << "\ncaptures:";
  for (size_t i = 0; i < kWeekdayCount; ++i) err << ' ' << weekdays[i] << '=' << stats.captures[i];
  err << "\n";
}

} // namespace

bool parseCliArgs(const std::vector<std::string>& args, CliOptions& options, std::string& error) {
  for (const std::string& arg : args) {
    if (arg == "--verbose") {
      options.verbose = true;
    } else if (arg.rfind("--name=", 0) == 0) {
      options.extraction.targetName = arg.substr(std::string("--name=").size());
    } else if (arg.rfind("--marker=", 0) == 0) {
      options.extraction.flagMarker = arg.substr(std::string("--marker=").size());
    } else if (arg.rfind("--weekdays=", 0) == 0) {
      if (!splitWeekdays(arg.substr(std::string("--weekdays=").size()), options.extraction.weekdays)) {
        error = "--weekdays needs exactly five comma-separated names";
        return false;
      }
    } else if (arg.rfind("--grid-out=", 0) == 0) {
      options.gridOut = arg.substr(std::string("--grid-out=").size());
    } else if (arg.rfind("--", 0) == 0) {
      error = "unknown option " + arg;
      return false;
    } else if (options.pdfPath.empty()) {
      options.pdfPath = arg;
    }
  }
  if (options.pdfPath.empty()) {
    error = "no PDF given";
    return false;
  }
  return true;
}

int runExtraction(const CliOptions& options, const PageReader& readPages,
                  std::ostream& out, std::ostream& err) {
  const std::string failure = "Could not parse timesheet or " + options.extraction.targetName + " not found";
  try {
    std::vector<PageContent> pages = readPages(options.pdfPath);
    if (options.verbose) {
      err << "pages read: " << pages.size()
          << ", tokens on first page: " << (pages.empty() ? 0 : pages.front().tokens.size()) << "\n";
    }

    if (!options.gridOut.empty() && !pages.empty()) {
      auto rows = reconstructGrid(pages.front(), options.extraction);
      writeGridAsCsv(rows, options.extraction.weekdays, options.gridOut);
      err << "Wrote " << rows.size() << " grid row(s) to '" << options.gridOut << "'\n";
    }

    ExtractionStats stats;
    WeekRecord week = extractWeek(pages, options.extraction, &stats);
    if (options.verbose) printStats(err, stats, options.extraction.weekdays);
    out << weekRecordToJson(week);
    return kExitOk;
  } catch (const std::exception& ex) {
    err << "Error parsing PDF: " << ex.what() << "\n";
    out << failureToJson(failure);
    return kExitFailed;
  }
}
