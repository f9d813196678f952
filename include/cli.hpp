#pragma once

#include "rota.hpp"

#include <functional>
#include <ostream>
#include <string>
#include <vector>

struct CliOptions {
  std::string pdfPath;
  std::string gridOut;
  bool verbose = false;
  ExtractionOptions extraction;
};

constexpr int kExitOk = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;

// Reads --name=, --weekdays=, --marker=, --grid-out=, --verbose and the PDF
// path into options. Returns false with a message in error on bad usage.
bool parseCliArgs(const std::vector<std::string>& args, CliOptions& options, std::string& error);

using PageReader = std::function<std::vector<PageContent>(const std::string& pdfPath)>;

// Reads the pages, optionally dumps the grid, extracts the week and prints
// either the week JSON or the failure JSON to out. Diagnostics go to err.
int runExtraction(const CliOptions& options, const PageReader& readPages,
                  std::ostream& out, std::ostream& err);
