#include "cli.hpp"
#include "pdf_source.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>
#include <vector>

int main(int argc, char** argv)
{
  CliOptions options;
  if (const char* envName = std::getenv("ROTAEXTRACT_NAME")) {
    if (*envName) options.extraction.targetName = envName;
  }

  std::string error;
  std::error_code ec;
  std::vector<std::string> args(argv + 1, argv + argc);
  if (!parseCliArgs(args, options, error) || !std::filesystem::exists(options.pdfPath, ec)) {
    if (!error.empty()) std::cerr << error << "\n";
    else std::cerr << "PDF not found: " << options.pdfPath << "\n";
    std::cerr << "Usage: " << argv[0]
              << " [--name=NAME] [--weekdays=A,B,C,D,E] [--marker=ATM] [--grid-out=file.csv] [--verbose] <pdf_path>\n";
    return kExitUsage;
  }

  return runExtraction(options, [](const std::string& path) { return readPdfPages(path, 1, 1); },
                       std::cout, std::cerr);
}
