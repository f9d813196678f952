#include "pdf_source.hpp"

#include "text_util.hpp"

#include <cstdio>
#include <cstdlib>
#include <regex>
#include <stdexcept>
#include <string>

namespace {

std::string decodeEntities(const std::string& in) {
  std::string out;
  out.reserve(in.size());
  for (size_t i = 0; i < in.size(); ++i) {
    if (in[i] == '&') {
      size_t j = in.find(';', i + 1);
      if (j != std::string::npos) {
        std::string ent = in.substr(i + 1, j - (i + 1));
        std::string rep;
        if (ent == "amp") rep = "&";
        else if (ent == "lt") rep = "<";
        else if (ent == "gt") rep = ">";
        else if (ent == "quot") rep = "\"";
        else if (ent == "apos") rep = "'";
        else if (ent.size() > 1 && ent[0] == '#') {
          bool hex = ent[1] == 'x' || ent[1] == 'X';
          std::string digits = ent.substr(hex ? 2 : 1);
          if (!digits.empty() && digits.size() <= 6 &&
              digits.find_first_not_of(hex ? "0123456789abcdefABCDEF" : "0123456789") == std::string::npos) {
            unsigned long code = std::stoul(digits, nullptr, hex ? 16 : 10);
            if (code <= 0x7F) rep.push_back(static_cast<char>(code));
          }
        }
        if (!rep.empty()) {
          out += rep; i = j; continue;
        }
      }
    }
    out.push_back(in[i]);
  }
  return out;
}

bool commandExists(const std::string& command) {
  std::string test = "command -v " + command + " >/dev/null 2>&1";
  return std::system(test.c_str()) == 0;
}

} // namespace

std::string runPdftotextBboxLayout(const std::string& pdfPath, int firstPage, int lastPage) {
  if (!commandExists("pdftotext")) {
    throw std::runtime_error("pdftotext not found; install poppler-utils");
  }
  std::string cmd = "pdftotext -bbox-layout";
  if (firstPage > 0) {
    cmd += " -f " + std::to_string(firstPage);
  }
  if (lastPage > 0 && lastPage >= firstPage) {
    cmd += " -l " + std::to_string(lastPage);
  }
  cmd += " -q \"" + pdfPath + "\" -";

  FILE* pipe = popen(cmd.c_str(), "r");
  if (!pipe) throw std::runtime_error("Failed to run pdftotext -bbox-layout");
  std::string out;
  char buf[8192];
  while (true) {
    size_t n = std::fread(buf, 1, sizeof(buf), pipe);
    if (n > 0) out.append(buf, n);
    if (n < sizeof(buf)) break;
  }
  int rc = pclose(pipe);
  if (rc != 0) throw std::runtime_error("pdftotext -bbox-layout returned error");
  return out;
}

std::vector<PageContent> parseBboxLayout(const std::string& xhtml) {
  std::vector<PageContent> pages;
  std::regex element(
    "(<page[\\s>])|(</line>)|"
    "<word[^>]*?xMin=\"(-?[0-9.]+)\"[^>]*?yMin=\"(-?[0-9.]+)\"[^>]*?xMax=\"(-?[0-9.]+)\"[^>]*?yMax=\"(-?[0-9.]+)\"[^>]*>([^<]*)</word>");

  std::string line;
  auto flushLine = [&]() {
    if (pages.empty() || line.empty()) return;
    if (!pages.back().text.empty()) pages.back().text += '\n';
    pages.back().text += line;
    line.clear();
  };

  for (std::sregex_iterator it(xhtml.begin(), xhtml.end(), element), end; it != end; ++it) {
    const std::smatch& m = *it;
    if (m[1].matched) {
      flushLine();
      pages.emplace_back();
      continue;
    }
    if (m[2].matched) {
      flushLine();
      continue;
    }
    if (pages.empty()) continue; // word outside any page

    PositionedToken t;
    t.x0 = std::stod(m[3].str());
    t.top = std::stod(m[4].str());
    t.x1 = std::stod(m[5].str());
    t.bottom = std::stod(m[6].str());
    t.text = decodeEntities(trim(m[7].str()));
    if (t.text.empty()) continue;
    appendWord(line, t.text);
    pages.back().tokens.push_back(std::move(t));
  }
  flushLine();
  return pages;
}

std::vector<PageContent> readPdfPages(const std::string& pdfPath, int firstPage, int lastPage) {
  return parseBboxLayout(runPdftotextBboxLayout(pdfPath, firstPage, lastPage));
}
