#pragma once

#include "week_record.hpp"

#include <string>
#include <vector>

// Runs `pdftotext -bbox-layout` (poppler-utils) over the page range and
// returns its XHTML output. Throws std::runtime_error on failure.
// If lastPage < firstPage or lastPage == -1, processes until end.
std::string runPdftotextBboxLayout(const std::string& pdfPath, int firstPage = 1, int lastPage = -1);

// One PageContent per <page> element, in document order. Each <word> becomes
// a token; page text is the words joined by spaces, one line per <line>.
std::vector<PageContent> parseBboxLayout(const std::string& xhtml);

// Pages firstPage..lastPage of the PDF as positioned tokens.
std::vector<PageContent> readPdfPages(const std::string& pdfPath, int firstPage = 1, int lastPage = 1);
