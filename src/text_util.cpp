#include "text_util.hpp"

#include <cctype>
#include <string>

std::string trim(const std::string& s) {
  size_t a = 0, b = s.size();
  while (a < b && std::isspace(static_cast<unsigned char>(s[a]))) a++;
  while (b > a && std::isspace(static_cast<unsigned char>(s[b-1]))) b--;
  return s.substr(a, b - a);
}

// Folds ASCII plus the two-byte UTF-8 capitals of Latin-1 (U+00C0..U+00DE
// except U+00D7) and basic Cyrillic (U+0400..U+042F). Other bytes pass through.
std::string toLower(std::string s) {
  for (size_t i = 0; i < s.size(); ++i) {
    unsigned char c = static_cast<unsigned char>(s[i]);
    if (c < 0x80) {
      s[i] = static_cast<char>(std::tolower(c));
      continue;
    }
    if (i + 1 >= s.size()) break;
    unsigned char next = static_cast<unsigned char>(s[i+1]);
    if (c == 0xC3 && next >= 0x80 && next <= 0x9E && next != 0x97) {
      s[i+1] = static_cast<char>(next + 0x20);
    } else if (c == 0xD0 && next >= 0x90 && next <= 0x9F) {
      s[i+1] = static_cast<char>(next + 0x20);              // А..П -> а..п
    } else if (c == 0xD0 && next >= 0xA0 && next <= 0xAF) {
      s[i] = static_cast<char>(0xD1);                       // Р..Я -> р..я
      s[i+1] = static_cast<char>(next - 0x20);
    } else if (c == 0xD0 && next >= 0x80 && next <= 0x8F) {
      s[i] = static_cast<char>(0xD1);                       // Ѐ..Џ -> ѐ..џ
      s[i+1] = static_cast<char>(next + 0x10);
    }
    if (c >= 0xC0) ++i;
  }
  return s;
}

bool containsIgnoreCase(const std::string& haystack, const std::string& needle) {
  return toLower(haystack).find(toLower(needle)) != std::string::npos;
}

void appendWord(std::string& text, const std::string& word) {
  std::string w = trim(word);
  if (w.empty()) return;
  if (!text.empty()) text += ' ';
  text += w;
}
