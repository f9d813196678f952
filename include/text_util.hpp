#pragma once

#include <string>

std::string trim(const std::string& s);
std::string toLower(std::string s);

// Case-insensitive (ASCII) substring test.
bool containsIgnoreCase(const std::string& haystack, const std::string& needle);

// Appends word to text with a single separating space.
void appendWord(std::string& text, const std::string& word);
