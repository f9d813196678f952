#pragma once

#include "week_record.hpp"

#include <string>
#include <vector>

inline PositionedToken word(const std::string& text, double xCenter, double top, double width = 20.0) {
  return PositionedToken{text, xCenter - width / 2, xCenter + width / 2, top, top + 10.0};
}

inline std::vector<PositionedToken> weekdayHeaders(double top = 50.0) {
  return {
    word("Monday", 100, top, 40),
    word("Tuesday", 200, top, 44),
    word("Wednesday", 300, top, 60),
    word("Thursday", 400, top, 50),
    word("Friday", 500, top, 36),
  };
}

inline std::string pageTextOf(const std::vector<PositionedToken>& tokens) {
  std::string text;
  for (const auto& t : tokens) {
    if (!text.empty()) text += ' ';
    text += t.text;
  }
  return text;
}

// Headers centered at 100..500, so the columns are [50,150) .. [450,550) and
// anything left of 50 is area gutter.
//
//   area   | Monday     | Tuesday | Wednesday       | Thursday    | Friday
//          | 01.03.2024 | ...                                      | 05-03-2024
//   Front  | 9:00-17:00 |         | 9:30-18:00      | 9:00-17:00  | off
//          | Alice      | Rohan   | Jane Rohan ATM  | Rohan atm   |
//   Back   | 13:00-21:00 in every column
//          |            |         |                 | Rohan       | Bob
inline PageContent sampleRotaPage() {
  std::vector<PositionedToken> tokens = {
    word("Week", 280, 10), word("ending", 300, 10), word("08/03/2024", 330, 10),
  };
  for (const auto& h : weekdayHeaders()) tokens.push_back(h);

  tokens.push_back(word("01.03.2024", 100, 70, 50));
  tokens.push_back(word("02.03.2024", 200, 70.4, 50));
  tokens.push_back(word("03.03.2024", 300, 69.6, 50));
  tokens.push_back(word("04.03.2024", 400, 70, 50));
  tokens.push_back(word("05-03-2024", 500, 70, 50));

  tokens.push_back(word("Front", 20, 90, 30));
  tokens.push_back(word("9:00-17:00", 100, 90, 50));
  tokens.push_back(word("9:30-18:00", 300, 90, 50));
  tokens.push_back(word("9:00-17:00", 400, 90, 50));
  tokens.push_back(word("off", 500, 90));

  tokens.push_back(word("Alice", 100, 110));
  tokens.push_back(word("Rohan", 200, 110));
  tokens.push_back(word("ATM", 325, 110.2));
  tokens.push_back(word("Jane", 275, 109.7));
  tokens.push_back(word("Rohan", 300, 110));
  tokens.push_back(word("Rohan", 390, 110));
  tokens.push_back(word("atm", 420, 110));

  tokens.push_back(word("Back", 20, 130, 30));
  for (double xc : {100.0, 200.0, 300.0, 400.0, 500.0}) {
    tokens.push_back(word("13:00-21:00", xc, 130, 50));
  }

  tokens.push_back(word("Rohan", 400, 150));
  tokens.push_back(word("Bob", 500, 150));

  PageContent page;
  page.tokens = tokens;
  page.text = pageTextOf(tokens);
  return page;
}
