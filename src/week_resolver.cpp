#include "week_resolver.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

int timeToMinutes(const std::string& hhmm) {
  size_t colon = hhmm.find(':');
  if (colon == std::string::npos || colon == 0 || colon + 1 >= hhmm.size()) {
    throw std::invalid_argument("not a H:MM time: '" + hhmm + "'");
  }
  for (size_t i = 0; i < hhmm.size(); ++i) {
    if (i != colon && !std::isdigit(static_cast<unsigned char>(hhmm[i]))) {
      throw std::invalid_argument("not a H:MM time: '" + hhmm + "'");
    }
  }
  return std::stoi(hhmm.substr(0, colon)) * 60 + std::stoi(hhmm.substr(colon + 1));
}

const Capture* pickLatestStart(const std::vector<Capture>& candidates) {
  const Capture* best = nullptr;
  int bestMinutes = 0;
  for (const auto& c : candidates) {
    int minutes = timeToMinutes(c.range.start);
    if (!best || minutes > bestMinutes) {
      best = &c;
      bestMinutes = minutes;
    }
  }
  return best;
}

std::optional<std::string> joinFlags(const std::vector<std::string>& flags) {
  std::vector<std::string> unique(flags);
  std::sort(unique.begin(), unique.end());
  unique.erase(std::unique(unique.begin(), unique.end()), unique.end());
  if (unique.empty()) return std::nullopt;

  std::string out;
  for (size_t i = 0; i < unique.size(); ++i) {
    if (i) out += ", ";
    out += unique[i];
  }
  return out;
}

std::optional<std::string> findWeekEnding(const std::string& pageText, const std::regex& pattern) {
  std::smatch m;
  if (!std::regex_search(pageText, m, pattern)) return std::nullopt;
  return m[1].str();
}

WeekRecord resolveWeek(const ScheduleCaptures& captures,
                       const std::array<std::string, kWeekdayCount>& dates,
                       const std::array<std::string, kWeekdayCount>& weekdays,
                       std::optional<std::string> weekEnding) {
  WeekRecord record;
  record.weekEnding = std::move(weekEnding);
  record.dates = dates;
  record.days.reserve(kWeekdayCount);

  for (size_t i = 0; i < kWeekdayCount; ++i) {
    DayInfo day;
    day.weekday = weekdays[i];
    day.date = dates[i];
    if (const Capture* chosen = pickLatestStart(captures.captures[i])) {
      day.start = chosen->range.start;
      day.end = chosen->range.end;
      if (!chosen->area.empty()) day.area = chosen->area;
    }
    day.note = joinFlags(captures.flags[i]);
    record.days.push_back(std::move(day));
  }
  return record;
}
