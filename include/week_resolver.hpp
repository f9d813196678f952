#pragma once

#include "schedule_extractor.hpp"
#include "week_record.hpp"

#include <array>
#include <optional>
#include <regex>
#include <string>
#include <vector>

// "H:MM" to minutes since midnight. Throws std::invalid_argument otherwise.
int timeToMinutes(const std::string& hhmm);

// Latest-starting capture, first one wins among equal starts.
// Returns nullptr for an empty list.
const Capture* pickLatestStart(const std::vector<Capture>& candidates);

// Sorted distinct flags joined with ", ", std::nullopt when there are none.
std::optional<std::string> joinFlags(const std::vector<std::string>& flags);

std::optional<std::string> findWeekEnding(const std::string& pageText, const std::regex& pattern);

WeekRecord resolveWeek(const ScheduleCaptures& captures,
                       const std::array<std::string, kWeekdayCount>& dates,
                       const std::array<std::string, kWeekdayCount>& weekdays,
                       std::optional<std::string> weekEnding);
