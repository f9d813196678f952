#pragma once

#include "week_record.hpp"

#include <string>
#include <vector>

// {"week_ending", "dates", "days": {weekday: {...}}, "success": true}
std::string weekRecordToJson(const WeekRecord& record);

// {"error": message, "success": false}
std::string failureToJson(const std::string& message);

// Write the reconstructed grid as CSV: area column, then one column per weekday.
void writeGridAsCsv(const std::vector<Row>& rows,
                    const std::array<std::string, kWeekdayCount>& weekdays,
                    const std::string& path);
