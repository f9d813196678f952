#pragma once

#include "week_record.hpp"

#include <array>
#include <string>
#include <vector>

long rowKey(double top);

// Buckets tokens by rounded top and fills each row's cells and area gutter.
// Weekday header tokens are skipped. Rows come back top to bottom.
// Throws ExtractionError(MalformedInput) for tokens with non-finite coordinates.
std::vector<Row> groupRows(const std::vector<PositionedToken>& tokens,
                           const ColumnBoundaries& layout,
                           const std::array<std::string, kWeekdayCount>& weekdays);
