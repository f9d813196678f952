#pragma once

#include "week_record.hpp"

#include <array>
#include <optional>
#include <string>
#include <vector>

constexpr int kAreaGutter = -1;
constexpr int kOutsideGrid = -2;

// Locates the first occurrence of each weekday header and derives the column
// boundaries from their centers. Returns std::nullopt when fewer than five
// distinct headers are present or their centers coincide.
std::optional<ColumnBoundaries> detectColumnLayout(
  const std::vector<PositionedToken>& tokens,
  const std::array<std::string, kWeekdayCount>& weekdays);

// Midpoints between neighbouring centers, outer bounds reflected around the
// outermost centers. Centers are sorted first.
std::optional<ColumnBoundaries> boundariesFromCenters(std::array<double, kWeekdayCount> centers);

// Column index 0..4, kAreaGutter left of the first bound, kOutsideGrid otherwise.
int columnIndex(const ColumnBoundaries& layout, double xCenter);
