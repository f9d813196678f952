#include "column_layout.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_map>

std::optional<ColumnBoundaries> boundariesFromCenters(std::array<double, kWeekdayCount> centers) {
  std::sort(centers.begin(), centers.end());
  for (size_t i = 1; i < centers.size(); ++i) {
    if (!(centers[i] > centers[i-1])) return std::nullopt;
  }

  ColumnBoundaries layout;
  for (size_t i = 0; i + 1 < centers.size(); ++i) {
    layout.bounds[i + 1] = (centers[i] + centers[i+1]) / 2.0;
  }
  layout.bounds.front() = centers.front() - (layout.bounds[1] - centers.front());
  layout.bounds.back() = centers.back() + (centers.back() - layout.bounds[kWeekdayCount - 1]);
  return layout;
}

std::optional<ColumnBoundaries> detectColumnLayout(
  const std::vector<PositionedToken>& tokens,
  const std::array<std::string, kWeekdayCount>& weekdays) {
  std::unordered_map<std::string, double> headerCenters;
  for (const auto& t : tokens) {
    if (std::find(weekdays.begin(), weekdays.end(), t.text) == weekdays.end()) continue;
    if (headerCenters.count(t.text)) continue;
    double xc = (t.x0 + t.x1) * 0.5;
    if (!std::isfinite(xc)) continue;
    headerCenters.emplace(t.text, xc);
  }
  if (headerCenters.size() < kWeekdayCount) return std::nullopt;

  std::array<double, kWeekdayCount> centers{};
  size_t i = 0;
  for (const auto& kv : headerCenters) centers[i++] = kv.second;
  return boundariesFromCenters(centers);
}

int columnIndex(const ColumnBoundaries& layout, double xCenter) {
  if (xCenter < layout.bounds.front()) return kAreaGutter;
  for (size_t i = 0; i < kWeekdayCount; ++i) {
    if (layout.bounds[i] <= xCenter && xCenter < layout.bounds[i+1]) return static_cast<int>(i);
  }
  return kOutsideGrid;
}
