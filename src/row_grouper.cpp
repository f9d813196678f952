#include "row_grouper.hpp"

#include "column_layout.hpp"
#include "rota.hpp"
#include "text_util.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>

long rowKey(double top) {
  // nearbyint honours the default round-half-to-even mode
  return static_cast<long>(std::nearbyint(top));
}

std::vector<Row> groupRows(const std::vector<PositionedToken>& tokens,
                           const ColumnBoundaries& layout,
                           const std::array<std::string, kWeekdayCount>& weekdays) {
  std::map<long, std::vector<const PositionedToken*>> buckets;
  for (const auto& t : tokens) {
    if (std::find(weekdays.begin(), weekdays.end(), t.text) != weekdays.end()) continue;
    if (!std::isfinite(t.top) || !std::isfinite(t.x0) || !std::isfinite(t.x1)) {
      throw ExtractionError(ExtractionError::Kind::MalformedInput,
                            "token '" + t.text + "' has non-finite coordinates");
    }
    // long max may round up when converted to double, hence >=
    if (t.top < static_cast<double>(std::numeric_limits<long>::min()) ||
        t.top >= static_cast<double>(std::numeric_limits<long>::max())) {
      throw ExtractionError(ExtractionError::Kind::MalformedInput,
                            "token '" + t.text + "' lies outside the page coordinate range");
    }
    buckets[rowKey(t.top)].push_back(&t);
  }

  std::vector<Row> rows;
  rows.reserve(buckets.size());
  for (auto& kv : buckets) {
    auto& words = kv.second;
    std::stable_sort(words.begin(), words.end(), [](const PositionedToken* a, const PositionedToken* b) {
      return a->x0 < b->x0;
    });

    Row row;
    row.key = kv.first;
    for (const auto* w : words) {
      int col = columnIndex(layout, (w->x0 + w->x1) * 0.5);
      if (col == kAreaGutter) {
        appendWord(row.areaText, w->text);
      } else if (col != kOutsideGrid) {
        appendWord(row.cells[static_cast<size_t>(col)], w->text);
      }
    }
    rows.push_back(std::move(row));
  }
  return rows;
}
