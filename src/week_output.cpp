#include "week_output.hpp"

#include <cstdio>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>

namespace {

std::string jsonString(const std::string& s) {
  std::string out = "\"";
  for (char ch : s) {
    switch (ch) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (static_cast<unsigned char>(ch) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(ch)));
          out += buf;
        } else {
          out += ch;
        }
    }
  }
  out += '"';
  return out;
}

std::string jsonNullable(const std::optional<std::string>& s) {
  return s ? jsonString(*s) : "null";
}

std::string csvCell(const std::string& cell) {
  bool needQuotes = cell.find(',') != std::string::npos || cell.find('"') != std::string::npos || cell.find('\n') != std::string::npos;
  if (!needQuotes) return cell;
  std::string escaped;
  for (char ch : cell) {
    if (ch == '"') escaped += '"';
    escaped += ch;
  }
  return '"' + escaped + '"';
}

} // namespace

std::string weekRecordToJson(const WeekRecord& record) {
  std::ostringstream os;
  os << "{\n";
  os << "  \"week_ending\": " << jsonNullable(record.weekEnding) << ",\n";

  os << "  \"dates\": [";
  for (size_t i = 0; i < record.dates.size(); ++i) {
    os << jsonString(record.dates[i]) << (i + 1 == record.dates.size() ? "" : ", ");
  }
  os << "],\n";

  os << "  \"days\": {\n";
  for (size_t i = 0; i < record.days.size(); ++i) {
    const DayInfo& d = record.days[i];
    os << "    " << jsonString(d.weekday) << ": {"
       << "\"start\": " << jsonNullable(d.start) << ", "
       << "\"end\": " << jsonNullable(d.end) << ", "
       << "\"note\": " << jsonNullable(d.note) << ", "
       << "\"date\": " << jsonString(d.date) << ", "
       << "\"area\": " << jsonNullable(d.area) << "}"
       << (i + 1 == record.days.size() ? "\n" : ",\n");
  }
  os << "  },\n";
  os << "  \"success\": true\n";
  os << "}\n";
  return os.str();
}

std::string failureToJson(const std::string& message) {
  return "{\"error\": " + jsonString(message) + ", \"success\": false}\n";
}

void writeGridAsCsv(const std::vector<Row>& rows,
                    const std::array<std::string, kWeekdayCount>& weekdays,
                    const std::string& path) {
  std::ofstream ofs(path);
  if (!ofs) throw std::runtime_error("cannot open '" + path + "' for writing");

  ofs << "area";
  for (const auto& wd : weekdays) ofs << ',' << csvCell(wd);
  ofs << "\n";
  for (const auto& r : rows) {
    ofs << csvCell(r.areaText);
    for (const auto& cell : r.cells) ofs << ',' << csvCell(cell);
    ofs << "\n";
  }
  if (!ofs) throw std::runtime_error("failed writing '" + path + "'");
}
