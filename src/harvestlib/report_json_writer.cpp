/*****************************************************************************
 * Tile Harvest
 * Copyright (C) 2024 alpinemaps.org
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 *****************************************************************************/

#include "report_json_writer.h"

#include <fstream>

#include <fmt/core.h>

#include "Exception.h"

namespace {
template <class T, class Fun>
std::string produce_array(const std::vector<T>& items, Fun&& fun, const std::string& indent)
{
  if (items.empty())
    return "[]";
  std::string s = "[\n";
  for (size_t i = 0; i < items.size(); ++i) {
    s += indent + fun(items[i]);
    s += i + 1 < items.size() ? ",\n" : "\n";
  }
  return s + indent.substr(2) + "]";
}
}

std::string report_json_writer::internal::escape(const std::string& s)
{
  std::string escaped;
  escaped.reserve(s.size());
  for (const char c : s) {
    switch (c) {
    case '"':
      escaped += "\\\"";
      break;
    case '\\':
      escaped += "\\\\";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\t':
      escaped += "\\t";
      break;
    case '\r':
      escaped += "\\r";
      break;
    default:
      if (static_cast<unsigned char>(c) < 0x20)
        escaped += fmt::format("\\u{:04x}", unsigned(static_cast<unsigned char>(c)));
      else
        escaped += c;
    }
  }
  return escaped;
}

std::string report_json_writer::internal::string_attribute(const std::string& name, const std::string& s)
{
  return fmt::format("\"{}\": \"{}\"", name, escape(s));
}

std::string report_json_writer::internal::tile(const tile::Id& id)
{
  return fmt::format("[{}, {}, {}]", id.zoom_level, id.coords.x, id.coords.y);
}

std::string report_json_writer::internal::level(const store::LevelStatistics& level)
{
  return fmt::format(R"({{ "zoom": {}, "expected": {}, "valid": {}, "missing": {}, "completion_rate": {:.2f} }})",
      level.zoom_level, level.expected_count, level.valid_count, level.missing_count, level.completion_rate);
}

std::string report_json_writer::internal::round(const reconcile::RoundRecord& round)
{
  return fmt::format(R"({{ "round": {}, "max_attempts": {}, "missing_before": {}, "attempted": {}, "succeeded": {}, "failed": {}, "missing_after": {}, "duration_ms": {}, "timed_out": {} }})",
      round.round, round.max_attempts, round.missing_before, round.attempted, round.succeeded, round.failed, round.missing_after,
      round.duration.count(), round.timed_out);
}

std::string report_json_writer::process(const std::string& project_name, const reconcile::Result& result)
{
  const auto& report = result.report;
  std::string s = "{\n";
  s += "  " + internal::string_attribute("name", project_name) + ",\n";
  s += "  " + internal::string_attribute("state", std::string(reconcile::to_string(result.state))) + ",\n";
  s += fmt::format("  \"expected\": {},\n", report.expected_count);
  s += fmt::format("  \"valid\": {},\n", report.valid_count);
  s += fmt::format("  \"missing_count\": {},\n", report.missing.size());
  s += fmt::format("  \"completion_rate\": {:.2f},\n", report.completion_rate);
  s += fmt::format("  \"fetch_calls\": {},\n", result.fetch_calls);
  s += "  \"levels\": " + produce_array(report.levels, internal::level, "    ") + ",\n";
  s += "  \"rounds\": " + produce_array(result.rounds, internal::round, "    ") + ",\n";
  s += "  \"missing\": " + produce_array(report.missing, internal::tile, "    ") + "\n";
  s += "}\n";
  return s;
}

void report_json_writer::write_to_file(const std::filesystem::path& path, const std::string& project_name, const reconcile::Result& result)
{
  if (path.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream file(path, std::ios::trunc);
  if (!file.is_open())
    throw Exception(fmt::format("Cannot open report file {}", path.string()));
  file << process(project_name, result);
  file.close();
  if (file.fail())
    throw Exception(fmt::format("Writing report file {} failed", path.string()));
}
