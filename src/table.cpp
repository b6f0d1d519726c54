#include "table.hpp"

#include <fmt/color.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <glibmm/ustring.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <map>

#include "util/string.hpp"

namespace sysdmon {

namespace {

constexpr int COLUMN_GAP = 3;

const std::array<std::string, 5> STATE_HEADERS = {"Loaded", "Active", "SubActive", "FileState",
                                                  "FilePreset"};

std::vector<std::string> stateCells(const Unit &unit) {
  return {unit.loaded.str(), unit.active.str(), unit.sub.str(),
          unit.file_state ? unit.file_state->str() : "",
          unit.file_preset ? unit.file_preset->str() : ""};
}

std::string pad(const std::string &cell, int width) {
  return cell + std::string(std::max(0, width - displayWidth(cell)), ' ');
}

}  // namespace

std::string displayName(const std::string &name) { return util::replaceAll(name, "\\x2d", "-"); }

int displayWidth(const std::string &str) {
  Glib::ustring ustr(str);
  if (!ustr.validate()) {
    return static_cast<int>(str.size());
  }
  int total = 0;
  for (gunichar c : ustr) {
    total += g_unichar_iswide(c) + 1;
  }
  return total;
}

std::string renderTable(const std::vector<Unit> &units, const TableOptions &options) {
  std::vector<std::vector<std::string>> rows;

  std::vector<std::string> header{"Name"};
  header.insert(header.end(), STATE_HEADERS.begin(), STATE_HEADERS.end());
  if (options.desc_file) {
    header.emplace_back("Description");
    header.emplace_back("File");
  }
  rows.push_back(std::move(header));

  for (const auto &unit : units) {
    std::vector<std::string> row{displayName(unit.name)};
    auto states = stateCells(unit);
    row.insert(row.end(), states.begin(), states.end());
    if (options.desc_file) {
      row.push_back(unit.description);
      row.push_back(unit.file_path);
    }
    rows.push_back(std::move(row));
  }

  std::vector<int> widths(rows.front().size(), 0);
  for (const auto &row : rows) {
    for (size_t i = 0; i < row.size(); i++) {
      widths[i] = std::max(widths[i], displayWidth(row[i]));
    }
  }

  std::string out;
  for (const auto &row : rows) {
    std::string line;
    for (size_t i = 0; i < row.size(); i++) {
      if (i + 1 == row.size()) {
        line += row[i];
      } else {
        line += pad(row[i], widths[i] + COLUMN_GAP);
      }
    }
    out += util::rtrim(line) + '\n';
  }
  return out;
}

std::string renderSummary(const std::vector<Unit> &all, const std::vector<Unit> &shown,
                          bool bold) {
  using Counts = std::map<std::string, int>;

  std::map<std::string, int> total_per_type;
  for (const auto &unit : all) {
    total_per_type[unit.type.str()]++;
  }

  std::map<std::string, std::vector<const Unit *>> shown_per_type;
  for (const auto &unit : shown) {
    shown_per_type[unit.type.str()].push_back(&unit);
  }

  std::string out;
  for (const auto &[type, units] : shown_per_type) {
    auto title = fmt::format("{}S:", type.empty() ? "unknown" : type);
    std::transform(title.begin(), title.end(), title.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    if (bold) {
      out += fmt::format(fmt::emphasis::bold, "{}", title);
    } else {
      out += title;
    }
    out += fmt::format(" {}", units.size());
    if (static_cast<int>(units.size()) != total_per_type[type]) {
      out += fmt::format(" / {}", total_per_type[type]);
    }
    out += '\n';

    std::array<Counts, STATE_HEADERS.size()> counts;
    for (const auto *unit : units) {
      auto cells = stateCells(*unit);
      for (size_t i = 0; i < counts.size(); i++) {
        if (!cells[i].empty()) counts[i][cells[i]]++;
      }
    }
    for (size_t i = 0; i < counts.size(); i++) {
      if (counts[i].empty()) continue;
      std::vector<std::string> parts;
      for (const auto &[value, count] : counts[i]) {
        parts.push_back(fmt::format("{}: {}", value, count));
      }
      out += fmt::format("{}: {}\n", STATE_HEADERS[i], fmt::join(parts, ", "));
    }
    out += '\n';
  }
  return out;
}

}  // namespace sysdmon
