#pragma once

#include <string>
#include <vector>

#include "unit.hpp"

namespace sysdmon {

struct TableOptions {
  // Adds the Description and File columns
  bool desc_file = false;
};

/* Unit name as shown to the user, with systemd's "\x2d" escape turned back into '-'. */
std::string displayName(const std::string &name);

/* Terminal cell width of a UTF-8 string, wide characters count twice. */
int displayWidth(const std::string &str);

/*
 * Aligned text table, one row per unit, in the given order.
 * Column widths fit the widest cell of the current result set.
 */
std::string renderTable(const std::vector<Unit> &units, const TableOptions &options);

/*
 * Per-type counts of the listed units versus all enumerated units, followed by per-state
 * counts. Meant for standard error, so that standard output only carries the table.
 */
std::string renderSummary(const std::vector<Unit> &all, const std::vector<Unit> &shown,
                          bool bold);

}  // namespace sysdmon
