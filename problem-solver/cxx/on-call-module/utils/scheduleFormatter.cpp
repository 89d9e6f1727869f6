/*
 * This source file is part of an OSTIS project. For the latest info, see
 * http://ostis.net Distributed under the MIT License (See accompanying file
 * COPYING.MIT or copy at http://opensource.org/licenses/MIT)
 */

#include "scheduleFormatter.hpp"
#include "rotation/weekWindow.hpp"

#include <iomanip>
#include <sstream>

namespace
{

char const * BoolToString(bool value)
{
  return value ? "true" : "false";
}

std::string FormatTableRow(
    std::string const & week,
    std::string const & start,
    std::string const & end,
    std::string const & member,
    std::string const & flags)
{
  std::ostringstream row;
  row << std::left << std::setw(6) << week << std::setw(12) << start << std::setw(12) << end << std::setw(24)
      << member << flags;
  return row.str();
}

}  // namespace

std::string ScheduleFormatter::AssignedName(WeekAssignment const & week)
{
  return week.assignedTo ? *week.assignedTo : UNASSIGNED_MEMBER;
}

std::string ScheduleFormatter::FormatCsv(OnCallSchedule const & schedule)
{
  std::ostringstream csv;
  csv << CSV_HEADER << '\n';
  for (auto const & week : schedule)
  {
    csv << week.weekNumber << ',' << WeekWindowUtils::ToIsoString(week.window.start) << ','
        << WeekWindowUtils::ToIsoString(week.window.end) << ',' << AssignedName(week) << ','
        << BoolToString(week.hasHoliday) << ',' << BoolToString(week.hasPatching) << '\n';
  }
  return csv.str();
}

std::vector<std::string> ScheduleFormatter::FormatTableRows(OnCallSchedule const & schedule)
{
  std::vector<std::string> rows;
  rows.push_back(FormatTableRow("Week", "Start", "End", "On call", "Flags"));
  rows.push_back(std::string(60, '-'));

  for (auto const & week : schedule)
  {
    std::string flags;
    if (week.hasHoliday)
      flags += "H";
    if (week.hasPatching)
      flags += "P";
    rows.push_back(FormatTableRow(
        std::to_string(week.weekNumber),
        WeekWindowUtils::ToIsoString(week.window.start),
        WeekWindowUtils::ToIsoString(week.window.end),
        AssignedName(week),
        flags));
  }
  return rows;
}
