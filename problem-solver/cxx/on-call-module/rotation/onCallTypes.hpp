/*
 * This source file is part of an OSTIS project. For the latest info, see
 * http://ostis.net Distributed under the MIT License (See accompanying file
 * COPYING.MIT or copy at http://opensource.org/licenses/MIT)
 */

#pragma once

#include <boost/date_time/gregorian/gregorian.hpp>

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

using Member = std::string;

// Порядок дежурств; фиксирован на время одного построения расписания
using Roster = std::vector<Member>;

using DateSet = std::set<boost::gregorian::date>;
using UnavailabilityIndex = std::map<Member, DateSet>;

std::string const UNASSIGNED_MEMBER = "UNASSIGNED";

// Неделя с понедельника по воскресенье
struct WeekWindow
{
  boost::gregorian::date start;
  boost::gregorian::date end;
};

struct WeekAssignment
{
  int weekNumber = 0;
  WeekWindow window;
  std::optional<Member> assignedTo;  // пусто, если никто не подошёл
  bool hasHoliday = false;
  bool hasPatching = false;
};

using OnCallSchedule = std::vector<WeekAssignment>;
