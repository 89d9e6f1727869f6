/*
 * This source file is part of an OSTIS project. For the latest info, see
 * http://ostis.net Distributed under the MIT License (See accompanying file
 * COPYING.MIT or copy at http://opensource.org/licenses/MIT)
 */

#include "weekWindow.hpp"

using boost::gregorian::date;
using boost::gregorian::days;

int WeekWindowUtils::IsoWeekday(date const & day)
{
  int const weekday = day.day_of_week().as_number();
  return weekday == 0 ? 7 : weekday;
}

WeekWindow WeekWindowUtils::ForDate(date const & day)
{
  date const start = day - days(IsoWeekday(day) - 1);
  return {start, start + days(6)};
}

WeekWindow WeekWindowUtils::Next(WeekWindow const & window)
{
  return {window.start + days(7), window.end + days(7)};
}

std::vector<date> WeekWindowUtils::Days(WeekWindow const & window)
{
  std::vector<date> result;
  for (date day = window.start; day <= window.end; day += days(1))
    result.push_back(day);
  return result;
}

std::string WeekWindowUtils::ToIsoString(date const & day)
{
  return boost::gregorian::to_iso_extended_string(day);
}
