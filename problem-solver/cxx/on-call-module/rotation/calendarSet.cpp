/*
 * This source file is part of an OSTIS project. For the latest info, see
 * http://ostis.net Distributed under the MIT License (See accompanying file
 * COPYING.MIT or copy at http://opensource.org/licenses/MIT)
 */

#include "calendarSet.hpp"

#include <utility>

using boost::gregorian::date;

CalendarSet::CalendarSet(DateSet holidays, DateSet patchingDates, UnavailabilityIndex unavailability)
  : m_holidays(std::move(holidays))
  , m_patchingDates(std::move(patchingDates))
  , m_unavailability(std::move(unavailability))
{
}

bool CalendarSet::ContainsHoliday(date const & day) const
{
  return m_holidays.count(day) > 0;
}

bool CalendarSet::ContainsPatching(date const & day) const
{
  return m_patchingDates.count(day) > 0;
}

bool CalendarSet::IsUnavailable(Member const & member, date const & day) const
{
  auto const it = m_unavailability.find(member);
  if (it == m_unavailability.end())
    return false;
  return it->second.count(day) > 0;
}

bool CalendarSet::AnyDayInWindow(DateSet const & dates, WeekWindow const & window)
{
  auto const it = dates.lower_bound(window.start);
  return it != dates.end() && *it <= window.end;
}

bool CalendarSet::WeekHasHoliday(WeekWindow const & window) const
{
  return AnyDayInWindow(m_holidays, window);
}

bool CalendarSet::WeekHasPatching(WeekWindow const & window) const
{
  return AnyDayInWindow(m_patchingDates, window);
}

bool CalendarSet::MemberAvailableForWeek(Member const & member, WeekWindow const & window) const
{
  auto const it = m_unavailability.find(member);
  if (it == m_unavailability.end())
    return true;
  return !AnyDayInWindow(it->second, window);
}
