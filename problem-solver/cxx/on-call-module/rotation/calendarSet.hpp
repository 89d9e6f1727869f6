/*
 * This source file is part of an OSTIS project. For the latest info, see
 * http://ostis.net Distributed under the MIT License (See accompanying file
 * COPYING.MIT or copy at http://opensource.org/licenses/MIT)
 */

#pragma once

#include "onCallTypes.hpp"

// Праздники, дни патчинга и недоступность участников.
// После создания не изменяется.
class CalendarSet
{
public:
  CalendarSet() = default;
  CalendarSet(DateSet holidays, DateSet patchingDates, UnavailabilityIndex unavailability);

  bool ContainsHoliday(boost::gregorian::date const & day) const;
  bool ContainsPatching(boost::gregorian::date const & day) const;
  bool IsUnavailable(Member const & member, boost::gregorian::date const & day) const;

  bool WeekHasHoliday(WeekWindow const & window) const;
  bool WeekHasPatching(WeekWindow const & window) const;

  // Участника нет в индексе -> доступен всю неделю
  bool MemberAvailableForWeek(Member const & member, WeekWindow const & window) const;

private:
  static bool AnyDayInWindow(DateSet const & dates, WeekWindow const & window);

  DateSet m_holidays;
  DateSet m_patchingDates;
  UnavailabilityIndex m_unavailability;
};
