/*
 * This source file is part of an OSTIS project. For the latest info, see
 * http://ostis.net Distributed under the MIT License (See accompanying file
 * COPYING.MIT or copy at http://opensource.org/licenses/MIT)
 */

#include "scheduleBuilder.hpp"
#include "weekAssigner.hpp"
#include "weekWindow.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>

ScheduleRun ScheduleBuilder::Run(
    Roster const & roster,
    boost::gregorian::date const & startDate,
    int numWeeks,
    CalendarSet const & calendar)
{
  if (roster.empty())
    throw std::invalid_argument("Roster is empty");
  if (numWeeks < 0)
    throw std::invalid_argument("Number of weeks must not be negative: " + std::to_string(numWeeks));
  if (startDate.is_special())
    throw std::invalid_argument("Start date is not a calendar date");

  // Последнее воскресенье горизонта должно укладываться в диапазон boost::gregorian
  boost::gregorian::date const firstMonday =
      startDate - boost::gregorian::days(WeekWindowUtils::IsoWeekday(startDate) - 1);
  boost::gregorian::date const lastCalendarDay(boost::date_time::max_date_time);
  long long const daysAvailable = (lastCalendarDay - firstMonday).days();
  if (7LL * numWeeks - 1 > daysAvailable || (numWeeks == 0 && daysAvailable < 6))
    throw std::invalid_argument(
        "Schedule of " + std::to_string(numWeeks) + " weeks ends after "
        + WeekWindowUtils::ToIsoString(lastCalendarDay));

  WeekWindow window = WeekWindowUtils::ForDate(startDate);

  ScheduleRun run{{}, FairnessTracker(roster), RotationCursor(roster)};
  run.schedule.reserve(static_cast<std::size_t>(numWeeks));

  WeekAssigner assigner(calendar, run.fairness, run.cursor);

  for (int weekNumber = 1; weekNumber <= numWeeks; ++weekNumber)
  {
    WeekAssignment week;
    week.weekNumber = weekNumber;
    week.window = window;
    week.hasHoliday = calendar.WeekHasHoliday(window);
    week.hasPatching = calendar.WeekHasPatching(window);
    week.assignedTo = assigner.Assign(window, week.hasHoliday, week.hasPatching);

    run.schedule.push_back(week);
    window = WeekWindowUtils::Next(window);
  }

  return run;
}

OnCallSchedule ScheduleBuilder::Build(
    Roster const & roster,
    boost::gregorian::date const & startDate,
    int numWeeks,
    CalendarSet const & calendar)
{
  return Run(roster, startDate, numWeeks, calendar).schedule;
}
