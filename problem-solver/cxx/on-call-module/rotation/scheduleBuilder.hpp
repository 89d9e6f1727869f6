/*
 * This source file is part of an OSTIS project. For the latest info, see
 * http://ostis.net Distributed under the MIT License (See accompanying file
 * COPYING.MIT or copy at http://opensource.org/licenses/MIT)
 */

#pragma once

#include "calendarSet.hpp"
#include "fairnessTracker.hpp"
#include "rotationCursor.hpp"

// Расписание вместе с итоговым состоянием счётчиков и курсора
struct ScheduleRun
{
  OnCallSchedule schedule;
  FairnessTracker fairness;
  RotationCursor cursor;
};

class ScheduleBuilder
{
public:
  // std::invalid_argument при пустом составе, отрицательном числе недель или
  // горизонте, выходящем за 9999-12-31. numWeeks == 0 даёт пустое расписание.
  static ScheduleRun Run(
      Roster const & roster,
      boost::gregorian::date const & startDate,
      int numWeeks,
      CalendarSet const & calendar);

  static OnCallSchedule Build(
      Roster const & roster,
      boost::gregorian::date const & startDate,
      int numWeeks,
      CalendarSet const & calendar);
};
