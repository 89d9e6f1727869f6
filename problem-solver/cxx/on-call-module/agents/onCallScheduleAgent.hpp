/*
 * This source file is part of an OSTIS project. For the latest info, see
 * http://ostis.net Distributed under the MIT License (See accompanying file
 * COPYING.MIT or copy at http://opensource.org/licenses/MIT)
 */

#pragma once

#include <sc-memory/sc_agent.hpp>

#include "rotation/calendarSet.hpp"
#include "rotation/scheduleBuilder.hpp"

#include <map>
#include <string>

// Параметры построения расписания, переданные вместе с действием
struct OnCallParameters
{
  boost::gregorian::date startDate;
  int weeksCount = 12;
  bool shuffleRoster = true;
};

class OnCallScheduleAgent : public ScActionInitiatedAgent
{
public:
  OnCallScheduleAgent();

  ScAddr GetActionClass() const override;

  ScResult DoProgram(ScActionInitiatedEvent const & event, ScAction & action) override;

private:
  // ===== Параметры =====

  OnCallParameters GetScheduleParameters(ScAction & action);
  boost::gregorian::date GetStartDate(ScAction & action);
  int GetWeeksCount(ScAction & action, int defaultValue);
  bool GetShuffleRoster(ScAction & action, bool defaultValue);
  void LogParameters(OnCallParameters const & params);

  // ===== Исходные данные из sc-памяти =====

  Roster LoadRoster(std::map<std::string, ScAddr> const & members, bool shuffle);
  CalendarSet LoadCalendar(std::map<std::string, ScAddr> const & members);

  // ===== Создание результата =====

  ScAddr CreateWeekNode(
      ScAddr const & scheduleAddr,
      WeekAssignment const & week,
      std::map<std::string, ScAddr> const & members,
      ScStructure & result);

  void AddFairnessTotalsToResult(
      ScStructure & result,
      FairnessTracker const & fairness,
      std::map<std::string, ScAddr> const & members);

  ScStructure CreateScheduleResult(ScheduleRun const & run, std::map<std::string, ScAddr> const & members);

  // ===== Вывод в лог =====

  void LogSchedule(OnCallSchedule const & schedule);
  void LogFairnessTotals(FairnessTracker const & fairness, std::map<std::string, ScAddr> const & members);
};
