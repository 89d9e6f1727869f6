/*
 * This source file is part of an OSTIS project. For the latest info, see
 * http://ostis.net Distributed under the MIT License (See accompanying file
 * COPYING.MIT or copy at http://opensource.org/licenses/MIT)
 */

#include "onCallScheduleAgent.hpp"
#include "keynodes/on-call-keynodes.hpp"
#include "rotation/rosterShuffle.hpp"
#include "rotation/weekWindow.hpp"
#include "utils/calendarParser.hpp"
#include "utils/onCallMemory.hpp"
#include "utils/scheduleFormatter.hpp"
#include "utils/stringFormatter.hpp"

#include <sc-memory/sc_memory_headers.hpp>

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

OnCallScheduleAgent::OnCallScheduleAgent()
{
  m_logger = utils::ScLogger(
      utils::ScLogger::ScLogType::File, "logs/OnCallScheduleAgent.log", utils::ScLogLevel::Debug);
}

ScAddr OnCallScheduleAgent::GetActionClass() const
{
  return OnCallKeynodes::action_build_on_call_schedule;
}

boost::gregorian::date OnCallScheduleAgent::GetStartDate(ScAction & action)
{
  boost::gregorian::date const today = boost::gregorian::day_clock::local_day();

  std::string const text = OnCallMemory::GetRelationText(m_context, action, OnCallKeynodes::nrel_start_date);
  if (text.empty())
    return today;

  auto const startDate = CalendarParser::ParseIsoDate(text);
  if (!startDate)
  {
    m_logger.Warning("OnCallScheduleAgent: Invalid start date '", text, "', using today");
    return today;
  }
  return *startDate;
}

int OnCallScheduleAgent::GetWeeksCount(ScAction & action, int defaultValue)
{
  std::string const text = OnCallMemory::GetRelationText(m_context, action, OnCallKeynodes::nrel_weeks_count);
  if (text.empty())
    return defaultValue;

  try
  {
    std::size_t parsedLength = 0;
    int const weeksCount = std::stoi(text, &parsedLength);
    if (StringFormatter::Trim(text.substr(parsedLength)).empty())
      return weeksCount;
  }
  catch (std::exception const &)
  {
    m_logger.Warning("OnCallScheduleAgent: Invalid weeks count '", text, "', using ", defaultValue);
    return defaultValue;
  }

  m_logger.Warning("OnCallScheduleAgent: Trailing characters in weeks count '", text, "', using ", defaultValue);
  return defaultValue;
}

bool OnCallScheduleAgent::GetShuffleRoster(ScAction & action, bool defaultValue)
{
  std::string text = OnCallMemory::GetRelationText(m_context, action, OnCallKeynodes::nrel_shuffle_roster);
  text = StringFormatter::Trim(text);
  std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });

  if (text == "true" || text == "yes" || text == "1")
    return true;
  if (text == "false" || text == "no" || text == "0")
    return false;

  if (!text.empty())
    m_logger.Warning("OnCallScheduleAgent: Invalid shuffle flag '", text, "', using default");
  return defaultValue;
}

OnCallParameters OnCallScheduleAgent::GetScheduleParameters(ScAction & action)
{
  OnCallParameters params;
  params.startDate = GetStartDate(action);
  params.weeksCount = GetWeeksCount(action, params.weeksCount);
  params.shuffleRoster = GetShuffleRoster(action, params.shuffleRoster);
  return params;
}

void OnCallScheduleAgent::LogParameters(OnCallParameters const & params)
{
  m_logger.Info(
      "OnCallScheduleAgent: Parameters - start date: ", WeekWindowUtils::ToIsoString(params.startDate),
      ", weeks: ", params.weeksCount, ", shuffle roster: ", params.shuffleRoster ? "yes" : "no");
}

Roster OnCallScheduleAgent::LoadRoster(std::map<std::string, ScAddr> const & members, bool shuffle)
{
  std::vector<std::string> names;
  for (auto const & [name, addr] : members)
    names.push_back(name);

  Roster roster =
      RosterFactory::MakeRoster(names, shuffle ? RosterFactory::RandomShuffle() : RosterFactory::IdentityShuffle());

  std::string order;
  for (auto const & member : roster)
    order += (order.empty() ? "" : ", ") + member;
  m_logger.Info("OnCallScheduleAgent: Rotation order: ", order);

  return roster;
}

CalendarSet OnCallScheduleAgent::LoadCalendar(std::map<std::string, ScAddr> const & members)
{
  DateSet holidays = OnCallMemory::GetDatesOfClass(m_context, OnCallKeynodes::concept_holiday_date);
  DateSet patchingDates = OnCallMemory::GetDatesOfClass(m_context, OnCallKeynodes::concept_patching_date);

  UnavailabilityIndex unavailability;
  for (auto const & [name, addr] : members)
  {
    DateSet dates = OnCallMemory::GetUnavailableDates(m_context, addr);
    if (!dates.empty())
      unavailability.emplace(name, std::move(dates));
  }

  m_logger.Info(
      "OnCallScheduleAgent: Calendar - holidays: ", holidays.size(), ", patching dates: ", patchingDates.size(),
      ", members with unavailability: ", unavailability.size());

  return CalendarSet(std::move(holidays), std::move(patchingDates), std::move(unavailability));
}

ScAddr OnCallScheduleAgent::CreateWeekNode(
    ScAddr const & scheduleAddr,
    WeekAssignment const & week,
    std::map<std::string, ScAddr> const & members,
    ScStructure & result)
{
  ScAddr weekNode = m_context.GenerateNode(ScType::ConstNode);
  m_context.GenerateConnector(ScType::ConstPermPosArc, OnCallKeynodes::concept_on_call_week, weekNode);
  ScAddr scheduleArc = m_context.GenerateConnector(ScType::ConstPermPosArc, scheduleAddr, weekNode);
  result << weekNode << scheduleArc;

  auto createWeekRelation = [this, weekNode, &result](std::string const & value, ScAddr const & relation) {
    ScAddr link = OnCallMemory::GenerateTextLink(m_context, value);
    ScAddr arc = OnCallMemory::GenerateRelation(m_context, weekNode, link, relation);
    result << link << arc;
  };

  createWeekRelation(std::to_string(week.weekNumber), OnCallKeynodes::nrel_week_number);
  createWeekRelation(WeekWindowUtils::ToIsoString(week.window.start), OnCallKeynodes::nrel_week_start);
  createWeekRelation(WeekWindowUtils::ToIsoString(week.window.end), OnCallKeynodes::nrel_week_end);

  if (week.assignedTo)
  {
    ScAddr memberAddr = members.at(*week.assignedTo);
    ScAddr arc = OnCallMemory::GenerateRelation(m_context, weekNode, memberAddr, OnCallKeynodes::nrel_on_call_member);
    result << memberAddr << arc;
  }
  else
    m_context.GenerateConnector(ScType::ConstPermPosArc, OnCallKeynodes::concept_unassigned_week, weekNode);

  if (week.hasHoliday)
    m_context.GenerateConnector(ScType::ConstPermPosArc, OnCallKeynodes::concept_holiday_week, weekNode);
  if (week.hasPatching)
    m_context.GenerateConnector(ScType::ConstPermPosArc, OnCallKeynodes::concept_patching_week, weekNode);

  return weekNode;
}

void OnCallScheduleAgent::AddFairnessTotalsToResult(
    ScStructure & result,
    FairnessTracker const & fairness,
    std::map<std::string, ScAddr> const & members)
{
  for (auto const & [name, addr] : members)
  {
    ScAddr holidayLink = OnCallMemory::GenerateTextLink(m_context, std::to_string(fairness.HolidayCount(name)));
    ScAddr holidayArc =
        OnCallMemory::GenerateRelation(m_context, addr, holidayLink, OnCallKeynodes::nrel_holiday_weeks_count);

    ScAddr patchingLink = OnCallMemory::GenerateTextLink(m_context, std::to_string(fairness.PatchingCount(name)));
    ScAddr patchingArc =
        OnCallMemory::GenerateRelation(m_context, addr, patchingLink, OnCallKeynodes::nrel_patching_weeks_count);

    result << holidayLink << holidayArc << patchingLink << patchingArc;
  }
}

ScStructure OnCallScheduleAgent::CreateScheduleResult(
    ScheduleRun const & run,
    std::map<std::string, ScAddr> const & members)
{
  ScStructure result = m_context.GenerateStructure();

  ScAddr scheduleAddr = m_context.GenerateNode(ScType::ConstNode);
  m_context.GenerateConnector(ScType::ConstPermPosArc, OnCallKeynodes::concept_on_call_schedule, scheduleAddr);
  result << scheduleAddr;

  for (auto const & week : run.schedule)
    CreateWeekNode(scheduleAddr, week, members, result);

  AddFairnessTotalsToResult(result, run.fairness, members);
  return result;
}

void OnCallScheduleAgent::LogSchedule(OnCallSchedule const & schedule)
{
  m_logger.Info("OnCallScheduleAgent: === On-call schedule ===");
  for (auto const & row : ScheduleFormatter::FormatTableRows(schedule))
    m_logger.Info(row);

  for (auto const & week : schedule)
  {
    if (!week.assignedTo)
      m_logger.Warning(
          "OnCallScheduleAgent: Week ", week.weekNumber, " (", WeekWindowUtils::ToIsoString(week.window.start),
          ") has no eligible member");
  }
}

void OnCallScheduleAgent::LogFairnessTotals(
    FairnessTracker const & fairness,
    std::map<std::string, ScAddr> const & members)
{
  m_logger.Info("OnCallScheduleAgent: === Holiday / patching weeks per member ===");
  for (auto const & [name, addr] : members)
    m_logger.Info(name, ": holidays ", fairness.HolidayCount(name), ", patching ", fairness.PatchingCount(name));
}

ScResult OnCallScheduleAgent::DoProgram(ScActionInitiatedEvent const & event, ScAction & action)
{
  m_logger.Info("OnCallScheduleAgent: Starting on-call schedule building");

  OnCallParameters params = GetScheduleParameters(action);
  LogParameters(params);

  auto const members = OnCallMemory::GetMembers(m_context);
  if (members.empty())
  {
    m_logger.Error("OnCallScheduleAgent: No on-call members found");
    return action.FinishWithError();
  }

  Roster roster = LoadRoster(members, params.shuffleRoster);
  CalendarSet calendar = LoadCalendar(members);

  try
  {
    ScheduleRun run = ScheduleBuilder::Run(roster, params.startDate, params.weeksCount, calendar);

    long const assignedCount = std::count_if(run.schedule.begin(), run.schedule.end(), [](WeekAssignment const & week) {
      return week.assignedTo.has_value();
    });
    m_logger.Info("OnCallScheduleAgent: Assigned ", assignedCount, " of ", run.schedule.size(), " weeks");

    LogSchedule(run.schedule);
    LogFairnessTotals(run.fairness, members);

    ScStructure result = CreateScheduleResult(run, members);
    action.SetResult(result);
  }
  catch (std::invalid_argument const & e)
  {
    m_logger.Error("OnCallScheduleAgent: Invalid schedule configuration: ", e.what());
    return action.FinishWithError();
  }
  catch (std::exception const & e)
  {
    m_logger.Error("OnCallScheduleAgent: Failed to build schedule: ", e.what());
    return action.FinishWithError();
  }

  return action.FinishSuccessfully();
}
