/*
 * This source file is part of an OSTIS project. For the latest info, see
 * http://ostis.net Distributed under the MIT License (See accompanying file
 * COPYING.MIT or copy at http://opensource.org/licenses/MIT)
 */

#include "exportScheduleCsvAgent.hpp"
#include "keynodes/on-call-keynodes.hpp"
#include "utils/calendarParser.hpp"
#include "utils/onCallMemory.hpp"
#include "utils/scheduleFormatter.hpp"

#include <sc-memory/sc_memory.hpp>
#include <sc-agents-common/utils/IteratorUtils.hpp>

#include <algorithm>
#include <stdexcept>

ScAddr ExportScheduleCsvAgent::GetActionClass() const
{
  return OnCallKeynodes::action_export_on_call_schedule_csv;
}

std::optional<WeekAssignment> ExportScheduleCsvAgent::ReadWeek(ScAddr const & weekNode)
{
  WeekAssignment week;

  auto const start =
      CalendarParser::ParseIsoDate(OnCallMemory::GetRelationText(m_context, weekNode, OnCallKeynodes::nrel_week_start));
  auto const end =
      CalendarParser::ParseIsoDate(OnCallMemory::GetRelationText(m_context, weekNode, OnCallKeynodes::nrel_week_end));
  if (!start || !end)
    return std::nullopt;

  try
  {
    week.weekNumber = std::stoi(OnCallMemory::GetRelationText(m_context, weekNode, OnCallKeynodes::nrel_week_number));
  }
  catch (std::exception const &)
  {
    return std::nullopt;
  }

  week.window = {*start, *end};

  ScAddr member = utils::IteratorUtils::getAnyByOutRelation(&m_context, weekNode, OnCallKeynodes::nrel_on_call_member);
  if (member.IsValid())
    week.assignedTo = OnCallMemory::GetMemberName(m_context, member);

  week.hasHoliday = m_context.CheckConnector(OnCallKeynodes::concept_holiday_week, weekNode, ScType::ConstPermPosArc);
  week.hasPatching = m_context.CheckConnector(OnCallKeynodes::concept_patching_week, weekNode, ScType::ConstPermPosArc);
  return week;
}

OnCallSchedule ExportScheduleCsvAgent::ReadSchedule(ScAddr const & scheduleAddr)
{
  OnCallSchedule schedule;

  ScIterator3Ptr it = m_context.CreateIterator3(scheduleAddr, ScType::ConstPermPosArc, ScType::ConstNode);
  while (it->Next())
  {
    ScAddr weekNode = it->Get(2);
    if (!m_context.CheckConnector(OnCallKeynodes::concept_on_call_week, weekNode, ScType::ConstPermPosArc))
      continue;

    auto week = ReadWeek(weekNode);
    if (week)
      schedule.push_back(*week);
    else
      m_logger.Warning("ExportScheduleCsvAgent: Skipping incomplete week node");
  }

  std::sort(schedule.begin(), schedule.end(), [](WeekAssignment const & a, WeekAssignment const & b) {
    return a.weekNumber < b.weekNumber;
  });
  return schedule;
}

ScResult ExportScheduleCsvAgent::DoProgram(ScAction & action)
{
  auto const & [scheduleAddr] = action.GetArguments<1>();

  if (!m_context.IsElement(scheduleAddr))
  {
    m_logger.Error("ExportScheduleCsvAgent: Schedule not specified");
    return action.FinishWithError();
  }

  if (!m_context.CheckConnector(OnCallKeynodes::concept_on_call_schedule, scheduleAddr, ScType::ConstPermPosArc))
  {
    m_logger.Error("ExportScheduleCsvAgent: Argument is not an on-call schedule");
    return action.FinishWithError();
  }

  OnCallSchedule const schedule = ReadSchedule(scheduleAddr);
  std::string const csv = ScheduleFormatter::FormatCsv(schedule);

  ScAddr csvLink = OnCallMemory::GenerateTextLink(m_context, csv);
  ScAddr csvArc = OnCallMemory::GenerateRelation(m_context, scheduleAddr, csvLink, OnCallKeynodes::nrel_csv_export);

  ScStructure result = m_context.GenerateStructure();
  result << scheduleAddr << csvLink << csvArc;
  action.SetResult(result);

  m_logger.Info("ExportScheduleCsvAgent: Exported ", schedule.size(), " weeks to CSV");
  return action.FinishSuccessfully();
}
