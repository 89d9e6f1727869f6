/*
 * This source file is part of an OSTIS project. For the latest info, see
 * http://ostis.net Distributed under the MIT License (See accompanying file
 * COPYING.MIT or copy at http://opensource.org/licenses/MIT)
 */

#include "importCalendarAgent.hpp"
#include "keynodes/on-call-keynodes.hpp"
#include "rotation/weekWindow.hpp"
#include "utils/calendarParser.hpp"
#include "utils/onCallMemory.hpp"

#include <sc-memory/sc_memory.hpp>

ScAddr ImportCalendarAgent::GetActionClass() const
{
  return OnCallKeynodes::action_import_on_call_calendar;
}

bool ImportCalendarAgent::GetContent(ScAction & action, ScAddr const & relation, std::string & content)
{
  ScIterator5Ptr it5 = m_context.CreateIterator5(
      action, ScType::ConstCommonArc, ScType::ConstNodeLink, ScType::ConstPermPosArc, relation);
  if (!it5->Next())
    return false;

  content = OnCallMemory::GetLinkText(m_context, it5->Get(2));
  return true;
}

void ImportCalendarAgent::LogRejectedLines(std::string const & source, std::vector<std::string> const & lines)
{
  for (auto const & line : lines)
    m_logger.Warning("ImportCalendarAgent: Skipping malformed ", source, " line: ", line);
}

int ImportCalendarAgent::ImportDates(DateSet const & dates, ScAddr const & dateClass, ScStructure & result)
{
  DateSet const known = OnCallMemory::GetDatesOfClass(m_context, dateClass);
  int importedCount = 0;

  for (auto const & day : dates)
  {
    if (known.count(day) > 0)
      continue;

    ScAddr dateLink = OnCallMemory::GenerateTextLink(m_context, WeekWindowUtils::ToIsoString(day));
    ScAddr arc = m_context.GenerateConnector(ScType::ConstPermPosArc, dateClass, dateLink);
    result << dateLink << arc;
    importedCount++;
  }
  return importedCount;
}

int ImportCalendarAgent::ImportUnavailability(UnavailabilityIndex const & index, ScStructure & result)
{
  int importedCount = 0;

  for (auto const & [name, dates] : index)
  {
    bool created = false;
    ScAddr member = OnCallMemory::ResolveMember(m_context, name, created);
    if (created)
      m_logger.Warning("ImportCalendarAgent: Unavailability for unknown member, member created: ", name);

    DateSet const known = OnCallMemory::GetUnavailableDates(m_context, member);
    for (auto const & day : dates)
    {
      if (known.count(day) > 0)
        continue;

      ScAddr dateLink = OnCallMemory::GenerateTextLink(m_context, WeekWindowUtils::ToIsoString(day));
      ScAddr arc = OnCallMemory::GenerateRelation(m_context, member, dateLink, OnCallKeynodes::nrel_unavailable_on);
      result << member << dateLink << arc;
      importedCount++;
    }
  }
  return importedCount;
}

ScResult ImportCalendarAgent::DoProgram(ScAction & action)
{
  std::string holidaysText, patchingText, unavailabilityText;
  bool const hasHolidays = GetContent(action, OnCallKeynodes::nrel_holidays_content, holidaysText);
  bool const hasPatching = GetContent(action, OnCallKeynodes::nrel_patching_content, patchingText);
  bool const hasUnavailability =
      GetContent(action, OnCallKeynodes::nrel_unavailability_content, unavailabilityText);

  if (!hasHolidays && !hasPatching && !hasUnavailability)
  {
    m_logger.Error("ImportCalendarAgent: No calendar content provided");
    return action.FinishWithError();
  }

  ScStructure result = m_context.GenerateStructure();

  if (hasHolidays)
  {
    DateListParseResult const holidays = CalendarParser::ParseDateList(holidaysText);
    LogRejectedLines("holiday", holidays.rejectedLines);
    int const count = ImportDates(holidays.dates, OnCallKeynodes::concept_holiday_date, result);
    m_logger.Info("ImportCalendarAgent: Holidays imported: ", count);
  }

  if (hasPatching)
  {
    DateListParseResult const patching = CalendarParser::ParseDateList(patchingText);
    LogRejectedLines("patching", patching.rejectedLines);
    int const count = ImportDates(patching.dates, OnCallKeynodes::concept_patching_date, result);
    m_logger.Info("ImportCalendarAgent: Patching dates imported: ", count);
  }

  if (hasUnavailability)
  {
    UnavailabilityParseResult const unavailability = CalendarParser::ParseUnavailability(unavailabilityText);
    LogRejectedLines("unavailability", unavailability.rejectedLines);
    int const count = ImportUnavailability(unavailability.index, result);
    m_logger.Info("ImportCalendarAgent: Unavailable days imported: ", count);
  }

  action.SetResult(result);
  return action.FinishSuccessfully();
}
