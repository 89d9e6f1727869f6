/*
 * This source file is part of an OSTIS project. For the latest info, see
 * http://ostis.net Distributed under the MIT License (See accompanying file
 * COPYING.MIT or copy at http://opensource.org/licenses/MIT)
 */

#include "importTeamAgent.hpp"
#include "keynodes/on-call-keynodes.hpp"
#include "utils/calendarParser.hpp"
#include "utils/onCallMemory.hpp"

#include <sc-memory/sc_memory.hpp>

ScAddr ImportTeamAgent::GetActionClass() const
{
  return OnCallKeynodes::action_import_on_call_team;
}

std::string ImportTeamAgent::GetFileContent(ScAction & action)
{
  ScIterator5Ptr it5 = m_context.CreateIterator5(
      action, ScType::ConstCommonArc, ScType::ConstNodeLink, ScType::ConstPermPosArc,
      OnCallKeynodes::nrel_file_content);
  if (!it5->Next())
  {
    m_logger.Error("ImportTeamAgent: Team file content not provided");
    return "";
  }

  return OnCallMemory::GetLinkText(m_context, it5->Get(2));
}

ScResult ImportTeamAgent::DoProgram(ScAction & action)
{
  std::vector<std::string> const names = CalendarParser::ParseRoster(GetFileContent(action));
  if (names.empty())
  {
    m_logger.Error("ImportTeamAgent: Team list is empty");
    return action.FinishWithError();
  }

  ScStructure result = m_context.GenerateStructure();
  int importedCount = 0;

  for (auto const & name : names)
  {
    bool created = false;
    ScAddr member = OnCallMemory::ResolveMember(m_context, name, created);
    result << member;

    if (created)
      importedCount++;
    else
      m_logger.Debug("ImportTeamAgent: Member already known: ", name);
  }

  action.SetResult(result);
  m_logger.Info("ImportTeamAgent: Team imported successfully: ", importedCount, " new members of ", names.size());
  return action.FinishSuccessfully();
}
