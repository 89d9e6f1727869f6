/*
 * This source file is part of an OSTIS project. For the latest info, see
 * http://ostis.net Distributed under the MIT License (See accompanying file
 * COPYING.MIT or copy at http://opensource.org/licenses/MIT)
 */

#include "onCallMemory.hpp"
#include "calendarParser.hpp"
#include "keynodes/on-call-keynodes.hpp"
#include "stringFormatter.hpp"

#include <sc-agents-common/utils/IteratorUtils.hpp>

std::string OnCallMemory::GetLinkText(ScMemoryContext & context, ScAddr const & link)
{
  std::string content;
  if (!link.IsValid() || !context.GetLinkContent(link, content))
    return "";
  return content;
}

std::string OnCallMemory::GetRelationText(ScMemoryContext & context, ScAddr const & source, ScAddr const & relation)
{
  ScAddr const link = utils::IteratorUtils::getAnyByOutRelation(&context, source, relation);
  return GetLinkText(context, link);
}

ScAddr OnCallMemory::GenerateTextLink(ScMemoryContext & context, std::string const & text)
{
  ScAddr link = context.GenerateLink(ScType::ConstNodeLink);
  context.SetLinkContent(link, text);
  return link;
}

ScAddr OnCallMemory::GenerateRelation(
    ScMemoryContext & context,
    ScAddr const & source,
    ScAddr const & target,
    ScAddr const & relation)
{
  ScAddr arc = context.GenerateConnector(ScType::ConstCommonArc, source, target);
  context.GenerateConnector(ScType::ConstPermPosArc, relation, arc);
  return arc;
}

std::string OnCallMemory::GetMemberName(ScMemoryContext & context, ScAddr const & member)
{
  ScIterator5Ptr it = context.CreateIterator5(
      member, ScType::ConstCommonArc, ScType::ConstNodeLink, ScType::ConstPermPosArc, ScKeynodes::nrel_main_idtf);
  if (it->Next())
    return StringFormatter::Trim(GetLinkText(context, it->Get(2)));
  return "";
}

ScAddr OnCallMemory::FindMemberByName(ScMemoryContext & context, std::string const & name)
{
  ScIterator3Ptr it = context.CreateIterator3(
      OnCallKeynodes::concept_on_call_member, ScType::ConstPermPosArc, ScType::ConstNode);
  while (it->Next())
  {
    if (GetMemberName(context, it->Get(2)) == name)
      return it->Get(2);
  }
  return ScAddr();
}

ScAddr OnCallMemory::ResolveMember(ScMemoryContext & context, std::string const & name, bool & created)
{
  ScAddr member = FindMemberByName(context, name);
  created = !member.IsValid();
  if (!created)
    return member;

  member = context.GenerateNode(ScType::ConstNode);
  context.GenerateConnector(ScType::ConstPermPosArc, OnCallKeynodes::concept_on_call_member, member);

  ScAddr nameLink = GenerateTextLink(context, name);
  GenerateRelation(context, member, nameLink, ScKeynodes::nrel_main_idtf);
  return member;
}

std::map<std::string, ScAddr> OnCallMemory::GetMembers(ScMemoryContext & context)
{
  std::map<std::string, ScAddr> members;
  ScIterator3Ptr it = context.CreateIterator3(
      OnCallKeynodes::concept_on_call_member, ScType::ConstPermPosArc, ScType::ConstNode);
  while (it->Next())
  {
    std::string name = GetMemberName(context, it->Get(2));
    if (!name.empty())
      members.emplace(name, it->Get(2));
  }
  return members;
}

DateSet OnCallMemory::GetDatesOfClass(ScMemoryContext & context, ScAddr const & dateClass)
{
  DateSet dates;
  ScIterator3Ptr it = context.CreateIterator3(dateClass, ScType::ConstPermPosArc, ScType::ConstNodeLink);
  while (it->Next())
  {
    auto const day = CalendarParser::ParseIsoDate(GetLinkText(context, it->Get(2)));
    if (day)
      dates.insert(*day);
  }
  return dates;
}

DateSet OnCallMemory::GetUnavailableDates(ScMemoryContext & context, ScAddr const & member)
{
  DateSet dates;
  ScIterator5Ptr it = context.CreateIterator5(
      member,
      ScType::ConstCommonArc,
      ScType::ConstNodeLink,
      ScType::ConstPermPosArc,
      OnCallKeynodes::nrel_unavailable_on);
  while (it->Next())
  {
    auto const day = CalendarParser::ParseIsoDate(GetLinkText(context, it->Get(2)));
    if (day)
      dates.insert(*day);
  }
  return dates;
}
