/*
 * This source file is part of an OSTIS project. For the latest info, see
 * http://ostis.net Distributed under the MIT License (See accompanying file
 * COPYING.MIT or copy at http://opensource.org/licenses/MIT)
 */

#pragma once

#include <sc-memory/sc_memory.hpp>

#include "rotation/onCallTypes.hpp"

#include <map>
#include <string>

// Общие операции агентов модуля над sc-памятью
class OnCallMemory
{
public:
  static std::string GetLinkText(ScMemoryContext & context, ScAddr const & link);

  // source => relation: link; пустая строка, если связи нет
  static std::string GetRelationText(ScMemoryContext & context, ScAddr const & source, ScAddr const & relation);

  static ScAddr GenerateTextLink(ScMemoryContext & context, std::string const & text);

  // source => relation: target, возвращает дугу
  static ScAddr GenerateRelation(
      ScMemoryContext & context,
      ScAddr const & source,
      ScAddr const & target,
      ScAddr const & relation);

  // Имя без пробелов по краям: ключ участника во всех индексах агентов
  static std::string GetMemberName(ScMemoryContext & context, ScAddr const & member);
  static ScAddr FindMemberByName(ScMemoryContext & context, std::string const & name);

  // Находит участника по имени или создаёт нового; created = true для нового
  static ScAddr ResolveMember(ScMemoryContext & context, std::string const & name, bool & created);

  // Все участники дежурств: имя -> узел
  static std::map<std::string, ScAddr> GetMembers(ScMemoryContext & context);

  // Даты из ссылок, входящих в класс (concept_holiday_date, concept_patching_date)
  static DateSet GetDatesOfClass(ScMemoryContext & context, ScAddr const & dateClass);

  static DateSet GetUnavailableDates(ScMemoryContext & context, ScAddr const & member);
};
