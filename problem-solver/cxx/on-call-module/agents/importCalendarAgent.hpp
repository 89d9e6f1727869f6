/*
 * This source file is part of an OSTIS project. For the latest info, see
 * http://ostis.net Distributed under the MIT License (See accompanying file
 * COPYING.MIT or copy at http://opensource.org/licenses/MIT)
 */

#pragma once

#include <sc-memory/sc_agent.hpp>

#include "rotation/onCallTypes.hpp"

#include <string>
#include <vector>

// Импорт праздников, дней патчинга и недоступности участников.
// Каждый из трёх файлов необязателен, но хотя бы один должен быть передан.
class ImportCalendarAgent : public ScActionInitiatedAgent
{
public:
  ScAddr GetActionClass() const override;
  ScResult DoProgram(ScAction & action) override;

private:
  bool GetContent(ScAction & action, ScAddr const & relation, std::string & content);

  void LogRejectedLines(std::string const & source, std::vector<std::string> const & lines);

  int ImportDates(DateSet const & dates, ScAddr const & dateClass, ScStructure & result);
  int ImportUnavailability(UnavailabilityIndex const & index, ScStructure & result);
};
