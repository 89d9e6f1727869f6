/*
 * This source file is part of an OSTIS project. For the latest info, see
 * http://ostis.net Distributed under the MIT License (See accompanying file
 * COPYING.MIT or copy at http://opensource.org/licenses/MIT)
 */

#pragma once

#include <sc-memory/sc_agent.hpp>

#include "rotation/onCallTypes.hpp"

#include <optional>

// Выгрузка построенного расписания в CSV (ссылка с содержимым файла)
class ExportScheduleCsvAgent : public ScActionInitiatedAgent
{
public:
  ScAddr GetActionClass() const override;
  ScResult DoProgram(ScAction & action) override;

private:
  std::optional<WeekAssignment> ReadWeek(ScAddr const & weekNode);
  OnCallSchedule ReadSchedule(ScAddr const & scheduleAddr);
};
