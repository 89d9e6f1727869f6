/*
 * This source file is part of an OSTIS project. For the latest info, see
 * http://ostis.net Distributed under the MIT License (See accompanying file
 * COPYING.MIT or copy at http://opensource.org/licenses/MIT)
 */

#pragma once

#include "rotation/onCallTypes.hpp"

#include <string>
#include <vector>

class ScheduleFormatter
{
public:
  static inline std::string const CSV_HEADER = "Week,Start Date,End Date,Assigned To,Has Holiday,Has Patching";

  static std::string AssignedName(WeekAssignment const & week);

  // Заголовок + по строке на неделю, разделитель строк '\n'
  static std::string FormatCsv(OnCallSchedule const & schedule);

  // Строки таблицы для вывода в лог: заголовок, разделитель, недели
  static std::vector<std::string> FormatTableRows(OnCallSchedule const & schedule);
};
