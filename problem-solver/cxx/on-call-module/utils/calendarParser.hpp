/*
 * This source file is part of an OSTIS project. For the latest info, see
 * http://ostis.net Distributed under the MIT License (See accompanying file
 * COPYING.MIT or copy at http://opensource.org/licenses/MIT)
 */

#pragma once

#include "rotation/onCallTypes.hpp"

#include <optional>
#include <string>
#include <vector>

struct DateListParseResult
{
  DateSet dates;
  std::vector<std::string> rejectedLines;
};

struct UnavailabilityParseResult
{
  UnavailabilityIndex index;
  std::vector<std::string> rejectedLines;
};

// Разбор текстовых списков: участники, даты YYYY-MM-DD, строки "Имя,YYYY-MM-DD".
// Некорректные строки пропускаются и возвращаются в rejectedLines.
class CalendarParser
{
public:
  // Время после даты ("2024-12-25 10:00", "2024-12-25T10:00") отбрасывается
  static std::optional<boost::gregorian::date> ParseIsoDate(std::string const & token);

  static std::vector<std::string> ParseRoster(std::string const & text);
  static DateListParseResult ParseDateList(std::string const & text);
  static UnavailabilityParseResult ParseUnavailability(std::string const & text);
};
