/*
 * This source file is part of an OSTIS project. For the latest info, see
 * http://ostis.net Distributed under the MIT License (See accompanying file
 * COPYING.MIT or copy at http://opensource.org/licenses/MIT)
 */

#pragma once

#include "onCallTypes.hpp"

#include <string>
#include <vector>

class WeekWindowUtils
{
public:
  // 1 = понедельник ... 7 = воскресенье
  static int IsoWeekday(boost::gregorian::date const & day);
  static WeekWindow ForDate(boost::gregorian::date const & day);
  static WeekWindow Next(WeekWindow const & window);
  static std::vector<boost::gregorian::date> Days(WeekWindow const & window);
  static std::string ToIsoString(boost::gregorian::date const & day);
};
