/*
 * This source file is part of an OSTIS project. For the latest info, see
 * http://ostis.net Distributed under the MIT License (See accompanying file
 * COPYING.MIT or copy at http://opensource.org/licenses/MIT)
 */

#include "calendarParser.hpp"
#include "stringFormatter.hpp"

#include <regex>
#include <stdexcept>

std::optional<boost::gregorian::date> CalendarParser::ParseIsoDate(std::string const & token)
{
  static std::regex const isoDate(R"((\d{4})-(\d{2})-(\d{2})(?:[T ].*)?)");

  std::string const trimmed = StringFormatter::Trim(token);
  std::smatch match;
  if (!std::regex_match(trimmed, match, isoDate))
    return std::nullopt;

  try
  {
    return boost::gregorian::date(
        static_cast<unsigned short>(std::stoi(match[1].str())),
        static_cast<unsigned short>(std::stoi(match[2].str())),
        static_cast<unsigned short>(std::stoi(match[3].str())));
  }
  catch (std::out_of_range const &)
  {
    // boost::gregorian::bad_year / bad_month / bad_day_of_month
    return std::nullopt;
  }
}

std::vector<std::string> CalendarParser::ParseRoster(std::string const & text)
{
  return StringFormatter::ParseLines(text);
}

DateListParseResult CalendarParser::ParseDateList(std::string const & text)
{
  DateListParseResult result;
  for (auto const & line : StringFormatter::ParseLines(text))
  {
    auto const day = ParseIsoDate(line);
    if (day)
      result.dates.insert(*day);
    else
      result.rejectedLines.push_back(line);
  }
  return result;
}

UnavailabilityParseResult CalendarParser::ParseUnavailability(std::string const & text)
{
  UnavailabilityParseResult result;
  for (auto const & line : StringFormatter::ParseLines(text))
  {
    auto const comma = line.find(',');
    if (comma == std::string::npos)
    {
      result.rejectedLines.push_back(line);
      continue;
    }

    std::string const name = StringFormatter::Trim(line.substr(0, comma));
    auto const day = ParseIsoDate(line.substr(comma + 1));
    if (name.empty() || !day)
    {
      result.rejectedLines.push_back(line);
      continue;
    }

    result.index[name].insert(*day);
  }
  return result;
}
