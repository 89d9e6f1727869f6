/*
 * This source file is part of an OSTIS project. For the latest info, see
 * http://ostis.net Distributed under the MIT License (See accompanying file
 * COPYING.MIT or copy at http://opensource.org/licenses/MIT)
 */

#include "stringFormatter.hpp"

#include <cctype>
#include <sstream>

void StringFormatter::Ltrim(std::string & str)
{
  std::size_t start_pos = 0;
  while (start_pos < str.size() && std::isspace(static_cast<unsigned char>(str[start_pos])))
  {
    start_pos++;
  }
  str.erase(0, start_pos);
}

void StringFormatter::Rtrim(std::string & str)
{
  std::size_t length = str.size();
  while (length > 0 && std::isspace(static_cast<unsigned char>(str[length - 1])))
  {
    length--;
  }
  str.resize(length);
}

std::string StringFormatter::Trim(std::string str)
{
  Ltrim(str);
  Rtrim(str);
  return str;
}

std::vector<std::string> StringFormatter::ParseLines(std::string const & text)
{
  std::vector<std::string> lines;
  std::istringstream stream(text);
  std::string line;
  while (std::getline(stream, line))
  {
    line = Trim(line);
    if (line.empty() || line.front() == '#')
      continue;
    lines.push_back(line);
  }
  return lines;
}
