/*
 * This source file is part of an OSTIS project. For the latest info, see
 * http://ostis.net Distributed under the MIT License (See accompanying file
 * COPYING.MIT or copy at http://opensource.org/licenses/MIT)
 */

#include "rosterShuffle.hpp"
#include "utils/stringFormatter.hpp"

#include <algorithm>
#include <random>

Roster RosterFactory::MakeRoster(std::vector<std::string> const & names, RosterShuffle const & shuffle)
{
  Roster roster;
  for (auto const & name : names)
  {
    std::string member = StringFormatter::Trim(name);
    if (!member.empty())
      roster.push_back(member);
  }

  if (shuffle)
    shuffle(roster);
  return roster;
}

RosterShuffle RosterFactory::RandomShuffle()
{
  return [](Roster & roster) {
    std::random_device device;
    std::mt19937 generator(device());
    std::shuffle(roster.begin(), roster.end(), generator);
  };
}

RosterShuffle RosterFactory::IdentityShuffle()
{
  return [](Roster &) {};
}
