/*
 * This source file is part of an OSTIS project. For the latest info, see
 * http://ostis.net Distributed under the MIT License (See accompanying file
 * COPYING.MIT or copy at http://opensource.org/licenses/MIT)
 */

#pragma once

#include "onCallTypes.hpp"

#include <functional>
#include <string>
#include <vector>

// Перестановка состава; применяется один раз при загрузке
using RosterShuffle = std::function<void(Roster &)>;

class RosterFactory
{
public:
  // Имена обрезаются, пустые отбрасываются, затем применяется shuffle
  static Roster MakeRoster(std::vector<std::string> const & names, RosterShuffle const & shuffle);

  static RosterShuffle RandomShuffle();
  static RosterShuffle IdentityShuffle();
};
