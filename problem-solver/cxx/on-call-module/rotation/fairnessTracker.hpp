/*
 * This source file is part of an OSTIS project. For the latest info, see
 * http://ostis.net Distributed under the MIT License (See accompanying file
 * COPYING.MIT or copy at http://opensource.org/licenses/MIT)
 */

#pragma once

#include "onCallTypes.hpp"

#include <map>

// Счётчики праздничных и патч-недель по каждому участнику.
// Только растут; меняются исключительно через RecordAssignment.
class FairnessTracker
{
public:
  explicit FairnessTracker(Roster const & roster);

  int HolidayCount(Member const & member) const;
  int PatchingCount(Member const & member) const;

  // Минимум по всему составу, а не только по доступным участникам
  int MinPatchingCount() const;

  void RecordAssignment(Member const & member, bool hasHoliday, bool hasPatching);

private:
  struct Counters
  {
    int holidayCount = 0;
    int patchingCount = 0;
  };

  std::map<Member, Counters> m_counters;
};
