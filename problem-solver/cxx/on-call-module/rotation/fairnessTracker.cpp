/*
 * This source file is part of an OSTIS project. For the latest info, see
 * http://ostis.net Distributed under the MIT License (See accompanying file
 * COPYING.MIT or copy at http://opensource.org/licenses/MIT)
 */

#include "fairnessTracker.hpp"

#include <algorithm>
#include <stdexcept>

FairnessTracker::FairnessTracker(Roster const & roster)
{
  for (auto const & member : roster)
    m_counters[member];
}

int FairnessTracker::HolidayCount(Member const & member) const
{
  auto const it = m_counters.find(member);
  return it == m_counters.end() ? 0 : it->second.holidayCount;
}

int FairnessTracker::PatchingCount(Member const & member) const
{
  auto const it = m_counters.find(member);
  return it == m_counters.end() ? 0 : it->second.patchingCount;
}

int FairnessTracker::MinPatchingCount() const
{
  if (m_counters.empty())
    return 0;

  auto const it = std::min_element(
      m_counters.begin(), m_counters.end(), [](auto const & a, auto const & b) {
        return a.second.patchingCount < b.second.patchingCount;
      });
  return it->second.patchingCount;
}

void FairnessTracker::RecordAssignment(Member const & member, bool hasHoliday, bool hasPatching)
{
  auto const it = m_counters.find(member);
  if (it == m_counters.end())
    throw std::invalid_argument("Member is not in roster: " + member);

  if (hasHoliday)
    it->second.holidayCount++;
  if (hasPatching)
    it->second.patchingCount++;
}
