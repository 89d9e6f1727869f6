/*
 * This source file is part of an OSTIS project. For the latest info, see
 * http://ostis.net Distributed under the MIT License (See accompanying file
 * COPYING.MIT or copy at http://opensource.org/licenses/MIT)
 */

#include "weekAssigner.hpp"

WeekAssigner::WeekAssigner(CalendarSet const & calendar, FairnessTracker & fairness, RotationCursor & cursor)
  : m_calendar(calendar)
  , m_fairness(fairness)
  , m_cursor(cursor)
{
}

bool WeekAssigner::CanTakeHoliday(Member const & member, bool hasHoliday) const
{
  return !hasHoliday || m_fairness.HolidayCount(member) < 1;
}

bool WeekAssigner::HasFairerAlternative(
    std::size_t startIndex,
    WeekWindow const & window,
    bool hasHoliday,
    int minPatching) const
{
  std::size_t const rosterSize = m_cursor.RosterSize();
  for (std::size_t offset = 0; offset < rosterSize; ++offset)
  {
    Member const & other = m_cursor.MemberAt(startIndex + offset);
    if (m_fairness.PatchingCount(other) == minPatching && m_calendar.MemberAvailableForWeek(other, window)
        && CanTakeHoliday(other, hasHoliday))
      return true;
  }
  return false;
}

bool WeekAssigner::IsEligible(
    Member const & candidate,
    WeekWindow const & window,
    bool hasHoliday,
    bool hasPatching,
    int minPatching) const
{
  if (!m_calendar.MemberAvailableForWeek(candidate, window))
    return false;

  if (!CanTakeHoliday(candidate, hasHoliday))
    return false;

  if (hasPatching && m_fairness.PatchingCount(candidate) > minPatching)
  {
    // Отдаём неделю более справедливому кандидату, который встретится дальше в этом же проходе
    if (HasFairerAlternative(m_cursor.Index(), window, hasHoliday, minPatching))
      return false;
  }

  return true;
}

std::optional<Member> WeekAssigner::Assign(WeekWindow const & window, bool hasHoliday, bool hasPatching)
{
  int const minPatching = m_fairness.MinPatchingCount();

  for (std::size_t attempt = 0; attempt < m_cursor.RosterSize(); ++attempt)
  {
    Member const candidate = m_cursor.Peek();
    bool const eligible = IsEligible(candidate, window, hasHoliday, hasPatching, minPatching);
    m_cursor.Advance();

    if (eligible)
    {
      m_fairness.RecordAssignment(candidate, hasHoliday, hasPatching);
      return candidate;
    }
  }

  return std::nullopt;
}
