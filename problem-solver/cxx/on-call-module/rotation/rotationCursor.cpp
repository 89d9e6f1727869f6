/*
 * This source file is part of an OSTIS project. For the latest info, see
 * http://ostis.net Distributed under the MIT License (See accompanying file
 * COPYING.MIT or copy at http://opensource.org/licenses/MIT)
 */

#include "rotationCursor.hpp"

#include <stdexcept>
#include <utility>

RotationCursor::RotationCursor(Roster roster)
  : m_roster(std::move(roster))
{
  if (m_roster.empty())
    throw std::invalid_argument("Rotation cursor requires a non-empty roster");
}

Member const & RotationCursor::Peek() const
{
  return MemberAt(m_index);
}

void RotationCursor::Advance()
{
  m_index++;
}

std::size_t RotationCursor::Index() const
{
  return m_index;
}

std::size_t RotationCursor::RosterSize() const
{
  return m_roster.size();
}

Member const & RotationCursor::MemberAt(std::size_t index) const
{
  return m_roster[index % m_roster.size()];
}
