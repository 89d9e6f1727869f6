/*
 * This source file is part of an OSTIS project. For the latest info, see
 * http://ostis.net Distributed under the MIT License (See accompanying file
 * COPYING.MIT or copy at http://opensource.org/licenses/MIT)
 */

#pragma once

#include "onCallTypes.hpp"

#include <cstddef>

// Круговой указатель в составе. Индекс только растёт, остаток берётся при чтении.
class RotationCursor
{
public:
  explicit RotationCursor(Roster roster);

  Member const & Peek() const;
  void Advance();

  std::size_t Index() const;
  std::size_t RosterSize() const;

  // Чтение по произвольному индексу без сдвига курсора
  Member const & MemberAt(std::size_t index) const;

private:
  Roster m_roster;
  std::size_t m_index = 0;
};
