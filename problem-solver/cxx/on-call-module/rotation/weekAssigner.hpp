/*
 * This source file is part of an OSTIS project. For the latest info, see
 * http://ostis.net Distributed under the MIT License (See accompanying file
 * COPYING.MIT or copy at http://opensource.org/licenses/MIT)
 */

#pragma once

#include "calendarSet.hpp"
#include "fairnessTracker.hpp"
#include "rotationCursor.hpp"

#include <cstddef>
#include <optional>

// Выбор дежурного на одну неделю.
//
// Кандидаты перебираются по кругу от текущей позиции курсора, не более чем
// |состав| попыток. Курсор сдвигается на каждой попытке, в том числе на
// отклонённых, поэтому неделя без дежурного сдвигает его ровно на |состав|.
//
// Фильтры кандидата:
//  - недоступность в любой из 7 дней недели;
//  - не более одной праздничной недели на участника;
//  - патч-неделя уходит участнику с минимальным числом патч-недель, если
//    такой участник вообще может взять эту неделю (см. HasFairerAlternative).
class WeekAssigner
{
public:
  WeekAssigner(CalendarSet const & calendar, FairnessTracker & fairness, RotationCursor & cursor);

  // Пустой результат означает, что неделя осталась без дежурного
  std::optional<Member> Assign(WeekWindow const & window, bool hasHoliday, bool hasPatching);

  // Просмотр всего состава от startIndex по кругу; курсор не сдвигается.
  // true, если есть участник с patchingCount == minPatching, доступный всю
  // неделю и не исчерпавший лимит праздников (когда неделя праздничная).
  bool HasFairerAlternative(
      std::size_t startIndex,
      WeekWindow const & window,
      bool hasHoliday,
      int minPatching) const;

private:
  bool CanTakeHoliday(Member const & member, bool hasHoliday) const;
  bool IsEligible(Member const & candidate, WeekWindow const & window, bool hasHoliday, bool hasPatching, int minPatching)
      const;

  CalendarSet const & m_calendar;
  FairnessTracker & m_fairness;
  RotationCursor & m_cursor;
};
