/*
 * This source file is part of an OSTIS project. For the latest info, see
 * http://ostis.net Distributed under the MIT License (See accompanying file
 * COPYING.MIT or copy at http://opensource.org/licenses/MIT)
 */

#include <gtest/gtest.h>

#include "rotation/fairnessTracker.hpp"
#include "rotation/rosterShuffle.hpp"
#include "rotation/rotationCursor.hpp"

#include <algorithm>
#include <stdexcept>

TEST(FairnessTrackerTest, CountersStartAtZero)
{
  FairnessTracker const fairness({"A", "B"});

  EXPECT_EQ(fairness.HolidayCount("A"), 0);
  EXPECT_EQ(fairness.PatchingCount("B"), 0);
  EXPECT_EQ(fairness.MinPatchingCount(), 0);
}

TEST(FairnessTrackerTest, RecordAssignmentIncrementsFlaggedCounters)
{
  FairnessTracker fairness({"A", "B"});

  fairness.RecordAssignment("A", true, true);
  fairness.RecordAssignment("A", false, true);
  fairness.RecordAssignment("A", false, false);

  EXPECT_EQ(fairness.HolidayCount("A"), 1);
  EXPECT_EQ(fairness.PatchingCount("A"), 2);
  EXPECT_EQ(fairness.MinPatchingCount(), 0);

  fairness.RecordAssignment("B", false, true);
  EXPECT_EQ(fairness.MinPatchingCount(), 1);
}

TEST(FairnessTrackerTest, UnknownMemberRejected)
{
  FairnessTracker fairness({"A"});

  EXPECT_THROW(fairness.RecordAssignment("Z", false, true), std::invalid_argument);
  EXPECT_EQ(fairness.PatchingCount("Z"), 0);
}

TEST(RotationCursorTest, PeekWrapsWhileIndexKeepsGrowing)
{
  RotationCursor cursor({"A", "B", "C"});

  EXPECT_EQ(cursor.Peek(), "A");
  for (int i = 0; i < 4; ++i)
    cursor.Advance();

  EXPECT_EQ(cursor.Index(), 4u);
  EXPECT_EQ(cursor.Peek(), "B");
  EXPECT_EQ(cursor.MemberAt(cursor.Index() + 1), "C");
  EXPECT_EQ(cursor.Index(), 4u);
}

TEST(RotationCursorTest, EmptyRosterRejected)
{
  EXPECT_THROW(RotationCursor cursor(Roster{}), std::invalid_argument);
}

TEST(RosterFactoryTest, IdentityShuffleKeepsOrderAndTrimsNames)
{
  Roster const roster = RosterFactory::MakeRoster({"  Carol ", "", "Alice", "   "}, RosterFactory::IdentityShuffle());

  EXPECT_EQ(roster, (Roster{"Carol", "Alice"}));
}

TEST(RosterFactoryTest, RandomShuffleIsPermutation)
{
  std::vector<std::string> const names{"A", "B", "C", "D", "E", "F"};

  Roster roster = RosterFactory::MakeRoster(names, RosterFactory::RandomShuffle());
  std::sort(roster.begin(), roster.end());

  EXPECT_EQ(roster, names);
}

TEST(RosterFactoryTest, InjectedShuffleApplied)
{
  Roster const roster = RosterFactory::MakeRoster({"A", "B", "C"}, [](Roster & members) {
    std::reverse(members.begin(), members.end());
  });

  EXPECT_EQ(roster, (Roster{"C", "B", "A"}));
}
