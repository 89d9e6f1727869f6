/*
 * This source file is part of an OSTIS project. For the latest info, see
 * http://ostis.net Distributed under the MIT License (See accompanying file
 * COPYING.MIT or copy at http://opensource.org/licenses/MIT)
 */

#include <sc-memory/test/sc_test.hpp>
#include <sc-memory/sc_memory.hpp>

#include "agents/onCallScheduleAgent.hpp"
#include "keynodes/on-call-keynodes.hpp"
#include "utils/TestUtils.hpp"

#include <map>
#include <set>

using OnCallScheduleAgentTest = ScMemoryTest;

namespace
{

void CreateTeam(ScAgentContext & ctx)
{
  TestUtils::CreateMember(ctx, "Alice");
  TestUtils::CreateMember(ctx, "Bob");
  TestUtils::CreateMember(ctx, "Carol");
}

// Действие с фиксированным порядком ротации (по алфавиту)
ScAddr CreateScheduleAction(ScAgentContext & ctx, std::string const & startDate, std::string const & weeks)
{
  ScAddr action = TestUtils::CreateAction(ctx, OnCallKeynodes::action_build_on_call_schedule);
  TestUtils::AddActionText(ctx, action, OnCallKeynodes::nrel_start_date, startDate);
  TestUtils::AddActionText(ctx, action, OnCallKeynodes::nrel_weeks_count, weeks);
  TestUtils::AddActionText(ctx, action, OnCallKeynodes::nrel_shuffle_roster, "false");
  return action;
}

}  // namespace

// ====== БАЗОВЫЕ ТЕСТЫ ======

TEST_F(OnCallScheduleAgentTest, BuildSchedule_RoundRobin)
{
  ScAgentContext & ctx = *m_ctx;

  ctx.SubscribeAgent<OnCallScheduleAgent>();
  CreateTeam(ctx);

  ScAction scAction = ctx.ConvertToAction(CreateScheduleAction(ctx, "2024-01-03", "4"));
  EXPECT_TRUE(scAction.InitiateAndWait(10000));
  EXPECT_TRUE(scAction.IsFinishedSuccessfully());

  ScAddr schedule = TestUtils::FindSchedule(ctx);
  ASSERT_TRUE(schedule.IsValid());
  EXPECT_EQ(TestUtils::CountWeeks(ctx, schedule), 4);

  std::vector<std::string> const expected{"Alice", "Bob", "Carol", "Alice"};
  for (int weekNumber = 1; weekNumber <= 4; ++weekNumber)
  {
    ScAddr week = TestUtils::FindWeek(ctx, schedule, weekNumber);
    ASSERT_TRUE(week.IsValid());
    EXPECT_EQ(TestUtils::GetWeekMemberName(ctx, week), expected[weekNumber - 1]);
  }

  // Начало нормализуется к понедельнику
  ScAddr firstWeek = TestUtils::FindWeek(ctx, schedule, 1);
  EXPECT_EQ(TestUtils::GetRelationText(ctx, firstWeek, OnCallKeynodes::nrel_week_start), "2024-01-01");
  EXPECT_EQ(TestUtils::GetRelationText(ctx, firstWeek, OnCallKeynodes::nrel_week_end), "2024-01-07");

  ScStructure result = scAction.GetResult();
  EXPECT_TRUE(result.HasElement(schedule));
  EXPECT_TRUE(result.HasElement(firstWeek));

  ctx.UnsubscribeAgent<OnCallScheduleAgent>();
}

TEST_F(OnCallScheduleAgentTest, BuildSchedule_NoMembers)
{
  ScAgentContext & ctx = *m_ctx;

  ctx.SubscribeAgent<OnCallScheduleAgent>();

  ScAction scAction = ctx.ConvertToAction(CreateScheduleAction(ctx, "2024-01-01", "4"));
  EXPECT_TRUE(scAction.InitiateAndWait(5000));
  EXPECT_TRUE(scAction.IsFinishedWithError());
  EXPECT_FALSE(TestUtils::FindSchedule(ctx).IsValid());

  ctx.UnsubscribeAgent<OnCallScheduleAgent>();
}

TEST_F(OnCallScheduleAgentTest, BuildSchedule_NegativeWeeks)
{
  ScAgentContext & ctx = *m_ctx;

  ctx.SubscribeAgent<OnCallScheduleAgent>();
  CreateTeam(ctx);

  ScAction scAction = ctx.ConvertToAction(CreateScheduleAction(ctx, "2024-01-01", "-2"));
  EXPECT_TRUE(scAction.InitiateAndWait(5000));
  EXPECT_TRUE(scAction.IsFinishedWithError());
  EXPECT_FALSE(TestUtils::FindSchedule(ctx).IsValid());

  ctx.UnsubscribeAgent<OnCallScheduleAgent>();
}

TEST_F(OnCallScheduleAgentTest, BuildSchedule_DefaultParameters)
{
  ScAgentContext & ctx = *m_ctx;

  ctx.SubscribeAgent<OnCallScheduleAgent>();
  CreateTeam(ctx);

  ScAddr action = TestUtils::CreateAction(ctx, OnCallKeynodes::action_build_on_call_schedule);
  TestUtils::AddActionText(ctx, action, OnCallKeynodes::nrel_weeks_count, "twelve");

  ScAction scAction = ctx.ConvertToAction(action);
  EXPECT_TRUE(scAction.InitiateAndWait(10000));
  EXPECT_TRUE(scAction.IsFinishedSuccessfully());

  ScAddr schedule = TestUtils::FindSchedule(ctx);
  ASSERT_TRUE(schedule.IsValid());
  EXPECT_EQ(TestUtils::CountWeeks(ctx, schedule), 12);

  // Без ограничений каждый дежурит 4 недели при любом порядке
  std::map<std::string, int> weeksPerMember;
  for (int weekNumber = 1; weekNumber <= 12; ++weekNumber)
    weeksPerMember[TestUtils::GetWeekMemberName(ctx, TestUtils::FindWeek(ctx, schedule, weekNumber))]++;

  EXPECT_EQ(weeksPerMember, (std::map<std::string, int>{{"Alice", 4}, {"Bob", 4}, {"Carol", 4}}));

  ctx.UnsubscribeAgent<OnCallScheduleAgent>();
}

TEST_F(OnCallScheduleAgentTest, BuildSchedule_HorizonBeyondCalendarRange)
{
  ScAgentContext & ctx = *m_ctx;

  ctx.SubscribeAgent<OnCallScheduleAgent>();
  CreateTeam(ctx);

  ScAction scAction = ctx.ConvertToAction(CreateScheduleAction(ctx, "2024-01-01", "500000"));
  EXPECT_TRUE(scAction.InitiateAndWait(10000));
  EXPECT_TRUE(scAction.IsFinishedWithError());
  EXPECT_FALSE(TestUtils::FindSchedule(ctx).IsValid());

  ctx.UnsubscribeAgent<OnCallScheduleAgent>();
}

TEST_F(OnCallScheduleAgentTest, BuildSchedule_WeeksCountWithTrailingTextUsesDefault)
{
  ScAgentContext & ctx = *m_ctx;

  ctx.SubscribeAgent<OnCallScheduleAgent>();
  CreateTeam(ctx);

  ScAction scAction = ctx.ConvertToAction(CreateScheduleAction(ctx, "2024-01-01", "3abc"));
  EXPECT_TRUE(scAction.InitiateAndWait(10000));
  EXPECT_TRUE(scAction.IsFinishedSuccessfully());

  ScAddr schedule = TestUtils::FindSchedule(ctx);
  ASSERT_TRUE(schedule.IsValid());
  EXPECT_EQ(TestUtils::CountWeeks(ctx, schedule), 12);

  ctx.UnsubscribeAgent<OnCallScheduleAgent>();
}

TEST_F(OnCallScheduleAgentTest, BuildSchedule_NonAsciiShuffleFlagUsesDefault)
{
  ScAgentContext & ctx = *m_ctx;

  ctx.SubscribeAgent<OnCallScheduleAgent>();
  CreateTeam(ctx);

  ScAddr action = TestUtils::CreateAction(ctx, OnCallKeynodes::action_build_on_call_schedule);
  TestUtils::AddActionText(ctx, action, OnCallKeynodes::nrel_start_date, "2024-01-01");
  TestUtils::AddActionText(ctx, action, OnCallKeynodes::nrel_weeks_count, "3");
  TestUtils::AddActionText(ctx, action, OnCallKeynodes::nrel_shuffle_roster, "Да");

  ScAction scAction = ctx.ConvertToAction(action);
  EXPECT_TRUE(scAction.InitiateAndWait(10000));
  EXPECT_TRUE(scAction.IsFinishedSuccessfully());

  ScAddr schedule = TestUtils::FindSchedule(ctx);
  std::set<std::string> assigned;
  for (int weekNumber = 1; weekNumber <= 3; ++weekNumber)
    assigned.insert(TestUtils::GetWeekMemberName(ctx, TestUtils::FindWeek(ctx, schedule, weekNumber)));

  EXPECT_EQ(assigned, (std::set<std::string>{"Alice", "Bob", "Carol"}));

  ctx.UnsubscribeAgent<OnCallScheduleAgent>();
}

// ====== ТЕСТЫ КАЛЕНДАРЯ ======

TEST_F(OnCallScheduleAgentTest, BuildSchedule_HolidayAndPatchingWeeksMarked)
{
  ScAgentContext & ctx = *m_ctx;

  ctx.SubscribeAgent<OnCallScheduleAgent>();
  CreateTeam(ctx);
  TestUtils::AddDateToClass(ctx, OnCallKeynodes::concept_holiday_date, "2024-01-10");
  TestUtils::AddDateToClass(ctx, OnCallKeynodes::concept_patching_date, "2024-01-16");

  ScAction scAction = ctx.ConvertToAction(CreateScheduleAction(ctx, "2024-01-01", "3"));
  EXPECT_TRUE(scAction.InitiateAndWait(10000));
  EXPECT_TRUE(scAction.IsFinishedSuccessfully());

  ScAddr schedule = TestUtils::FindSchedule(ctx);
  ScAddr secondWeek = TestUtils::FindWeek(ctx, schedule, 2);
  ScAddr thirdWeek = TestUtils::FindWeek(ctx, schedule, 3);

  EXPECT_TRUE(ctx.CheckConnector(OnCallKeynodes::concept_holiday_week, secondWeek, ScType::ConstPermPosArc));
  EXPECT_FALSE(ctx.CheckConnector(OnCallKeynodes::concept_patching_week, secondWeek, ScType::ConstPermPosArc));
  EXPECT_TRUE(ctx.CheckConnector(OnCallKeynodes::concept_patching_week, thirdWeek, ScType::ConstPermPosArc));

  ScAddr bob = TestUtils::FindMemberByName(ctx, "Bob");
  ScAddr carol = TestUtils::FindMemberByName(ctx, "Carol");
  EXPECT_EQ(TestUtils::GetRelationText(ctx, bob, OnCallKeynodes::nrel_holiday_weeks_count), "1");
  EXPECT_EQ(TestUtils::GetRelationText(ctx, bob, OnCallKeynodes::nrel_patching_weeks_count), "0");
  EXPECT_EQ(TestUtils::GetRelationText(ctx, carol, OnCallKeynodes::nrel_patching_weeks_count), "1");

  ctx.UnsubscribeAgent<OnCallScheduleAgent>();
}

TEST_F(OnCallScheduleAgentTest, BuildSchedule_UnassignedWeek)
{
  ScAgentContext & ctx = *m_ctx;

  ctx.SubscribeAgent<OnCallScheduleAgent>();
  ScAddr alice = TestUtils::CreateMember(ctx, "Alice");
  TestUtils::AddUnavailableDate(ctx, alice, "2024-01-05");

  ScAction scAction = ctx.ConvertToAction(CreateScheduleAction(ctx, "2024-01-01", "2"));
  EXPECT_TRUE(scAction.InitiateAndWait(10000));
  EXPECT_TRUE(scAction.IsFinishedSuccessfully());

  ScAddr schedule = TestUtils::FindSchedule(ctx);
  ScAddr firstWeek = TestUtils::FindWeek(ctx, schedule, 1);
  ScAddr secondWeek = TestUtils::FindWeek(ctx, schedule, 2);

  EXPECT_TRUE(ctx.CheckConnector(OnCallKeynodes::concept_unassigned_week, firstWeek, ScType::ConstPermPosArc));
  EXPECT_EQ(TestUtils::GetWeekMemberName(ctx, firstWeek), "");
  EXPECT_FALSE(ctx.CheckConnector(OnCallKeynodes::concept_unassigned_week, secondWeek, ScType::ConstPermPosArc));
  EXPECT_EQ(TestUtils::GetWeekMemberName(ctx, secondWeek), "Alice");

  ctx.UnsubscribeAgent<OnCallScheduleAgent>();
}

TEST_F(OnCallScheduleAgentTest, BuildSchedule_PaddedMemberNameKeepsUnavailability)
{
  ScAgentContext & ctx = *m_ctx;

  ctx.SubscribeAgent<OnCallScheduleAgent>();
  TestUtils::CreateMember(ctx, "Alice");
  ScAddr bob = TestUtils::CreateMember(ctx, " Bob ");
  TestUtils::AddUnavailableDate(ctx, bob, "2024-01-10");

  ScAction scAction = ctx.ConvertToAction(CreateScheduleAction(ctx, "2024-01-01", "3"));
  EXPECT_TRUE(scAction.InitiateAndWait(10000));
  EXPECT_TRUE(scAction.IsFinishedSuccessfully());

  ScAddr schedule = TestUtils::FindSchedule(ctx);
  ASSERT_TRUE(schedule.IsValid());

  // Bob недоступен на второй неделе, очередь переходит к Alice
  ScAddr secondWeek = TestUtils::FindWeek(ctx, schedule, 2);
  EXPECT_EQ(TestUtils::GetWeekMemberName(ctx, secondWeek), "Alice");

  ScAddr thirdWeek = TestUtils::FindWeek(ctx, schedule, 3);
  EXPECT_EQ(TestUtils::GetWeekMemberName(ctx, thirdWeek), " Bob ");
  EXPECT_EQ(TestUtils::GetRelationText(ctx, bob, OnCallKeynodes::nrel_holiday_weeks_count), "0");

  ctx.UnsubscribeAgent<OnCallScheduleAgent>();
}
