#include <gtest/gtest.h>

#include "errors.h"
#include "positions.h"
#include "test_helpers.h"

using namespace roster_test;

// 3 primary, 3 secondary, 4 days, 2 rooms: ids P0..P2 = 0..2, S0..S2 = 3..5.
class ScheduleStateTest : public ::testing::Test {
 protected:
  ScheduleState S = make_state(3, 3, 4, 2);
  const int P0 = 0, P1 = 1, P2 = 2, S0 = 3, S1 = 4, S2 = 5;
};

TEST_F(ScheduleStateTest, RanksFollowInputOrderPerPopulation) {
  EXPECT_EQ(S.person_count(), 6);
  EXPECT_EQ(S.primary_count, 3);
  EXPECT_EQ(rank_of(S, P2), 2);
  EXPECT_EQ(rank_of(S, S0), 0);
  EXPECT_TRUE(is_primary(S, P1));
  EXPECT_TRUE(is_secondary(S, S2));
  EXPECT_EQ(S.find("S1"), S1);
  EXPECT_EQ(S.find("nobody"), -1);
  EXPECT_EQ(S.cap[P0], 2);
  EXPECT_EQ(S.cap[P2], 3);
  EXPECT_EQ(S.cap[S0], 3);
}

TEST(ScheduleStateCtor, RejectsDuplicateNamesAcrossPopulations) {
  const RosterConfig cfg = resolve_config(2, 2, 4, 1);
  EXPECT_THROW(ScheduleState(make_people({"A", "B"}, Population::Primary),
                             make_people({"C", "A"}, Population::Secondary), cfg),
               ConfigError);
  EXPECT_THROW(ScheduleState(make_people({"A", ""}, Population::Primary),
                             make_people({"C", "D"}, Population::Secondary), cfg),
               ConfigError);
}

TEST_F(ScheduleStateTest, SeatPairPutsPrimaryFirstInMixedSlot) {
  S.seat_pair(0, 0, S1, P2);
  const Slot& s = S.slot(0, 0);
  EXPECT_EQ(s.primary, P2);
  EXPECT_EQ(s.secondary, S1);
  EXPECT_EQ(S.duty_count[P2], 1);
  EXPECT_EQ(S.room_on_day[S1][0], 0);
}

TEST_F(ScheduleStateTest, SamePopulationSlotSeatsTheSeniorFirst) {
  S.seat_pair(0, 0, P2, P0);
  EXPECT_EQ(S.slot(0, 0).primary, P0);
  S.seat_pair(0, 1, S2, S1);
  EXPECT_EQ(S.slot(0, 1).primary, S1);
  EXPECT_EQ(S.slot(0, 1).secondary, S2);
}

TEST_F(ScheduleStateTest, ResolvePositionsIsIdempotent) {
  S.seat_pair(1, 0, S0, P1);
  Slot copy = S.slot(1, 0);
  resolve_positions(S, copy);
  resolve_positions(S, copy);
  EXPECT_EQ(copy.primary, S.slot(1, 0).primary);
  EXPECT_EQ(copy.secondary, S.slot(1, 0).secondary);
}

TEST_F(ScheduleStateTest, ReplaceOccupantMovesCountsAndReorders) {
  S.seat_pair(2, 1, P0, S0);
  S.replace_occupant(2, 1, P0, S2);   // now two secondaries
  const Slot& s = S.slot(2, 1);
  EXPECT_EQ(s.primary, S0);
  EXPECT_EQ(s.secondary, S2);
  EXPECT_EQ(S.duty_count[P0], 0);
  EXPECT_EQ(S.duty_count[S2], 1);
  EXPECT_FALSE(is_assigned_on_day(S, P0, 2));
  EXPECT_EQ(S.room_on_day[S2][2], 1);
}

TEST_F(ScheduleStateTest, RoomRuleLooksBothWays) {
  S.seat_pair(1, 0, P0, S0);
  EXPECT_TRUE(was_in_room_yesterday(S, P0, 2, 0));
  EXPECT_FALSE(can_take_slot(S, P0, 2, 0));
  EXPECT_TRUE(can_take_slot(S, P0, 2, 1));
  // day 0 room 0 is next to the day-1 seat in room 0
  EXPECT_TRUE(in_room_on_adjacent_day(S, P0, 0, 0));
  EXPECT_FALSE(can_take_slot(S, P0, 0, 0));
  EXPECT_FALSE(can_take_slot(S, P0, 1, 1));   // already busy that day
  EXPECT_TRUE(can_take_slot(S, P1, 2, 0));
}

TEST_F(ScheduleStateTest, DemandAndDayCounters) {
  EXPECT_EQ(remaining_secondary_demand(S), 9);
  EXPECT_EQ(open_rooms_on_day(S, 0), 2);
  S.seat_pair(0, 0, S0, S1);
  S.seat_pair(0, 1, P0, S2);
  EXPECT_EQ(secondary_count_on_day(S, 0), 3);
  EXPECT_EQ(open_rooms_on_day(S, 0), 0);
  EXPECT_EQ(remaining_secondary_demand(S), 6);
  EXPECT_EQ(population_ids(S, Population::Secondary), (std::vector<int>{S0, S1, S2}));
}
