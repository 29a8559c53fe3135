#include <gtest/gtest.h>

#include <algorithm>

#include "test_helpers.h"
#include "validation.h"

using namespace roster_test;

static int count_kind(const std::vector<Violation>& v, ViolationKind k) {
  return (int)std::count_if(v.begin(), v.end(), [k](const Violation& x) { return x.kind == k; });
}

class ValidationTest : public ::testing::Test {
 protected:
  ScheduleState S = make_state(3, 3, 4, 2);
  const int P0 = 0, P1 = 1, P2 = 2, S0 = 3, S1 = 4, S2 = 5;
};

TEST_F(ValidationTest, EmptyGridReportsEverySlotAndTarget) {
  const auto v = validate_roster(S, {});
  EXPECT_EQ(count_kind(v, ViolationKind::UnfilledSlot), 8);
  EXPECT_EQ(count_kind(v, ViolationKind::TotalMismatch), 1);
  EXPECT_EQ(count_kind(v, ViolationKind::SecondaryTarget), 3);
  EXPECT_EQ(count_kind(v, ViolationKind::Seniority), 0);
  EXPECT_EQ(count_hard(v), 9);
}

TEST_F(ValidationTest, FlagsSameRoomOnConsecutiveDays) {
  S.seat_pair(0, 0, P0, S0);
  S.seat_pair(1, 0, P0, S1);
  const auto v = validate_roster(S, {});
  ASSERT_EQ(count_kind(v, ViolationKind::ConsecutiveRoom), 1);
  const auto it = std::find_if(v.begin(), v.end(), [](const Violation& x) {
    return x.kind == ViolationKind::ConsecutiveRoom;
  });
  EXPECT_EQ(it->person, "P0");
  EXPECT_EQ(it->day, 1);
}

TEST_F(ValidationTest, FlagsDoubleBookingAndIdenticalOccupants) {
  S.seat_pair(0, 0, P0, S0);
  S.slot(0, 1).primary = P0;      // written straight into the matrix
  S.slot(0, 1).secondary = S1;
  S.slot(1, 1).primary = P1;
  S.slot(1, 1).secondary = P1;
  const auto v = validate_roster(S, {});
  EXPECT_EQ(count_kind(v, ViolationKind::DoubleBooked), 1);
  EXPECT_EQ(count_kind(v, ViolationKind::IdenticalOccupants), 1);
}

TEST_F(ValidationTest, FlagsWrongPositionOrder) {
  S.slot(2, 0).primary = S2;
  S.slot(2, 0).secondary = P2;
  const auto v = validate_roster(S, {});
  EXPECT_EQ(count_kind(v, ViolationKind::PositionOrder), 1);
}

TEST_F(ValidationTest, CountsSeniorityPairsAndCeilings) {
  S.seat_pair(0, 0, P0, S0);
  S.seat_pair(1, 1, P0, S1);
  S.seat_pair(2, 0, P0, S2);   // P0: 3 duties, ceiling 2
  S.seat_pair(3, 1, P1, S0);   // P1: 1 duty
  const auto v = validate_roster(S, {});
  // (P0,P1), (P0,P2), (P1,P2)
  EXPECT_EQ(count_kind(v, ViolationKind::Seniority), 3);
  EXPECT_EQ(count_kind(v, ViolationKind::CeilingExceeded), 1);
}

TEST_F(ValidationTest, ReportsPinNotWorked) {
  S.seat_pair(0, 0, P0, S0);
  const auto v = validate_roster(S, {{"P0", 0}, {"P1", 3}});
  ASSERT_EQ(count_kind(v, ViolationKind::PinNotSatisfied), 1);
  const auto it = std::find_if(v.begin(), v.end(), [](const Violation& x) {
    return x.kind == ViolationKind::PinNotSatisfied;
  });
  EXPECT_EQ(it->person, "P1");
}

TEST_F(ValidationTest, NeverMutatesTheState) {
  S.seat_pair(0, 0, S1, P1);
  const std::vector<int> before = S.duty_count;
  const int primary_before = S.slot(0, 0).primary;
  validate_roster(S, {{"S1", 0}});
  EXPECT_EQ(S.duty_count, before);
  EXPECT_EQ(S.slot(0, 0).primary, primary_before);
}

TEST(ViolationKinds, HardAndSoftSplit) {
  EXPECT_TRUE(is_hard(ViolationKind::ConsecutiveRoom));
  EXPECT_TRUE(is_hard(ViolationKind::UnfilledSlot));
  EXPECT_FALSE(is_hard(ViolationKind::Seniority));
  EXPECT_FALSE(is_hard(ViolationKind::PinNotSatisfied));
  EXPECT_STREQ(violation_label(ViolationKind::SecondaryTarget), "secondary_target");
}
