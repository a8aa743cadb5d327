// SandCastle Gameplay Tests
// ground_violation_test.cpp - Tests for ground contact rules and the audit log

#include <gtest/gtest.h>

#include <sandcastle/gameplay/ground_violation.hpp>

namespace sandcastle::gameplay {
namespace {

class GroundViolationLogTest : public ::testing::Test {
protected:
    GroundViolationLog log{1};
};

// ============================================================================
// Verdicts
// ============================================================================

TEST_F(GroundViolationLogTest, BaseTierIsAllowed) {
    EXPECT_EQ(log.assess(4, 1, false), GroundContactVerdict::Allowed);
}

TEST_F(GroundViolationLogTest, NonBaseTierIsViolation) {
    EXPECT_EQ(log.assess(4, 2, false), GroundContactVerdict::Violation);
    EXPECT_EQ(log.assess(5, 6, false), GroundContactVerdict::Violation);
}

TEST_F(GroundViolationLogTest, ExemptPieceIsExemptAtAnyTier) {
    log.set_exempt_piece(3);
    EXPECT_EQ(log.get_exempt_piece(), 3u);
    EXPECT_EQ(log.assess(3, 5, false), GroundContactVerdict::Exempt);
    EXPECT_EQ(log.assess(4, 5, false), GroundContactVerdict::Violation);
}

TEST_F(GroundViolationLogTest, ValidPlacementIsNotRejudged) {
    EXPECT_EQ(log.assess(4, 3, true), GroundContactVerdict::PlacedValid);
}

TEST_F(GroundViolationLogTest, SecondContactIsAlreadyPenalized) {
    ASSERT_TRUE(log.record(4, 50, 1000));
    EXPECT_EQ(log.assess(4, 2, false), GroundContactVerdict::AlreadyPenalized);
}

TEST_F(GroundViolationLogTest, CustomBaseTier) {
    GroundViolationLog shifted(2);
    EXPECT_EQ(shifted.assess(1, 2, false), GroundContactVerdict::Allowed);
    EXPECT_EQ(shifted.assess(1, 3, false), GroundContactVerdict::Violation);
}

// ============================================================================
// Audit Log
// ============================================================================

TEST_F(GroundViolationLogTest, RecordIsIdempotentPerPiece) {
    EXPECT_TRUE(log.record(4, 50, 1000));
    EXPECT_FALSE(log.record(4, 50, 2000));

    ASSERT_EQ(log.size(), 1u);
    EXPECT_EQ(log.records()[0], (GroundViolationRecord{4, 50, 1000}));
    EXPECT_TRUE(log.has_penalized(4));
    EXPECT_FALSE(log.has_penalized(5));
}

TEST_F(GroundViolationLogTest, InvalidPieceIsNeverRecorded) {
    EXPECT_FALSE(log.record(INVALID_PIECE, 50, 1000));
    EXPECT_EQ(log.size(), 0u);
}

TEST_F(GroundViolationLogTest, RecordsKeepInsertionOrder) {
    log.record(7, 50, 3000);
    log.record(2, 40, 1000);

    ASSERT_EQ(log.size(), 2u);
    EXPECT_EQ(log.records()[0].piece_id, 7u);
    EXPECT_EQ(log.records()[1].piece_id, 2u);
    EXPECT_EQ(log.total_penalty(), 90);
}

TEST_F(GroundViolationLogTest, ResetClearsLogAndExemption) {
    log.set_exempt_piece(1);
    log.record(2, 50, 1000);

    log.reset();
    EXPECT_EQ(log.size(), 0u);
    EXPECT_EQ(log.get_exempt_piece(), INVALID_PIECE);
    EXPECT_EQ(log.assess(1, 3, false), GroundContactVerdict::Violation);
}

TEST_F(GroundViolationLogTest, RestoreReplacesState) {
    log.record(9, 50, 1000);
    log.restore({GroundViolationRecord{2, 50, 500}, GroundViolationRecord{3, 50, 600}}, 1);

    EXPECT_EQ(log.size(), 2u);
    EXPECT_FALSE(log.has_penalized(9));
    EXPECT_TRUE(log.has_penalized(3));
    EXPECT_EQ(log.get_exempt_piece(), 1u);
}

TEST(GroundContactVerdictTest, Names) {
    EXPECT_EQ(to_string(GroundContactVerdict::Violation), "violation");
    EXPECT_EQ(to_string(GroundContactVerdict::AlreadyPenalized), "already_penalized");
}

}  // namespace
}  // namespace sandcastle::gameplay
