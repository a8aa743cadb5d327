// SandCastle Gameplay Tests
// collapse_detector_test.cpp - Tests for structural collapse detection

#include <gtest/gtest.h>

#include <sandcastle/gameplay/collapse_detector.hpp>
#include <sandcastle/gameplay/game_rules.hpp>

#include <vector>

namespace sandcastle::gameplay {
namespace {

KinematicSample at_speed(double vx) {
    KinematicSample sample;
    sample.velocity = glm::dvec2(vx, 0.0);
    return sample;
}

class CollapseDetectorTest : public ::testing::Test {
protected:
    CollapseDetector detector{GameRules{}};

    std::vector<KinematicSample> structure(int unstable, int stable) const {
        std::vector<KinematicSample> samples;
        for (int i = 0; i < unstable; ++i) {
            samples.push_back(at_speed(2.0));
        }
        for (int i = 0; i < stable; ++i) {
            samples.push_back(at_speed(0.0));
        }
        return samples;
    }
};

TEST_F(CollapseDetectorTest, EmptyStructureNeverCollapses) {
    CollapseReport report = detector.evaluate({});
    EXPECT_EQ(report.piece_count, 0u);
    EXPECT_FALSE(report.eligible);
    EXPECT_FALSE(report.collapsed);
}

TEST_F(CollapseDetectorTest, SinglePieceWobbleIsIgnored) {
    auto samples = structure(1, 0);
    CollapseReport report = detector.evaluate(samples);
    EXPECT_EQ(report.unstable_count, 1u);
    EXPECT_DOUBLE_EQ(report.unstable_fraction, 1.0);
    EXPECT_FALSE(report.eligible);
    EXPECT_FALSE(report.collapsed);
}

TEST_F(CollapseDetectorTest, ExactlyHalfIsNotCollapse) {
    auto samples = structure(2, 2);
    CollapseReport report = detector.evaluate(samples);
    EXPECT_DOUBLE_EQ(report.unstable_fraction, 0.5);
    EXPECT_TRUE(report.eligible);
    EXPECT_FALSE(report.collapsed);
}

TEST_F(CollapseDetectorTest, MajorityUnstableIsCollapse) {
    auto samples = structure(2, 1);
    CollapseReport report = detector.evaluate(samples);
    EXPECT_EQ(report.unstable_count, 2u);
    EXPECT_TRUE(report.collapsed);
    EXPECT_TRUE(detector.has_collapsed(samples));
}

TEST_F(CollapseDetectorTest, WarningDoesNotCount) {
    std::vector<KinematicSample> samples{at_speed(0.3), at_speed(0.3), at_speed(0.3)};
    EXPECT_EQ(detector.evaluate(samples).unstable_count, 0u);
    EXPECT_FALSE(detector.has_collapsed(samples));
}

TEST_F(CollapseDetectorTest, AbsentBodiesCountAsStable) {
    std::vector<KinematicSample> samples{at_speed(2.0), KinematicSample::at_rest(), KinematicSample::at_rest()};
    EXPECT_FALSE(detector.has_collapsed(samples));
}

TEST_F(CollapseDetectorTest, CustomThresholds) {
    CollapseDetector strict(StabilityClassifier(0.1, 0.5), 0.25, 4);
    EXPECT_EQ(strict.get_min_pieces(), 4u);

    auto three = structure(3, 0);
    EXPECT_FALSE(strict.has_collapsed(three));

    auto four = structure(2, 2);
    EXPECT_TRUE(strict.has_collapsed(four));
}

}  // namespace
}  // namespace sandcastle::gameplay
