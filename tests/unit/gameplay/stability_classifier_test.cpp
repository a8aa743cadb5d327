// SandCastle Gameplay Tests
// stability_classifier_test.cpp - Tests for stability classification

#include <gtest/gtest.h>

#include <sandcastle/gameplay/game_rules.hpp>
#include <sandcastle/gameplay/stability_classifier.hpp>

#include <deque>
#include <vector>

namespace sandcastle::gameplay {
namespace {

KinematicSample moving(double vx, double vy) {
    KinematicSample sample;
    sample.velocity = glm::dvec2(vx, vy);
    return sample;
}

class StabilityClassifierTest : public ::testing::Test {
protected:
    StabilityClassifier classifier{GameRules{}};
};

// ============================================================================
// Thresholds
// ============================================================================

TEST_F(StabilityClassifierTest, ThresholdsFromRules) {
    EXPECT_DOUBLE_EQ(classifier.get_stable_speed(), 0.1);
    EXPECT_DOUBLE_EQ(classifier.get_unstable_speed(), 0.5);
}

TEST_F(StabilityClassifierTest, ClassifiesBySpeed) {
    EXPECT_EQ(classifier.classify(0.0), StabilityLevel::Stable);
    EXPECT_EQ(classifier.classify(0.099), StabilityLevel::Stable);
    EXPECT_EQ(classifier.classify(0.1), StabilityLevel::Warning);
    EXPECT_EQ(classifier.classify(0.499), StabilityLevel::Warning);
    EXPECT_EQ(classifier.classify(0.5), StabilityLevel::Unstable);
    EXPECT_EQ(classifier.classify(12.0), StabilityLevel::Unstable);
}

TEST_F(StabilityClassifierTest, SpeedIsCombinedAbsoluteComponents) {
    // |0.3| + |-0.3| = 0.6 even though neither component alone is unstable
    EXPECT_EQ(classifier.classify(moving(0.3, -0.3)), StabilityLevel::Unstable);
    EXPECT_EQ(classifier.classify(moving(-0.04, 0.04)), StabilityLevel::Stable);
}

TEST_F(StabilityClassifierTest, AbsentSampleIsStable) {
    KinematicSample sample = KinematicSample::at_rest(glm::dvec2(1.0, 2.0));
    sample.velocity = glm::dvec2(9.0, 9.0);
    EXPECT_EQ(classifier.classify(sample), StabilityLevel::Stable);
}

TEST_F(StabilityClassifierTest, InvertedThresholdsAreOrdered) {
    StabilityClassifier odd(0.5, 0.1);
    EXPECT_DOUBLE_EQ(odd.get_unstable_speed(), 0.5);
    EXPECT_EQ(odd.classify(0.3), StabilityLevel::Stable);
    EXPECT_EQ(odd.classify(0.6), StabilityLevel::Unstable);
}

// ============================================================================
// Windows
// ============================================================================

TEST_F(StabilityClassifierTest, EmptyWindowIsStable) {
    std::vector<KinematicSample> samples;
    EXPECT_DOUBLE_EQ(StabilityClassifier::average_speed(samples), 0.0);
    EXPECT_EQ(classifier.classify(std::span<const KinematicSample>(samples)), StabilityLevel::Stable);
}

TEST_F(StabilityClassifierTest, WindowAveragesSpeed) {
    std::vector<KinematicSample> samples{moving(0.0, 0.0), moving(0.0, 0.0), moving(0.0, 0.0), moving(0.0, -1.0)};
    EXPECT_DOUBLE_EQ(StabilityClassifier::average_speed(samples), 0.25);
    EXPECT_EQ(classifier.classify(std::span<const KinematicSample>(samples)), StabilityLevel::Warning);
}

TEST_F(StabilityClassifierTest, DequeWindowMatchesSpan) {
    std::deque<KinematicSample> window{moving(0.6, 0.0), moving(0.6, 0.0)};
    EXPECT_DOUBLE_EQ(StabilityClassifier::average_speed(window), 0.6);
    EXPECT_EQ(classifier.classify(window), StabilityLevel::Unstable);
}

TEST_F(StabilityClassifierTest, AbsentSamplesCountAsRest) {
    std::deque<KinematicSample> window{moving(0.8, 0.0), KinematicSample::at_rest()};
    EXPECT_DOUBLE_EQ(StabilityClassifier::average_speed(window), 0.4);
}

TEST(StabilityLevelTest, Names) {
    EXPECT_EQ(to_string(StabilityLevel::Stable), "stable");
    EXPECT_EQ(to_string(StabilityLevel::Warning), "warning");
    EXPECT_EQ(to_string(StabilityLevel::Unstable), "unstable");
}

}  // namespace
}  // namespace sandcastle::gameplay
