// SandCastle Gameplay
// stability_classifier.hpp - Maps kinematic samples to a discrete stability level

#pragma once

#include "types.hpp"

#include <deque>
#include <span>

namespace sandcastle::gameplay {

struct GameRules;

// Stateless. speed < stable_speed is Stable, speed < unstable_speed is Warning,
// anything faster is Unstable. Callers remember the last level to detect transitions.
class StabilityClassifier {
public:
    StabilityClassifier(double stable_speed, double unstable_speed);
    explicit StabilityClassifier(const GameRules& rules);

    [[nodiscard]] StabilityLevel classify(double speed) const;
    [[nodiscard]] StabilityLevel classify(const KinematicSample& sample) const;

    // Average L1 speed over the window; absent samples count as at rest
    [[nodiscard]] StabilityLevel classify(std::span<const KinematicSample> samples) const;
    [[nodiscard]] StabilityLevel classify(const std::deque<KinematicSample>& samples) const;

    [[nodiscard]] static double average_speed(std::span<const KinematicSample> samples);
    [[nodiscard]] static double average_speed(const std::deque<KinematicSample>& samples);

    [[nodiscard]] double get_stable_speed() const { return stable_speed_; }
    [[nodiscard]] double get_unstable_speed() const { return unstable_speed_; }

private:
    double stable_speed_;
    double unstable_speed_;
};

}  // namespace sandcastle::gameplay
