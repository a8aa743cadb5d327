// SandCastle Gameplay
// stability_classifier.cpp - Stability classification

#include <sandcastle/gameplay/game_rules.hpp>
#include <sandcastle/gameplay/stability_classifier.hpp>

#include <algorithm>

namespace sandcastle::gameplay {

namespace {

template <typename Range>
double mean_speed(const Range& samples) {
    if (samples.empty()) {
        return 0.0;
    }
    double sum = 0.0;
    for (const auto& sample : samples) {
        sum += sample.absent ? 0.0 : sample.speed();
    }
    return sum / static_cast<double>(samples.size());
}

}  // namespace

StabilityClassifier::StabilityClassifier(double stable_speed, double unstable_speed)
    : stable_speed_(stable_speed), unstable_speed_(std::max(stable_speed, unstable_speed)) {}

StabilityClassifier::StabilityClassifier(const GameRules& rules)
    : StabilityClassifier(rules.stable_speed, rules.unstable_speed) {}

StabilityLevel StabilityClassifier::classify(double speed) const {
    if (speed < stable_speed_) {
        return StabilityLevel::Stable;
    }
    if (speed < unstable_speed_) {
        return StabilityLevel::Warning;
    }
    return StabilityLevel::Unstable;
}

StabilityLevel StabilityClassifier::classify(const KinematicSample& sample) const {
    return sample.absent ? StabilityLevel::Stable : classify(sample.speed());
}

StabilityLevel StabilityClassifier::classify(std::span<const KinematicSample> samples) const {
    return classify(average_speed(samples));
}

StabilityLevel StabilityClassifier::classify(const std::deque<KinematicSample>& samples) const {
    return classify(average_speed(samples));
}

double StabilityClassifier::average_speed(std::span<const KinematicSample> samples) {
    return mean_speed(samples);
}

double StabilityClassifier::average_speed(const std::deque<KinematicSample>& samples) {
    return mean_speed(samples);
}

}  // namespace sandcastle::gameplay
