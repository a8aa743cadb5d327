// SandCastle Gameplay
// collapse_detector.cpp - Collapse detection

#include <sandcastle/gameplay/collapse_detector.hpp>
#include <sandcastle/gameplay/game_rules.hpp>

#include <algorithm>

namespace sandcastle::gameplay {

CollapseDetector::CollapseDetector(const StabilityClassifier& classifier, double unstable_fraction,
                                   size_t min_pieces)
    : classifier_(classifier), unstable_fraction_(unstable_fraction), min_pieces_(std::max<size_t>(1, min_pieces)) {}

CollapseDetector::CollapseDetector(const GameRules& rules)
    : CollapseDetector(StabilityClassifier(rules), rules.unstable_fraction, static_cast<size_t>(rules.min_pieces)) {}

CollapseReport CollapseDetector::evaluate(std::span<const KinematicSample> samples) const {
    CollapseReport report;
    report.piece_count = samples.size();

    for (const auto& sample : samples) {
        if (classifier_.classify(sample) == StabilityLevel::Unstable) {
            ++report.unstable_count;
        }
    }

    if (report.piece_count > 0) {
        report.unstable_fraction =
            static_cast<double>(report.unstable_count) / static_cast<double>(report.piece_count);
    }

    report.eligible = report.piece_count >= min_pieces_;
    report.collapsed = report.eligible && report.unstable_fraction > unstable_fraction_;
    return report;
}

bool CollapseDetector::has_collapsed(std::span<const KinematicSample> samples) const {
    return evaluate(samples).collapsed;
}

}  // namespace sandcastle::gameplay
