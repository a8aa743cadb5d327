// SandCastle Gameplay
// collapse_detector.hpp - Global structural failure detection

#pragma once

#include "stability_classifier.hpp"

#include <span>

namespace sandcastle::gameplay {

struct CollapseReport {
    size_t piece_count = 0;
    size_t unstable_count = 0;
    double unstable_fraction = 0.0;
    bool eligible = false;  // Enough pieces to judge
    bool collapsed = false;
};

// Collapse is declared when strictly more than the configured fraction of the
// structure is Unstable in the same sample. Single-piece wobble never counts.
class CollapseDetector {
public:
    CollapseDetector(const StabilityClassifier& classifier, double unstable_fraction, size_t min_pieces);
    explicit CollapseDetector(const GameRules& rules);

    // One sample per structure member
    [[nodiscard]] CollapseReport evaluate(std::span<const KinematicSample> samples) const;
    [[nodiscard]] bool has_collapsed(std::span<const KinematicSample> samples) const;

    [[nodiscard]] double get_unstable_fraction() const { return unstable_fraction_; }
    [[nodiscard]] size_t get_min_pieces() const { return min_pieces_; }

private:
    StabilityClassifier classifier_;
    double unstable_fraction_;
    size_t min_pieces_;
};

}  // namespace sandcastle::gameplay
