// SandCastle Gameplay
// placement_validator.cpp - Placement rules

#include <sandcastle/gameplay/game_rules.hpp>
#include <sandcastle/gameplay/placement_validator.hpp>

#include <cmath>

namespace sandcastle::gameplay {

namespace {

// Overlaps thinner than this are corner grazes, not support
constexpr double MIN_SUPPORT_OVERLAP = 1e-3;

}  // namespace

PlacementValidator::PlacementValidator(Tier base_tier, Tier max_tier, double contact_tolerance, double ground_top)
    : base_tier_(base_tier), max_tier_(max_tier), contact_tolerance_(contact_tolerance), ground_top_(ground_top) {}

PlacementValidator::PlacementValidator(const GameRules& rules)
    : PlacementValidator(rules.base_tier, rules.max_tier, rules.contact_tolerance) {}

bool PlacementValidator::is_resting_on_ground(const PieceBounds& piece) const {
    return piece.bottom() <= ground_top_ + contact_tolerance_;
}

bool PlacementValidator::is_resting_on(const PieceBounds& piece, const PieceBounds& support) const {
    if (piece.id == support.id) {
        return false;
    }
    if (std::abs(piece.bottom() - support.top()) > contact_tolerance_) {
        return false;
    }
    return piece.horizontal_overlap(support) > MIN_SUPPORT_OVERLAP;
}

PlacementResult PlacementValidator::validate(const PieceBounds& piece, std::span<const PieceBounds> others,
                                             bool ground_exempt) const {
    PlacementResult result;

    if (piece.tier < base_tier_ || piece.tier > max_tier_) {
        result.reason = PlacementReason::InvalidTier;
        return result;
    }

    const bool on_ground = is_resting_on_ground(piece);
    const Tier required = piece.tier == base_tier_ ? base_tier_ : piece.tier - 1;

    if (on_ground && (piece.tier == base_tier_ || ground_exempt)) {
        result.valid = true;
        result.reason = PlacementReason::OnGround;
        return result;
    }

    // Best support of the required tier: the one sharing the widest x-range
    const PieceBounds* best = nullptr;
    double best_overlap = 0.0;
    bool any_support = false;

    for (const PieceBounds& other : others) {
        if (!is_resting_on(piece, other)) {
            continue;
        }
        any_support = true;
        if (other.tier != required) {
            continue;
        }
        double overlap = piece.horizontal_overlap(other);
        if (best == nullptr || overlap > best_overlap) {
            best = &other;
            best_overlap = overlap;
        }
    }

    if (best != nullptr) {
        result.valid = true;
        result.support = best->id;
        result.reason =
            piece.tier == base_tier_ ? PlacementReason::SupportedByBase : PlacementReason::SupportedByLowerTier;
        return result;
    }

    if (on_ground) {
        result.reason = PlacementReason::GroundNotAllowed;
    } else if (any_support) {
        result.reason = PlacementReason::WrongSupportTier;
    } else {
        result.reason = PlacementReason::NoSupport;
    }
    return result;
}

}  // namespace sandcastle::gameplay
