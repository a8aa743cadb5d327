// SandCastle Gameplay
// placement_validator.hpp - Structural legality of a settled piece

#pragma once

#include "piece.hpp"

#include <span>
#include <string_view>

namespace sandcastle::gameplay {

struct GameRules;

enum class PlacementReason : uint8_t {
    OnGround,              // Base tier (or exempt first piece) resting on the ground
    SupportedByBase,       // Base tier resting on another base-tier piece
    SupportedByLowerTier,  // Resting on a piece exactly one tier lower
    GroundNotAllowed,      // Non-base tier resting on the ground
    WrongSupportTier,      // Resting only on pieces of the wrong tier
    NoSupport,             // Not resting on anything
    InvalidTier            // Tier outside [base, max]
};

[[nodiscard]] constexpr std::string_view to_string(PlacementReason reason) {
    switch (reason) {
        case PlacementReason::OnGround:
            return "on_ground";
        case PlacementReason::SupportedByBase:
            return "supported_by_base";
        case PlacementReason::SupportedByLowerTier:
            return "supported_by_lower_tier";
        case PlacementReason::GroundNotAllowed:
            return "ground_not_allowed";
        case PlacementReason::WrongSupportTier:
            return "wrong_support_tier";
        case PlacementReason::NoSupport:
            return "no_support";
        case PlacementReason::InvalidTier:
            return "invalid_tier";
    }
    return "unknown";
}

struct PlacementResult {
    bool valid = false;
    PlacementReason reason = PlacementReason::NoSupport;
    PieceId support = INVALID_PIECE;  // Supporting piece, if any
};

// ============================================================================
// Placement Validator
// ============================================================================

class PlacementValidator {
public:
    PlacementValidator(Tier base_tier, Tier max_tier, double contact_tolerance, double ground_top = 0.0);
    explicit PlacementValidator(const GameRules& rules);

    // Judge a settled piece against the other settled pieces. ground_exempt lets
    // any tier rest on the ground (first piece of a level).
    [[nodiscard]] PlacementResult validate(const PieceBounds& piece, std::span<const PieceBounds> others,
                                           bool ground_exempt = false) const;

    [[nodiscard]] bool is_resting_on_ground(const PieceBounds& piece) const;

    // piece's bottom lies within tolerance of support's top and their x-ranges overlap
    [[nodiscard]] bool is_resting_on(const PieceBounds& piece, const PieceBounds& support) const;

    [[nodiscard]] double get_contact_tolerance() const { return contact_tolerance_; }

private:
    Tier base_tier_;
    Tier max_tier_;
    double contact_tolerance_;
    double ground_top_;
};

}  // namespace sandcastle::gameplay
