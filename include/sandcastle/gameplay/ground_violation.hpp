// SandCastle Gameplay
// ground_violation.hpp - Ground contact rules and the append-only violation audit log

#pragma once

#include "types.hpp"

#include <cstdint>
#include <string_view>
#include <vector>

namespace sandcastle::gameplay {

// One penalized piece. Never mutated after creation.
struct GroundViolationRecord {
    PieceId piece_id = INVALID_PIECE;
    int penalty_applied = 0;
    int64_t timestamp_ms = 0;  // Unix epoch milliseconds

    bool operator==(const GroundViolationRecord&) const = default;
};

enum class GroundContactVerdict : uint8_t {
    Exempt,            // First piece dropped in the level
    Allowed,           // Base tier, the ground is its legal surface
    AlreadyPenalized,  // Audit log already holds this piece
    PlacedValid,       // Already accepted by placement validation; sliding down later is not re-judged
    Violation          // Penalize and remove
};

[[nodiscard]] constexpr std::string_view to_string(GroundContactVerdict verdict) {
    switch (verdict) {
        case GroundContactVerdict::Exempt:
            return "exempt";
        case GroundContactVerdict::Allowed:
            return "allowed";
        case GroundContactVerdict::AlreadyPenalized:
            return "already_penalized";
        case GroundContactVerdict::PlacedValid:
            return "placed_valid";
        case GroundContactVerdict::Violation:
            return "violation";
    }
    return "unknown";
}

// ============================================================================
// Ground Violation Log
// ============================================================================

class GroundViolationLog {
public:
    explicit GroundViolationLog(Tier base_tier = 1) : base_tier_(base_tier) {}

    // The piece allowed to touch the ground regardless of tier
    void set_exempt_piece(PieceId id) { exempt_piece_ = id; }
    [[nodiscard]] PieceId get_exempt_piece() const { return exempt_piece_; }

    // Pure decision for a contact between a piece and the ground
    [[nodiscard]] GroundContactVerdict assess(PieceId id, Tier tier, bool placement_valid) const;

    // Append a record. Returns false (and appends nothing) if the piece is already logged.
    bool record(PieceId id, int penalty, int64_t timestamp_ms);

    [[nodiscard]] bool has_penalized(PieceId id) const;
    [[nodiscard]] const std::vector<GroundViolationRecord>& records() const { return records_; }
    [[nodiscard]] size_t size() const { return records_.size(); }
    [[nodiscard]] int total_penalty() const;

    // Level restart / new level: forget the exemption and the per-level log
    void reset();

    // Snapshot import
    void restore(std::vector<GroundViolationRecord> records, PieceId exempt_piece);

private:
    Tier base_tier_;
    PieceId exempt_piece_ = INVALID_PIECE;
    std::vector<GroundViolationRecord> records_;
};

}  // namespace sandcastle::gameplay
