// SandCastle Gameplay
// ground_violation.cpp - Ground violation log

#include <sandcastle/gameplay/ground_violation.hpp>

#include <algorithm>
#include <utility>

namespace sandcastle::gameplay {

GroundContactVerdict GroundViolationLog::assess(PieceId id, Tier tier, bool placement_valid) const {
    if (id != INVALID_PIECE && id == exempt_piece_) {
        return GroundContactVerdict::Exempt;
    }
    if (tier == base_tier_) {
        return GroundContactVerdict::Allowed;
    }
    if (has_penalized(id)) {
        return GroundContactVerdict::AlreadyPenalized;
    }
    if (placement_valid) {
        return GroundContactVerdict::PlacedValid;
    }
    return GroundContactVerdict::Violation;
}

bool GroundViolationLog::record(PieceId id, int penalty, int64_t timestamp_ms) {
    if (id == INVALID_PIECE || has_penalized(id)) {
        return false;
    }
    records_.push_back(GroundViolationRecord{id, penalty, timestamp_ms});
    return true;
}

bool GroundViolationLog::has_penalized(PieceId id) const {
    return std::any_of(records_.begin(), records_.end(),
                       [id](const GroundViolationRecord& record) { return record.piece_id == id; });
}

int GroundViolationLog::total_penalty() const {
    int total = 0;
    for (const auto& record : records_) {
        total += record.penalty_applied;
    }
    return total;
}

void GroundViolationLog::reset() {
    exempt_piece_ = INVALID_PIECE;
    records_.clear();
}

void GroundViolationLog::restore(std::vector<GroundViolationRecord> records, PieceId exempt_piece) {
    records_ = std::move(records);
    exempt_piece_ = exempt_piece;
}

}  // namespace sandcastle::gameplay
