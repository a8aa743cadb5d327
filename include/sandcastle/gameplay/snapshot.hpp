// SandCastle Gameplay
// snapshot.hpp - Persistable record of run state and structure, JSON encoding

#pragma once

#include "ground_violation.hpp"
#include "score_ledger.hpp"
#include "types.hpp"

#include <nlohmann/json_fwd.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sandcastle::gameplay {

// ============================================================================
// Format Version
// ============================================================================

inline constexpr int SNAPSHOT_FORMAT_VERSION = 1;

// ============================================================================
// Records
// ============================================================================

struct PieceRecord {
    PieceId id = INVALID_PIECE;
    Tier tier = 1;
    glm::dvec2 position{0.0};
    Footprint footprint;
    glm::dvec2 velocity{0.0};
};

struct SnapshotRecord {
    int version = SNAPSHOT_FORMAT_VERSION;
    int64_t timestamp_ms = 0;  // Unix epoch milliseconds

    RunState run;
    std::vector<PieceRecord> pieces;  // Structure order
    std::vector<GroundViolationRecord> ground_violations;
    PieceId exempt_piece = INVALID_PIECE;
    PieceId next_piece_id = 1;
};

// ============================================================================
// Snapshot Serializer
// ============================================================================

class SnapshotSerializer {
public:
    [[nodiscard]] static nlohmann::json to_json(const SnapshotRecord& record);

    // Throws nothing; malformed input yields nullopt
    [[nodiscard]] static std::optional<SnapshotRecord> from_json(const nlohmann::json& json);

    [[nodiscard]] static std::string encode(const SnapshotRecord& record, int indent = -1);
    [[nodiscard]] static std::optional<SnapshotRecord> decode(std::string_view text);

    // File I/O
    static bool save_to_file(const SnapshotRecord& record, const std::filesystem::path& path);
    [[nodiscard]] static std::optional<SnapshotRecord> load_from_file(const std::filesystem::path& path);

    // Age check against the freshness window. Records from the future are stale too.
    [[nodiscard]] static bool is_fresh(const SnapshotRecord& record, int64_t now_ms, double max_age_hours);

    [[nodiscard]] static int64_t now_ms();

private:
    SnapshotSerializer() = delete;
};

}  // namespace sandcastle::gameplay
