// SandCastle Gameplay
// snapshot.cpp - Snapshot JSON encoding and persistence

#include <sandcastle/core/logger.hpp>
#include <sandcastle/gameplay/level.hpp>
#include <sandcastle/gameplay/snapshot.hpp>
#include <sandcastle/platform/file_io.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cmath>

namespace sandcastle::gameplay {

using json = nlohmann::json;

namespace {

json vec2_to_json(const glm::dvec2& v) {
    return json::array({v.x, v.y});
}

glm::dvec2 vec2_from_json(const json& j) {
    return glm::dvec2(j.at(0).get<double>(), j.at(1).get<double>());
}

json run_to_json(const RunState& run) {
    json j;
    j["score"] = run.score;
    j["lives"] = run.lives;
    j["level"] = run.level;
    j["successful_placements"] = run.successful_placements;
    j["wrong_placements"] = run.wrong_placements;
    j["level_attempts"] = run.level_attempts;
    j["total_successful_placements"] = run.total_successful_placements;
    j["reward_events"] = run.reward_events;
    j["levels_completed"] = run.levels_completed;
    j["piece_speed"] = run.piece_speed;
    j["piece_direction"] = run.piece_direction;
    j["first_piece"] = run.first_piece;
    j["game_over"] = run.game_over;
    return j;
}

RunState run_from_json(const json& j) {
    RunState run;
    run.score = j.at("score").get<int>();
    run.lives = j.at("lives").get<int>();
    run.level = j.at("level").get<int>();
    run.successful_placements = j.at("successful_placements").get<int>();
    run.wrong_placements = j.at("wrong_placements").get<int>();
    run.level_attempts = j.value("level_attempts", 1);
    run.total_successful_placements = j.at("total_successful_placements").get<int>();
    run.reward_events = j.at("reward_events").get<int>();
    run.levels_completed = j.value("levels_completed", 0);
    run.piece_speed = j.at("piece_speed").get<double>();
    run.piece_direction = j.at("piece_direction").get<int>();
    run.first_piece = j.at("first_piece").get<bool>();
    run.game_over = j.value("game_over", false);
    return run;
}

json piece_to_json(const PieceRecord& piece) {
    json j;
    j["id"] = piece.id;
    j["tier"] = piece.tier;
    j["position"] = vec2_to_json(piece.position);
    j["size"] = json::array({piece.footprint.width, piece.footprint.height});
    j["velocity"] = vec2_to_json(piece.velocity);
    return j;
}

PieceRecord piece_from_json(const json& j) {
    PieceRecord piece;
    piece.id = j.at("id").get<PieceId>();
    piece.tier = j.at("tier").get<Tier>();
    piece.position = vec2_from_json(j.at("position"));
    const json& size = j.at("size");
    piece.footprint.width = size.at(0).get<double>();
    piece.footprint.height = size.at(1).get<double>();
    piece.velocity = j.contains("velocity") ? vec2_from_json(j.at("velocity")) : glm::dvec2{0.0};
    return piece;
}

bool is_plausible(const SnapshotRecord& record) {
    const RunState& run = record.run;
    if (run.lives < 0 || run.level < 1 || run.level > LevelCatalog::MAX_LEVEL) {
        return false;
    }
    if (run.score < 0 || run.successful_placements < 0 || run.wrong_placements < 0 || run.level_attempts < 0 ||
        run.total_successful_placements < 0 || run.reward_events < 0 || run.levels_completed < 0) {
        return false;
    }
    if (!std::isfinite(run.piece_speed) || run.piece_speed < 0.0) {
        return false;
    }
    for (const auto& piece : record.pieces) {
        if (piece.id == INVALID_PIECE || piece.tier < 1 || piece.footprint.width <= 0.0 ||
            piece.footprint.height <= 0.0) {
            return false;
        }
    }
    return true;
}

}  // namespace

// ============================================================================
// JSON
// ============================================================================

json SnapshotSerializer::to_json(const SnapshotRecord& record) {
    json j;
    j["version"] = record.version;
    j["timestamp"] = record.timestamp_ms;
    j["run"] = run_to_json(record.run);

    json pieces = json::array();
    for (const auto& piece : record.pieces) {
        pieces.push_back(piece_to_json(piece));
    }
    j["pieces"] = pieces;

    json violations = json::array();
    for (const auto& violation : record.ground_violations) {
        violations.push_back(json{{"piece_id", violation.piece_id},
                                  {"penalty", violation.penalty_applied},
                                  {"timestamp", violation.timestamp_ms}});
    }
    j["ground_violations"] = violations;
    j["exempt_piece"] = record.exempt_piece;
    j["next_piece_id"] = record.next_piece_id;
    return j;
}

std::optional<SnapshotRecord> SnapshotSerializer::from_json(const json& j) {
    try {
        if (!j.is_object()) {
            SANDCASTLE_LOG_ERROR(core::log_category::PERSISTENCE, "Snapshot is not a JSON object");
            return std::nullopt;
        }

        SnapshotRecord record;
        record.version = j.at("version").get<int>();
        if (record.version != SNAPSHOT_FORMAT_VERSION) {
            SANDCASTLE_LOG_ERROR(core::log_category::PERSISTENCE, "Unsupported snapshot version {}", record.version);
            return std::nullopt;
        }

        record.timestamp_ms = j.at("timestamp").get<int64_t>();
        record.run = run_from_json(j.at("run"));

        for (const auto& piece : j.at("pieces")) {
            record.pieces.push_back(piece_from_json(piece));
        }

        if (j.contains("ground_violations")) {
            for (const auto& violation : j.at("ground_violations")) {
                GroundViolationRecord entry;
                entry.piece_id = violation.at("piece_id").get<PieceId>();
                entry.penalty_applied = violation.at("penalty").get<int>();
                entry.timestamp_ms = violation.at("timestamp").get<int64_t>();
                record.ground_violations.push_back(entry);
            }
        }

        record.exempt_piece = j.value("exempt_piece", INVALID_PIECE);
        record.next_piece_id = j.value("next_piece_id", PieceId{1});

        if (!is_plausible(record)) {
            SANDCASTLE_LOG_ERROR(core::log_category::PERSISTENCE, "Snapshot contains out-of-range values");
            return std::nullopt;
        }
        return record;
    } catch (const json::exception& e) {
        SANDCASTLE_LOG_ERROR(core::log_category::PERSISTENCE, "Malformed snapshot: {}", e.what());
        return std::nullopt;
    }
}

std::string SnapshotSerializer::encode(const SnapshotRecord& record, int indent) {
    return to_json(record).dump(indent);
}

std::optional<SnapshotRecord> SnapshotSerializer::decode(std::string_view text) {
    try {
        return from_json(json::parse(text));
    } catch (const json::parse_error& e) {
        SANDCASTLE_LOG_ERROR(core::log_category::PERSISTENCE, "Snapshot parse error: {}", e.what());
        return std::nullopt;
    }
}

// ============================================================================
// File I/O
// ============================================================================

bool SnapshotSerializer::save_to_file(const SnapshotRecord& record, const std::filesystem::path& path) {
    if (!platform::FileSystem::write_text(path, encode(record, 2))) {
        SANDCASTLE_LOG_ERROR(core::log_category::PERSISTENCE, "Failed to write snapshot: {}", path.string());
        return false;
    }
    SANDCASTLE_LOG_INFO(core::log_category::PERSISTENCE, "Snapshot saved to {} ({} pieces)", path.string(),
                        record.pieces.size());
    return true;
}

std::optional<SnapshotRecord> SnapshotSerializer::load_from_file(const std::filesystem::path& path) {
    auto content = platform::FileSystem::read_text(path);
    if (!content) {
        return std::nullopt;
    }
    return decode(*content);
}

// ============================================================================
// Freshness
// ============================================================================

bool SnapshotSerializer::is_fresh(const SnapshotRecord& record, int64_t now_ms, double max_age_hours) {
    int64_t age_ms = now_ms - record.timestamp_ms;
    if (age_ms < 0) {
        return false;
    }
    auto max_age_ms = static_cast<int64_t>(max_age_hours * 3600.0 * 1000.0);
    return age_ms <= max_age_ms;
}

int64_t SnapshotSerializer::now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

}  // namespace sandcastle::gameplay
