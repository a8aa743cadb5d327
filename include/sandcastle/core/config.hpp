// SandCastle Core
// config.hpp - JSON-based configuration system

#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace sandcastle::core {

// Configuration system with JSON file persistence
class Config {
public:
    Config();
    ~Config();

    // Non-copyable but movable
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;
    Config(Config&&) noexcept;
    Config& operator=(Config&&) noexcept;

    // Load/Save operations
    bool load(const std::filesystem::path& path);
    bool load_from_string(std::string_view content);
    bool save(const std::filesystem::path& path) const;
    bool save() const;  // Save to loaded path
    bool load_or_create_default(const std::filesystem::path& path);

    [[nodiscard]] std::filesystem::path get_path() const;

    // Typed getters with defaults
    [[nodiscard]] int get_int(std::string_view section, std::string_view key,
                               int default_value = 0) const;
    [[nodiscard]] double get_double(std::string_view section, std::string_view key,
                                     double default_value = 0.0) const;
    [[nodiscard]] bool get_bool(std::string_view section, std::string_view key,
                                 bool default_value = false) const;
    [[nodiscard]] std::string get_string(std::string_view section, std::string_view key,
                                          std::string_view default_value = "") const;

    // Setters
    void set_int(std::string_view section, std::string_view key, int value);
    void set_double(std::string_view section, std::string_view key, double value);
    void set_bool(std::string_view section, std::string_view key, bool value);
    void set_string(std::string_view section, std::string_view key, std::string_view value);

    // Check existence
    [[nodiscard]] bool has(std::string_view section, std::string_view key) const;
    [[nodiscard]] bool has_section(std::string_view section) const;

    // Remove entries
    bool remove(std::string_view section, std::string_view key);
    bool remove_section(std::string_view section);

    // Change notification callback
    using ChangeCallback = std::function<void(std::string_view section, std::string_view key)>;
    void set_change_callback(ChangeCallback callback);

    // Dirty tracking (for auto-save)
    [[nodiscard]] bool is_dirty() const;
    void mark_clean();

    // Reference rule set
    void set_defaults();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;

    void notify_change(std::string_view section, std::string_view key);
};

namespace config_section {
    inline constexpr const char* PHYSICS = "physics";
    inline constexpr const char* ARENA = "arena";
    inline constexpr const char* STABILITY = "stability";
    inline constexpr const char* PLACEMENT = "placement";
    inline constexpr const char* COLLAPSE = "collapse";
    inline constexpr const char* SCORING = "scoring";
    inline constexpr const char* RUN = "run";
    inline constexpr const char* DEBUG = "debug";
}  // namespace config_section

namespace config_key {
    // Physics section
    inline constexpr const char* GRAVITY = "gravity";
    inline constexpr const char* FIXED_TIMESTEP = "fixed_timestep";
    inline constexpr const char* MAX_SUBSTEPS = "max_substeps";

    // Arena section
    inline constexpr const char* ARENA_WIDTH = "width";
    inline constexpr const char* SPAWN_HEIGHT = "spawn_height";
    inline constexpr const char* GROUND_HEIGHT = "ground_height";

    // Stability section
    inline constexpr const char* STABLE_SPEED = "stable_speed";
    inline constexpr const char* UNSTABLE_SPEED = "unstable_speed";
    inline constexpr const char* SETTLE_TICKS = "settle_ticks";
    inline constexpr const char* MAX_SETTLE_TICKS = "max_settle_ticks";

    // Placement section
    inline constexpr const char* CONTACT_TOLERANCE = "contact_tolerance";
    inline constexpr const char* BASE_TIER = "base_tier";
    inline constexpr const char* MAX_TIER = "max_tier";

    // Collapse section
    inline constexpr const char* UNSTABLE_FRACTION = "unstable_fraction";
    inline constexpr const char* MIN_PIECES = "min_pieces";
    inline constexpr const char* CHECK_DELAY = "check_delay";

    // Scoring section
    inline constexpr const char* BASE_SCORE = "base_score";
    inline constexpr const char* TIER_MULTIPLIER = "tier_multiplier";
    inline constexpr const char* PLACEMENT_BONUS = "placement_bonus";
    inline constexpr const char* WRONG_PLACEMENT_PENALTY = "wrong_placement_penalty";
    inline constexpr const char* GROUND_PENALTY = "ground_penalty";
    inline constexpr const char* CAPSTONE_BONUS_PER_PIECE = "capstone_bonus_per_piece";
    inline constexpr const char* LEVEL_COMPLETE_BONUS = "level_complete_bonus";
    inline constexpr const char* STABILITY_BONUS_STABLE = "stability_bonus_stable";
    inline constexpr const char* STABILITY_BONUS_WARNING = "stability_bonus_warning";
    inline constexpr const char* STABILITY_BONUS_UNSTABLE = "stability_bonus_unstable";

    // Run section
    inline constexpr const char* INITIAL_LIVES = "initial_lives";
    inline constexpr const char* PIECE_SPEED = "piece_speed";
    inline constexpr const char* SNAPSHOT_MAX_AGE_HOURS = "snapshot_max_age_hours";
    inline constexpr const char* RNG_SEED = "rng_seed";
    inline constexpr const char* SPAWN_DELAY = "spawn_delay";
    inline constexpr const char* RESTART_DELAY = "restart_delay";

    // Debug section
    inline constexpr const char* LOG_LEVEL = "log_level";
    inline constexpr const char* TARGET_FPS = "target_fps";
}  // namespace config_key

}  // namespace sandcastle::core
