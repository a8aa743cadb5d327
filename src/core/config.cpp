// SandCastle Core
// config.cpp - JSON-based configuration system implementation

#include <nlohmann/json.hpp>

#include <sandcastle/core/config.hpp>
#include <sandcastle/core/logger.hpp>
#include <sandcastle/platform/file_io.hpp>

namespace sandcastle::core {

using json = nlohmann::json;

struct Config::Impl {
    json data;
    std::filesystem::path path;
    ChangeCallback change_callback;
    bool dirty = false;

    [[nodiscard]] const json* find(std::string_view section, std::string_view key) const {
        auto section_it = data.find(std::string(section));
        if (section_it == data.end() || !section_it->is_object()) {
            return nullptr;
        }
        auto key_it = section_it->find(std::string(key));
        if (key_it == section_it->end()) {
            return nullptr;
        }
        return &*key_it;
    }
};

Config::Config() : impl_(std::make_unique<Impl>()) {
    set_defaults();
}

Config::~Config() = default;

Config::Config(Config&&) noexcept = default;
Config& Config::operator=(Config&&) noexcept = default;

bool Config::load(const std::filesystem::path& path) {
    auto content = platform::FileSystem::read_text(path);
    if (!content) {
        SANDCASTLE_LOG_ERROR(log_category::CONFIG, "Failed to read config file: {}", path.string());
        return false;
    }

    if (!load_from_string(*content)) {
        return false;
    }

    impl_->path = path;
    SANDCASTLE_LOG_INFO(log_category::CONFIG, "Loaded config from: {}", path.string());
    return true;
}

bool Config::load_from_string(std::string_view content) {
    try {
        json parsed = json::parse(content);
        if (!parsed.is_object()) {
            SANDCASTLE_LOG_ERROR(log_category::CONFIG, "Config root must be a JSON object");
            return false;
        }
        impl_->data = std::move(parsed);
        impl_->dirty = false;
        return true;
    } catch (const json::parse_error& e) {
        SANDCASTLE_LOG_ERROR(log_category::CONFIG, "Failed to parse config: {}", e.what());
        return false;
    }
}

bool Config::save(const std::filesystem::path& path) const {
    auto parent = path.parent_path();
    if (!parent.empty() && !platform::FileSystem::exists(parent)) {
        if (!platform::FileSystem::create_directories(parent)) {
            SANDCASTLE_LOG_ERROR(log_category::CONFIG, "Failed to create config directory: {}", parent.string());
            return false;
        }
    }

    std::string content = impl_->data.dump(4);

    if (!platform::FileSystem::write_text(path, content)) {
        SANDCASTLE_LOG_ERROR(log_category::CONFIG, "Failed to write config file: {}", path.string());
        return false;
    }

    SANDCASTLE_LOG_INFO(log_category::CONFIG, "Saved config to: {}", path.string());
    return true;
}

bool Config::save() const {
    if (impl_->path.empty()) {
        SANDCASTLE_LOG_ERROR(log_category::CONFIG, "Cannot save config: no path specified");
        return false;
    }
    return save(impl_->path);
}

bool Config::load_or_create_default(const std::filesystem::path& path) {
    if (platform::FileSystem::exists(path)) {
        return load(path);
    }

    set_defaults();
    impl_->path = path;

    if (!save(path)) {
        SANDCASTLE_LOG_WARN(log_category::CONFIG, "Failed to save default config, using in-memory defaults");
    }

    return true;
}

std::filesystem::path Config::get_path() const {
    return impl_->path;
}

int Config::get_int(std::string_view section, std::string_view key, int default_value) const {
    try {
        if (const json* value = impl_->find(section, key)) {
            return value->get<int>();
        }
    } catch (const json::exception&) {
        SANDCASTLE_LOG_WARN(log_category::CONFIG, "Config {}.{} is not an integer", section, key);
    }
    return default_value;
}

double Config::get_double(std::string_view section, std::string_view key, double default_value) const {
    try {
        if (const json* value = impl_->find(section, key)) {
            return value->get<double>();
        }
    } catch (const json::exception&) {
        SANDCASTLE_LOG_WARN(log_category::CONFIG, "Config {}.{} is not a number", section, key);
    }
    return default_value;
}

bool Config::get_bool(std::string_view section, std::string_view key, bool default_value) const {
    try {
        if (const json* value = impl_->find(section, key)) {
            return value->get<bool>();
        }
    } catch (const json::exception&) {
        SANDCASTLE_LOG_WARN(log_category::CONFIG, "Config {}.{} is not a boolean", section, key);
    }
    return default_value;
}

std::string Config::get_string(std::string_view section, std::string_view key, std::string_view default_value) const {
    try {
        if (const json* value = impl_->find(section, key)) {
            return value->get<std::string>();
        }
    } catch (const json::exception&) {
        SANDCASTLE_LOG_WARN(log_category::CONFIG, "Config {}.{} is not a string", section, key);
    }
    return std::string(default_value);
}

void Config::set_int(std::string_view section, std::string_view key, int value) {
    impl_->data[std::string(section)][std::string(key)] = value;
    notify_change(section, key);
}

void Config::set_double(std::string_view section, std::string_view key, double value) {
    impl_->data[std::string(section)][std::string(key)] = value;
    notify_change(section, key);
}

void Config::set_bool(std::string_view section, std::string_view key, bool value) {
    impl_->data[std::string(section)][std::string(key)] = value;
    notify_change(section, key);
}

void Config::set_string(std::string_view section, std::string_view key, std::string_view value) {
    impl_->data[std::string(section)][std::string(key)] = std::string(value);
    notify_change(section, key);
}

bool Config::has(std::string_view section, std::string_view key) const {
    return impl_->find(section, key) != nullptr;
}

bool Config::has_section(std::string_view section) const {
    return impl_->data.contains(std::string(section));
}

bool Config::remove(std::string_view section, std::string_view key) {
    if (!has(section, key)) {
        return false;
    }
    impl_->data[std::string(section)].erase(std::string(key));
    impl_->dirty = true;
    return true;
}

bool Config::remove_section(std::string_view section) {
    if (!has_section(section)) {
        return false;
    }
    impl_->data.erase(std::string(section));
    impl_->dirty = true;
    return true;
}

void Config::set_change_callback(ChangeCallback callback) {
    impl_->change_callback = std::move(callback);
}

bool Config::is_dirty() const {
    return impl_->dirty;
}

void Config::mark_clean() {
    impl_->dirty = false;
}

void Config::notify_change(std::string_view section, std::string_view key) {
    impl_->dirty = true;
    if (impl_->change_callback) {
        impl_->change_callback(section, key);
    }
}

void Config::set_defaults() {
    impl_->data = json{
        {config_section::PHYSICS,
         {{config_key::GRAVITY, -9.81}, {config_key::FIXED_TIMESTEP, 1.0 / 60.0}, {config_key::MAX_SUBSTEPS, 4}}},
        {config_section::ARENA,
         {{config_key::ARENA_WIDTH, 9.0}, {config_key::SPAWN_HEIGHT, 14.5}, {config_key::GROUND_HEIGHT, 1.25}}},
        {config_section::STABILITY,
         {{config_key::STABLE_SPEED, 0.1},
          {config_key::UNSTABLE_SPEED, 0.5},
          {config_key::SETTLE_TICKS, 20},
          {config_key::MAX_SETTLE_TICKS, 300}}},
        {config_section::PLACEMENT,
         {{config_key::CONTACT_TOLERANCE, 0.25}, {config_key::BASE_TIER, 1}, {config_key::MAX_TIER, 6}}},
        {config_section::COLLAPSE,
         {{config_key::UNSTABLE_FRACTION, 0.5}, {config_key::MIN_PIECES, 2}, {config_key::CHECK_DELAY, 0.5}}},
        {config_section::SCORING,
         {{config_key::BASE_SCORE, 10},
          {config_key::TIER_MULTIPLIER, 1},
          {config_key::PLACEMENT_BONUS, 10},
          {config_key::WRONG_PLACEMENT_PENALTY, 50},
          {config_key::GROUND_PENALTY, 50},
          {config_key::CAPSTONE_BONUS_PER_PIECE, 100},
          {config_key::LEVEL_COMPLETE_BONUS, 100},
          {config_key::STABILITY_BONUS_STABLE, 100},
          {config_key::STABILITY_BONUS_WARNING, 75},
          {config_key::STABILITY_BONUS_UNSTABLE, 25}}},
        {config_section::RUN,
         {{config_key::INITIAL_LIVES, 3},
          {config_key::PIECE_SPEED, 2.0},
          {config_key::SNAPSHOT_MAX_AGE_HOURS, 24.0},
          {config_key::RNG_SEED, 0},
          {config_key::SPAWN_DELAY, 0.25},
          {config_key::RESTART_DELAY, 1.0}}},
        {config_section::DEBUG, {{config_key::LOG_LEVEL, "info"}, {config_key::TARGET_FPS, 0.0}}}};
    impl_->dirty = true;
}

}  // namespace sandcastle::core
