#include "config/Config.hpp"
#include "core/Logger.hpp"
#include <fstream>
#include <iomanip>
#include <vector>

namespace Wayfarer {

const char* ConfigErrorToString(ConfigError error) noexcept {
    switch (error) {
        case ConfigError::FileNotFound: return "file not found";
        case ConfigError::ParseError:   return "parse error";
        case ConfigError::WriteError:   return "write error";
        default:                        return "unknown error";
    }
}

std::expected<void, ConfigError> Config::Load(const std::filesystem::path& filepath) {
    m_filepath = filepath;

    if (!std::filesystem::exists(filepath)) {
        WAYFARER_LOG_WARN("Config file not found: {}. Using defaults.", filepath.string());
        return std::unexpected(ConfigError::FileNotFound);
    }

    std::ifstream file(filepath);
    if (!file.is_open()) {
        WAYFARER_LOG_ERROR("Failed to open config file: {}", filepath.string());
        return std::unexpected(ConfigError::FileNotFound);
    }

    try {
        m_data = nlohmann::json::parse(file);
    } catch (const nlohmann::json::exception& e) {
        WAYFARER_LOG_ERROR("Failed to parse config file: {}", e.what());
        return std::unexpected(ConfigError::ParseError);
    }

    if (!m_data.is_object()) {
        WAYFARER_LOG_ERROR("Config root must be an object: {}", filepath.string());
        m_data = nlohmann::json::object();
        return std::unexpected(ConfigError::ParseError);
    }

    WAYFARER_LOG_INFO("Loaded configuration from: {}", filepath.string());
    return {};
}

std::expected<void, ConfigError> Config::Save(const std::filesystem::path& filepath) const {
    const auto& path = filepath.empty() ? m_filepath : filepath;
    if (path.empty()) {
        WAYFARER_LOG_WARN("No config file path set, cannot save");
        return std::unexpected(ConfigError::WriteError);
    }

    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
    }

    std::ofstream file(path);
    if (!file.is_open()) {
        WAYFARER_LOG_ERROR("Failed to open config file for writing: {}", path.string());
        return std::unexpected(ConfigError::WriteError);
    }

    file << std::setw(4) << m_data << std::endl;
    WAYFARER_LOG_INFO("Saved configuration to: {}", path.string());
    return {};
}

std::expected<void, ConfigError> Config::Reload() {
    if (m_filepath.empty()) {
        WAYFARER_LOG_WARN("No config file path set, cannot reload");
        return std::unexpected(ConfigError::FileNotFound);
    }
    return Load(m_filepath);
}

bool Config::Has(std::string_view key) const {
    return NavigateToKey(key) != nullptr;
}

namespace {

std::vector<std::string> SplitKey(std::string_view key) {
    std::vector<std::string> parts;
    size_t start = 0;
    size_t end = 0;
    while ((end = key.find('.', start)) != std::string_view::npos) {
        parts.emplace_back(key.substr(start, end - start));
        start = end + 1;
    }
    parts.emplace_back(key.substr(start));
    return parts;
}

} // namespace

nlohmann::json* Config::NavigateToKey(std::string_view key, bool create) {
    nlohmann::json* current = &m_data;
    for (const auto& p : SplitKey(key)) {
        if (!current->is_object()) {
            if (!create) {
                return nullptr;
            }
            *current = nlohmann::json::object();
        }
        if (!current->contains(p)) {
            if (!create) {
                return nullptr;
            }
            (*current)[p] = nlohmann::json::object();
        }
        current = &(*current)[p];
    }
    return current;
}

const nlohmann::json* Config::NavigateToKey(std::string_view key) const {
    const nlohmann::json* current = &m_data;
    for (const auto& p : SplitKey(key)) {
        if (!current->is_object() || !current->contains(p)) {
            return nullptr;
        }
        current = &(*current)[p];
    }
    return current;
}

nlohmann::json Config::DefaultJson() {
    nlohmann::json config;

    // Controller tunables
    config["bot"]["aggro_range"] = 2500.0;
    config["bot"]["arrival_tolerance"] = 250.0;
    config["bot"]["early_advance_dist"] = 375.0;
    config["bot"]["combat_reach_dist"] = 312.0;
    config["bot"]["log_actions"] = false;
    config["bot"]["stats_interval_seconds"] = 30.0;

    // Hostile query throttling
    config["scanner"]["interval_ms"] = 500;
    config["scanner"]["move_threshold_ratio"] = 0.75;

    // Rally point debounce
    config["rally"]["radius"] = 2500.0;
    config["rally"]["debounce_seconds"] = 5.0;

    // Mission flow
    config["mission"]["transition_delay_ms"] = 1000;
    config["mission"]["setup_delay_ms"] = 5000;

    // Logging
    config["logging"]["level"] = "info";
    config["logging"]["file"] = "";

    return config;
}

std::expected<void, ConfigError> Config::CreateDefault(const std::filesystem::path& filepath) {
    Config config(DefaultJson());
    return config.Save(filepath);
}

} // namespace Wayfarer
