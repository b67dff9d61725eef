#pragma once

#include <string>
#include <string_view>
#include <optional>
#include <expected>
#include <filesystem>
#include <type_traits>
#include <nlohmann/json.hpp>
#include <glm/glm.hpp>

namespace Wayfarer {

/**
 * @brief Error types for configuration I/O
 */
enum class ConfigError {
    FileNotFound,
    ParseError,
    WriteError
};

[[nodiscard]] const char* ConfigErrorToString(ConfigError error) noexcept;

/**
 * @brief JSON-based configuration
 *
 * Values are addressed by dot-separated key paths ("bot.aggro_range").
 * A Config is an ordinary object owned by the host and handed to whatever
 * needs to read tunables from it.
 */
class Config {
public:
    Config() = default;
    explicit Config(nlohmann::json data) : m_data(std::move(data)) {}

    /**
     * @brief Load configuration from JSON file
     *
     * A missing file is reported as FileNotFound and leaves the current
     * values untouched.
     */
    std::expected<void, ConfigError> Load(const std::filesystem::path& filepath);

    /**
     * @brief Save current configuration to JSON file
     * @param filepath Path to save to (uses loaded path if empty)
     */
    std::expected<void, ConfigError> Save(const std::filesystem::path& filepath = "") const;

    /**
     * @brief Reload configuration from disk
     */
    std::expected<void, ConfigError> Reload();

    /**
     * @brief Get a configuration value with type safety
     * @tparam T The expected type
     * @param key Dot-separated key path (e.g., "scanner.interval_ms")
     * @param defaultValue Value to return if key not found or mistyped
     */
    template<typename T>
    T Get(std::string_view key, const T& defaultValue = T{}) const;

    /**
     * @brief Set a configuration value
     */
    template<typename T>
    void Set(std::string_view key, const T& value);

    /**
     * @brief Check if a key exists
     */
    [[nodiscard]] bool Has(std::string_view key) const;

    /**
     * @brief Get the underlying JSON object for direct access
     */
    [[nodiscard]] const nlohmann::json& GetJson() const { return m_data; }

    /**
     * @brief JSON document holding every default value
     */
    [[nodiscard]] static nlohmann::json DefaultJson();

    /**
     * @brief Write the default configuration file
     */
    static std::expected<void, ConfigError> CreateDefault(const std::filesystem::path& filepath);

private:
    nlohmann::json* NavigateToKey(std::string_view key, bool create);
    const nlohmann::json* NavigateToKey(std::string_view key) const;

    nlohmann::json m_data = nlohmann::json::object();
    std::filesystem::path m_filepath;
};

// Template implementations
template<typename T>
T Config::Get(std::string_view key, const T& defaultValue) const {
    const auto* node = NavigateToKey(key);
    if (!node || node->is_null()) {
        return defaultValue;
    }

    if constexpr (std::is_same_v<T, glm::dvec2>) {
        if (node->is_array() && node->size() >= 2 &&
            (*node)[0].is_number() && (*node)[1].is_number()) {
            return glm::dvec2((*node)[0].get<double>(), (*node)[1].get<double>());
        }
        return defaultValue;
    } else if constexpr (std::is_same_v<T, bool>) {
        return node->is_boolean() ? node->get<bool>() : defaultValue;
    } else if constexpr (std::is_arithmetic_v<T>) {
        return node->is_number() ? node->get<T>() : defaultValue;
    } else if constexpr (std::is_same_v<T, std::string>) {
        return node->is_string() ? node->get<std::string>() : defaultValue;
    } else {
        try {
            return node->get<T>();
        } catch (const nlohmann::json::exception&) {
            return defaultValue;
        }
    }
}

template<typename T>
void Config::Set(std::string_view key, const T& value) {
    auto* node = NavigateToKey(key, true);
    if (node) {
        if constexpr (std::is_same_v<T, glm::dvec2>) {
            *node = nlohmann::json::array({value.x, value.y});
        } else {
            *node = value;
        }
    }
}

} // namespace Wayfarer
