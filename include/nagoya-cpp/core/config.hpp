#pragma once

#include <nagoya-cpp/core/error.hpp>
#include <nagoya-cpp/core/logger.hpp>

#include <chrono>
#include <filesystem>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace nagoya_cpp {

using ConfigValue = std::variant<std::string, bool>;

/**
 * @brief One image section of the build configuration
 *
 * List-valued keys hold newline-separated lines, the same text the option
 * parser consumes. Arrays from the configuration file are joined with
 * newlines on load.
 */
class ImageConfig {
public:
    ImageConfig() = default;
    explicit ImageConfig(std::string image_name);

    template <typename T>
    void set(const std::string& key, const T& value);
    void set(const std::string& key, const char* value);

    template <typename T>
    T get(const std::string& key) const;

    template <typename T>
    T get(const std::string& key, const T& default_value) const;

    bool has(const std::string& key) const;
    void remove(const std::string& key);
    std::vector<std::string> keys() const;

    /**
     * @brief Trimmed, non-empty lines of a list key; empty when the key is absent
     */
    std::vector<std::string> optionalPlural(const std::string& key) const;

    const std::string& getImageName() const
    {
        return image_name_;
    }

private:
    std::string image_name_;
    std::map<std::string, ConfigValue> values_;

    const ConfigValue& getValue(const std::string& key) const;
};

/**
 * @brief Process-wide build settings, the "settings" object of the configuration file
 */
struct BuildSettings {
    std::string engine_binary = "docker";
    std::chrono::seconds stop_timeout{20};
    std::string helper_image = "busybox:latest";
    std::filesystem::path work_dir = std::filesystem::temp_directory_path();
    LogLevel log_level = LogLevel::INFO;
    std::filesystem::path log_file;
    std::string log_pattern = "[%l] %n: %v";
    bool quiet_build = false;
};

class BuildConfig {
public:
    BuildConfig() = default;

    void loadFromFile(const std::filesystem::path& filename);
    void loadFromString(const std::string& json_text);

    void addImage(ImageConfig image);
    bool hasImage(const std::string& image_name) const;
    const ImageConfig& getImage(const std::string& image_name) const;
    std::vector<std::string> getImageNames() const;

    BuildSettings& getSettings()
    {
        return settings_;
    }
    const BuildSettings& getSettings() const
    {
        return settings_;
    }

private:
    std::map<std::string, ImageConfig> images_;
    BuildSettings settings_;
};

// Template implementations
template <typename T>
void ImageConfig::set(const std::string& key, const T& value)
{
    values_[key] = ConfigValue(value);
}

template <typename T>
T ImageConfig::get(const std::string& key) const
{
    const ConfigValue& value = getValue(key);
    try {
        return std::get<T>(value);
    }
    catch (const std::bad_variant_access&) {
        throw BuildError(ErrorCode::INVALID_TYPE,
                         "Invalid type for configuration key '" + key + "' of image " + image_name_);
    }
}

template <typename T>
T ImageConfig::get(const std::string& key, const T& default_value) const
{
    if (!has(key)) {
        return default_value;
    }
    return get<T>(key);
}

} // namespace nagoya_cpp
