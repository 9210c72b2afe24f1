#include <nagoya-cpp/core/config.hpp>

#include <nagoya-cpp/spec/spec_parser.hpp>

#include <fstream>
#include <set>
#include <sstream>

#include <nlohmann/json.hpp>

namespace nagoya_cpp {

namespace {

const std::set<std::string>& imageKeys()
{
    static const std::set<std::string> keys = {
        "from",    "maintainer",   "entrypoint", "libs",   "runs",      "exposes",
        "volumes", "volumes_from", "links",      "commit", "callbacks", "envs",
    };
    return keys;
}

std::string joinJsonArray(const nlohmann::json& array, const std::string& key)
{
    std::string joined;
    for (const auto& element : array) {
        if (!element.is_string()) {
            throw BuildError(ErrorCode::CONFIG_INVALID,
                             "Array for key '" + key + "' must only contain strings");
        }
        if (!joined.empty()) {
            joined += "\n";
        }
        joined += element.get<std::string>();
    }
    return joined;
}

void applySettings(const nlohmann::json& settings, BuildSettings& result)
{
    if (!settings.is_object()) {
        throw BuildError(ErrorCode::CONFIG_INVALID, "'settings' must be an object");
    }

    try {
        if (settings.contains("engine")) {
            const auto& engine = settings.at("engine");
            result.engine_binary = engine.value("binary", result.engine_binary);
            result.stop_timeout = std::chrono::seconds(
                engine.value("stop_timeout", static_cast<int>(result.stop_timeout.count())));
        }
        if (settings.contains("persist")) {
            result.helper_image = settings.at("persist").value("helper_image", result.helper_image);
        }
        if (settings.contains("work_dir")) {
            result.work_dir = settings.at("work_dir").get<std::string>();
        }
        if (settings.contains("log")) {
            const auto& log_settings = settings.at("log");
            std::string level = log_settings.value("level", std::string("info"));
            std::optional<LogLevel> parsed = parseLogLevel(level);
            if (!parsed) {
                throw BuildError(ErrorCode::CONFIG_INVALID, "Unknown log level '" + level + "'");
            }
            result.log_level = *parsed;
            if (log_settings.contains("file")) {
                result.log_file = log_settings.at("file").get<std::string>();
            }
            result.log_pattern = log_settings.value("pattern", result.log_pattern);
        }
    }
    catch (const nlohmann::json::exception& e) {
        throw BuildError(ErrorCode::CONFIG_INVALID, "Invalid settings: " + std::string(e.what()));
    }
}

} // namespace

ImageConfig::ImageConfig(std::string image_name) : image_name_(std::move(image_name)) {}

const ConfigValue& ImageConfig::getValue(const std::string& key) const
{
    auto it = values_.find(key);
    if (it == values_.end()) {
        throw BuildError(ErrorCode::CONFIG_MISSING,
                         "Configuration key '" + key + "' not found for image " + image_name_);
    }
    return it->second;
}

void ImageConfig::set(const std::string& key, const char* value)
{
    // Keep string literals from converting to bool
    values_[key] = ConfigValue(std::string(value));
}

bool ImageConfig::has(const std::string& key) const
{
    return values_.find(key) != values_.end();
}

void ImageConfig::remove(const std::string& key)
{
    values_.erase(key);
}

std::vector<std::string> ImageConfig::keys() const
{
    std::vector<std::string> result;
    result.reserve(values_.size());
    for (const auto& [key, value] : values_) {
        result.push_back(key);
    }
    return result;
}

std::vector<std::string> ImageConfig::optionalPlural(const std::string& key) const
{
    auto* logger = Logger::getInstance(BUILD_LOGGER);
    if (!has(key)) {
        logger->debug("Optional config key {} does not exist", key);
        return {};
    }

    logger->debug("Optional config key {} exists", key);
    return spec::lineSplit(get<std::string>(key));
}

void BuildConfig::loadFromFile(const std::filesystem::path& filename)
{
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw BuildError(ErrorCode::FILE_NOT_FOUND,
                         "Cannot open configuration file: " + filename.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    loadFromString(buffer.str());
}

void BuildConfig::loadFromString(const std::string& json_text)
{
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(json_text);
    }
    catch (const nlohmann::json::parse_error& e) {
        throw BuildError(ErrorCode::CONFIG_INVALID,
                         "Invalid JSON configuration: " + std::string(e.what()));
    }

    if (!root.is_object()) {
        throw BuildError(ErrorCode::CONFIG_INVALID, "Configuration root must be an object");
    }

    for (const auto& [section_name, section] : root.items()) {
        if (section_name == "settings") {
            applySettings(section, settings_);
            continue;
        }

        if (!section.is_object()) {
            throw BuildError(ErrorCode::CONFIG_INVALID,
                             "Image section '" + section_name + "' must be an object");
        }

        ImageConfig image(section_name);
        for (const auto& [key, value] : section.items()) {
            if (imageKeys().count(key) == 0) {
                throw BuildError(ErrorCode::CONFIG_INVALID,
                                 "Unknown key '" + key + "' in image " + section_name);
            }
            if (value.is_string()) {
                image.set(key, value.get<std::string>());
            }
            else if (value.is_boolean()) {
                image.set(key, value.get<bool>());
            }
            else if (value.is_array()) {
                image.set(key, joinJsonArray(value, key));
            }
            else {
                throw BuildError(ErrorCode::CONFIG_INVALID,
                                 "Unsupported value for key '" + key + "' of image " + section_name);
            }
        }

        if (!image.has("from")) {
            throw BuildError(ErrorCode::CONFIG_MISSING,
                             "Image " + section_name + " has no 'from' key");
        }

        addImage(std::move(image));
    }
}

void BuildConfig::addImage(ImageConfig image)
{
    std::string name = image.getImageName();
    images_[name] = std::move(image);
}

bool BuildConfig::hasImage(const std::string& image_name) const
{
    return images_.find(image_name) != images_.end();
}

const ImageConfig& BuildConfig::getImage(const std::string& image_name) const
{
    auto it = images_.find(image_name);
    if (it == images_.end()) {
        throw BuildError(ErrorCode::CONFIG_MISSING, "No configuration for image " + image_name);
    }
    return it->second;
}

std::vector<std::string> BuildConfig::getImageNames() const
{
    std::vector<std::string> names;
    names.reserve(images_.size());
    for (const auto& [name, image] : images_) {
        names.push_back(name);
    }
    return names;
}

} // namespace nagoya_cpp
