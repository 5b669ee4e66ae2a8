// EN: Implementation of ProgressConfig. YAML parsing with yaml-cpp, environment overrides and validation.
// FR: Implémentation de ProgressConfig. Parsing YAML avec yaml-cpp, surcharges d'environnement et validation.

#include "infrastructure/config/progress_config.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>

namespace AFP {

namespace {

const char* const kModule = "config";

std::optional<bool> parseBool(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (value == "1" || value == "true" || value == "yes" || value == "on") return true;
    if (value == "0" || value == "false" || value == "no" || value == "off") return false;
    return std::nullopt;
}

std::optional<long long> parseInteger(const std::string& value) {
    try {
        size_t consumed = 0;
        long long parsed = std::stoll(value, &consumed);
        if (consumed != value.size()) {
            return std::nullopt;
        }
        return parsed;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // namespace

bool ProgressConfig::loadFromFile(const std::string& filename) {
    errors_.clear();
    try {
        if (!std::filesystem::exists(filename)) {
            errors_.push_back("Configuration file not found: " + filename);
            LOG_ERROR(kModule, errors_.back());
            return false;
        }

        YAML::Node root = YAML::LoadFile(filename);
        if (!applyYaml(root)) {
            return false;
        }

        LOG_INFO(kModule, "Progress configuration loaded from: " + filename);
        return true;

    } catch (const YAML::Exception& e) {
        errors_.push_back("Failed to parse configuration: " + std::string(e.what()));
        LOG_ERROR(kModule, errors_.back());
        return false;
    }
}

bool ProgressConfig::loadFromString(const std::string& yaml_content) {
    errors_.clear();
    try {
        YAML::Node root = YAML::Load(yaml_content);
        return applyYaml(root);
    } catch (const YAML::Exception& e) {
        errors_.push_back("Failed to parse configuration: " + std::string(e.what()));
        LOG_ERROR(kModule, errors_.back());
        return false;
    }
}

// EN: Type errors are reported per key; the remaining keys are still applied.
// FR: Les erreurs de type sont signalées par clé ; les autres clés sont tout de même appliquées.
bool ProgressConfig::applyYaml(const YAML::Node& root) {
    if (!root || root.IsNull()) {
        return true;
    }
    if (!root.IsMap()) {
        errors_.push_back("Configuration root must be a mapping");
        LOG_ERROR(kModule, errors_.back());
        return false;
    }

    const YAML::Node section = root[kSectionName];
    if (!section) {
        LOG_DEBUG(kModule, "No 'progress' section, keeping defaults");
        return true;
    }
    if (!section.IsMap()) {
        errors_.push_back("'progress' must be a mapping");
        LOG_ERROR(kModule, errors_.back());
        return false;
    }

    const size_t errors_before = errors_.size();
    auto readKey = [&](const char* key, auto&& apply) {
        const YAML::Node node = section[key];
        if (!node) {
            return;
        }
        try {
            apply(node);
        } catch (const YAML::Exception&) {
            errors_.push_back(std::string("progress.") + key + ": invalid value '" + node.as<std::string>("") + "'");
        }
    };

    readKey("throttle_interval_ms", [&](const YAML::Node& n) {
        settings_.throttle_interval = std::chrono::milliseconds(n.as<long long>());
    });
    readKey("log_interval_ms", [&](const YAML::Node& n) {
        settings_.log_interval = std::chrono::milliseconds(n.as<long long>());
    });
    readKey("log_level", [&](const YAML::Node& n) {
        auto level = parseLogLevel(n.as<std::string>());
        if (!level) {
            errors_.push_back("progress.log_level: unknown level '" + n.as<std::string>() + "'");
            return;
        }
        settings_.log_level = *level;
    });
    readKey("bar_width", [&](const YAML::Node& n) {
        const long long width = n.as<long long>();
        if (width < 0) {
            errors_.push_back("progress.bar_width: must be non-negative");
            return;
        }
        settings_.bar_width = static_cast<size_t>(width);
    });
    readKey("show_percentage", [&](const YAML::Node& n) { settings_.show_percentage = n.as<bool>(); });
    readKey("show_count", [&](const YAML::Node& n) { settings_.show_count = n.as<bool>(); });
    readKey("title", [&](const YAML::Node& n) { settings_.title = n.as<std::string>(); });

    for (size_t i = errors_before; i < errors_.size(); ++i) {
        LOG_ERROR(kModule, errors_[i]);
    }
    return errors_.size() == errors_before;
}

void ProgressConfig::loadEnvironmentOverrides(const std::string& prefix) {
    LOG_DEBUG(kModule, "Loading environment overrides with prefix: " + prefix);

    auto env = [&](const char* name) -> std::optional<std::string> {
        const char* value = std::getenv((prefix + name).c_str());
        if (!value) {
            return std::nullopt;
        }
        return std::string(value);
    };
    auto reject = [&](const char* name, const std::string& value) {
        errors_.push_back("Invalid environment override " + prefix + name + "='" + value + "'");
        LOG_WARN(kModule, errors_.back());
    };

    if (auto value = env("THROTTLE_INTERVAL_MS")) {
        if (auto parsed = parseInteger(*value)) {
            settings_.throttle_interval = std::chrono::milliseconds(*parsed);
        } else {
            reject("THROTTLE_INTERVAL_MS", *value);
        }
    }
    if (auto value = env("LOG_INTERVAL_MS")) {
        if (auto parsed = parseInteger(*value)) {
            settings_.log_interval = std::chrono::milliseconds(*parsed);
        } else {
            reject("LOG_INTERVAL_MS", *value);
        }
    }
    if (auto value = env("LOG_LEVEL")) {
        if (auto level = parseLogLevel(*value)) {
            settings_.log_level = *level;
        } else {
            reject("LOG_LEVEL", *value);
        }
    }
    if (auto value = env("BAR_WIDTH")) {
        auto parsed = parseInteger(*value);
        if (parsed && *parsed >= 0) {
            settings_.bar_width = static_cast<size_t>(*parsed);
        } else {
            reject("BAR_WIDTH", *value);
        }
    }
    if (auto value = env("SHOW_PERCENTAGE")) {
        if (auto flag = parseBool(*value)) {
            settings_.show_percentage = *flag;
        } else {
            reject("SHOW_PERCENTAGE", *value);
        }
    }
    if (auto value = env("SHOW_COUNT")) {
        if (auto flag = parseBool(*value)) {
            settings_.show_count = *flag;
        } else {
            reject("SHOW_COUNT", *value);
        }
    }
    if (auto value = env("TITLE")) {
        settings_.title = *value;
    }
}

bool ProgressConfig::validate(std::vector<std::string>& errors) const {
    const size_t errors_before = errors.size();

    if (settings_.throttle_interval.count() < 0) {
        errors.push_back("progress.throttle_interval_ms must be >= 0");
    }
    if (settings_.log_interval.count() < 0) {
        errors.push_back("progress.log_interval_ms must be >= 0");
    }
    if (settings_.bar_width < kMinBarWidth || settings_.bar_width > kMaxBarWidth) {
        errors.push_back("progress.bar_width must be between " + std::to_string(kMinBarWidth) +
                         " and " + std::to_string(kMaxBarWidth));
    }
    if (settings_.title && settings_.title->size() > 100) {
        errors.push_back("progress.title must be at most 100 characters");
    }

    return errors.size() == errors_before;
}

} // namespace AFP
