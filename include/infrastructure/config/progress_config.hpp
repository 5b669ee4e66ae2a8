// EN: Progress reporting configuration - YAML "progress:" section with environment overrides.
// FR: Configuration du suivi de progression - section YAML "progress:" avec surcharges d'environnement.

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "infrastructure/logging/logger.hpp"

// Forward declaration
namespace YAML { class Node; }

namespace AFP {

// EN: Tunables shared by every pipeline that reports progress.
// FR: Paramètres partagés par chaque pipeline qui rapporte sa progression.
struct ProgressSettings {
    std::chrono::milliseconds throttle_interval{100};   // EN: Emitter throttle / FR: Limitation de l'émetteur
    std::chrono::milliseconds log_interval{5000};       // EN: Logging consumer interval / FR: Intervalle du consommateur de log
    LogLevel log_level = LogLevel::INFO;
    size_t bar_width = 40;
    bool show_percentage = true;
    bool show_count = true;
    std::optional<std::string> title;
};

// EN: Loads and validates ProgressSettings. Errors are collected, never thrown.
// FR: Charge et valide ProgressSettings. Les erreurs sont collectées, jamais lancées.
class ProgressConfig {
public:
    static constexpr const char* kSectionName = "progress";
    static constexpr const char* kDefaultEnvPrefix = "AFP_PROGRESS_";
    static constexpr size_t kMinBarWidth = 10;
    static constexpr size_t kMaxBarWidth = 200;

    ProgressConfig() = default;
    explicit ProgressConfig(const ProgressSettings& settings) : settings_(settings) {}

    // EN: Load the "progress" section from a YAML file or string. Missing keys keep their value.
    // FR: Charge la section "progress" depuis un fichier ou une chaîne YAML. Les clés absentes gardent leur valeur.
    bool loadFromFile(const std::string& filename);
    bool loadFromString(const std::string& yaml_content);

    // EN: Apply <prefix>THROTTLE_INTERVAL_MS, LOG_INTERVAL_MS, LOG_LEVEL, BAR_WIDTH,
    //     SHOW_PERCENTAGE, SHOW_COUNT and TITLE when set.
    // FR: Applique <prefix>THROTTLE_INTERVAL_MS, LOG_INTERVAL_MS, LOG_LEVEL, BAR_WIDTH,
    //     SHOW_PERCENTAGE, SHOW_COUNT et TITLE lorsqu'ils sont définis.
    void loadEnvironmentOverrides(const std::string& prefix = kDefaultEnvPrefix);

    bool validate(std::vector<std::string>& errors) const;

    const ProgressSettings& getSettings() const { return settings_; }
    void setSettings(const ProgressSettings& settings) { settings_ = settings; }

    // EN: Errors from the last load or override pass
    // FR: Erreurs du dernier chargement ou de la dernière passe de surcharge
    const std::vector<std::string>& getErrors() const { return errors_; }

private:
    bool applyYaml(const YAML::Node& root);

    ProgressSettings settings_;
    std::vector<std::string> errors_;
};

} // namespace AFP
