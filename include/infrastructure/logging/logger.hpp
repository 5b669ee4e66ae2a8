// EN: Structured logger for AnyFile Pipeline - NDJSON lines with correlation IDs and metadata.
// FR: Logger structuré pour AnyFile Pipeline - lignes NDJSON avec IDs de corrélation et métadonnées.

#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <unordered_map>

namespace AFP {

// EN: Log levels enumeration.
// FR: Énumération des niveaux de log.
enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

// EN: Parse a level name ("debug", "info", "warn", "error"), case-insensitive.
// FR: Analyse un nom de niveau ("debug", "info", "warn", "error"), insensible à la casse.
std::optional<LogLevel> parseLogLevel(const std::string& name);

// EN: Thread-safe singleton logger with NDJSON output and correlation IDs.
// FR: Logger singleton thread-safe avec sortie NDJSON et IDs de corrélation.
class Logger {
public:
    using Metadata = std::unordered_map<std::string, std::string>;

    // EN: Structure representing a log entry.
    // FR: Structure représentant une entrée de log.
    struct LogEntry {
        std::chrono::system_clock::time_point timestamp;
        LogLevel level;
        std::string message;
        std::string correlation_id;
        std::string module;
        std::string thread_id;
        Metadata metadata;
    };

    static Logger& getInstance();

    void setLogLevel(LogLevel level);

    // EN: Redirect output to a caller-owned stream; nullptr restores the console.
    // FR: Redirige la sortie vers un flux du caller ; nullptr restaure la console.
    void setOutputStream(std::ostream* stream);

    void setCorrelationId(const std::string& correlation_id);

    // EN: Log a message with specified level.
    // FR: Enregistre un message avec le niveau spécifié.
    void log(LogLevel level, const std::string& module, const std::string& message);
    void log(LogLevel level, const std::string& module, const std::string& message,
             const Metadata& metadata);

    void debug(const std::string& module, const std::string& message);
    void info(const std::string& module, const std::string& message);
    void warn(const std::string& module, const std::string& message);
    void error(const std::string& module, const std::string& message);

    void debug(const std::string& module, const std::string& message, const Metadata& metadata);
    void info(const std::string& module, const std::string& message, const Metadata& metadata);
    void warn(const std::string& module, const std::string& message, const Metadata& metadata);
    void error(const std::string& module, const std::string& message, const Metadata& metadata);

    void flush();

    // EN: Generate a new correlation ID (UUID-like format).
    // FR: Génère un nouvel ID de corrélation (format UUID).
    std::string generateCorrelationId();

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void writeEntry(const LogEntry& entry);
    std::string formatAsNDJSON(const LogEntry& entry) const;
    std::string timestampToISO8601(const std::chrono::system_clock::time_point& tp) const;
    std::string getThreadId() const;
    static std::string levelToString(LogLevel level);

    LogLevel current_level_ = LogLevel::INFO;
    std::string correlation_id_;
    std::ostream* stream_ = nullptr;
    mutable std::mutex mutex_;
    bool console_output_ = true;
};

#define LOG_DEBUG(module, message) AFP::Logger::getInstance().debug(module, message)
#define LOG_INFO(module, message) AFP::Logger::getInstance().info(module, message)
#define LOG_WARN(module, message) AFP::Logger::getInstance().warn(module, message)
#define LOG_ERROR(module, message) AFP::Logger::getInstance().error(module, message)

#define LOG_DEBUG_META(module, message, metadata) AFP::Logger::getInstance().debug(module, message, metadata)
#define LOG_INFO_META(module, message, metadata) AFP::Logger::getInstance().info(module, message, metadata)
#define LOG_WARN_META(module, message, metadata) AFP::Logger::getInstance().warn(module, message, metadata)
#define LOG_ERROR_META(module, message, metadata) AFP::Logger::getInstance().error(module, message, metadata)

} // namespace AFP
