// EN: Built-in progress consumers - legacy callback adapter, throttled logger and terminal bar
// FR: Consommateurs de progression intégrés - adaptateur de callback, logger limité et barre terminal

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <ostream>
#include <string>

#include "infrastructure/logging/logger.hpp"
#include "progress/progress_consumer.hpp"
#include "progress/terminal_bar.hpp"

namespace AFP {
namespace Progress {

// EN: Old-style pipeline callback: (current, total), total absent when indeterminate
// FR: Callback de pipeline ancien style : (current, total), total absent si indéterminé
using LegacyProgressCallback = std::function<void(int64_t, std::optional<int64_t>)>;

// EN: Bridges the consumer interface to a two-argument legacy callback.
//     Callback exceptions are logged and never rethrown.
// FR: Relie l'interface consommateur à un callback ancien style à deux arguments.
//     Les exceptions du callback sont journalisées et jamais relancées.
class CallbackAdapterConsumer : public ProgressConsumer {
public:
    explicit CallbackAdapterConsumer(LegacyProgressCallback callback);

    void onProgress(const ProgressUpdate& update) override;
    void onComplete(const ProgressState& state) override;

private:
    void invoke(const ProgressState& state, const char* phase);
    void reportCallbackFailure(const ProgressState& state, const char* phase, const std::string& cause);

    LegacyProgressCallback callback_;
};

// EN: Rate-limited structured log lines, with a clock independent from the emitter's throttle
// FR: Lignes de log structurées à débit limité, avec une horloge indépendante de la limitation de l'émetteur
class ThrottledLoggingConsumer : public ProgressConsumer {
public:
    explicit ThrottledLoggingConsumer(Logger& logger = Logger::getInstance(),
                                      LogLevel level = LogLevel::INFO,
                                      std::chrono::milliseconds log_interval = std::chrono::seconds(5),
                                      std::string module = "progress");

    void onProgress(const ProgressUpdate& update) override;
    void onComplete(const ProgressState& state) override;

    std::chrono::milliseconds getLogInterval() const { return log_interval_; }

    // EN: Message formats shared with tests and other sinks
    // FR: Formats de message partagés avec les tests et d'autres récepteurs
    static std::string formatProgressMessage(const ProgressState& state);
    static std::string formatCompletionMessage(const ProgressState& state);

private:
    Logger::Metadata buildMetadata(const ProgressState& state, UpdateType type) const;

    Logger& logger_;
    LogLevel level_;
    std::chrono::milliseconds log_interval_;
    std::string module_;
    std::optional<Clock::time_point> last_log_time_;
};

// EN: Options for the terminal bar consumer
// FR: Options du consommateur barre terminal
struct TerminalBarOptions {
    bool show_percentage = true;
    bool show_count = true;
    std::optional<std::string> title;       // EN: Replaces the label as title, the label becomes the text / FR: Remplace le label comme titre, le label devient le texte
    std::ostream* output_stream = nullptr;  // EN: nullptr means std::cerr / FR: nullptr signifie std::cerr
    size_t bar_width = 40;
};

// EN: Renders a live bar. Opens lazily, reopens when the total changes, closes on completion.
// FR: Affiche une barre en direct. Ouverture paresseuse, réouverture si le total change, fermeture à la fin.
class TerminalBarConsumer : public ProgressConsumer {
public:
    explicit TerminalBarConsumer(TerminalBarOptions options = {});
    ~TerminalBarConsumer() override;

    TerminalBarConsumer(const TerminalBarConsumer&) = delete;
    TerminalBarConsumer& operator=(const TerminalBarConsumer&) = delete;

    void onProgress(const ProgressUpdate& update) override;
    void onComplete(const ProgressState& state) override;

    bool isBarOpen() const { return bar_ != nullptr; }
    size_t getBarsOpened() const { return bars_opened_; }
    const TerminalBar* getBar() const { return bar_.get(); }

private:
    void openBar(const ProgressState& state);
    void closeBar();
    void advanceTo(int64_t target);

    TerminalBarOptions options_;
    std::unique_ptr<TerminalBar> bar_;
    std::optional<int64_t> bar_total_;
    size_t bars_opened_ = 0;
};

} // namespace Progress
} // namespace AFP
