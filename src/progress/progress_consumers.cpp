// EN: Built-in progress consumers implementation
// FR: Implémentation des consommateurs de progression intégrés

#include "progress/progress_consumers.hpp"
#include "progress/progress_errors.hpp"

#include <cstdio>

namespace AFP {
namespace Progress {

namespace {

const char* const kDefaultLabel = "Processing";

std::string labelOf(const ProgressState& state) {
    return state.getLabel().value_or(kDefaultLabel);
}

} // namespace

// ---------------------------------------------------------------------------
// CallbackAdapterConsumer
// ---------------------------------------------------------------------------

CallbackAdapterConsumer::CallbackAdapterConsumer(LegacyProgressCallback callback)
    : callback_(std::move(callback)) {
    if (!callback_) {
        throw InvalidEmitterArgument("legacy progress callback must not be empty");
    }
}

void CallbackAdapterConsumer::onProgress(const ProgressUpdate& update) {
    invoke(update.getState(), "onProgress");
}

void CallbackAdapterConsumer::onComplete(const ProgressState& state) {
    invoke(state, "onComplete");
}

void CallbackAdapterConsumer::reportCallbackFailure(const ProgressState& state, const char* phase,
                                                    const std::string& cause) {
    LOG_ERROR_META("progress_callback", "Legacy progress callback failed: " + cause,
                   (Logger::Metadata{{"phase", phase}, {"label", labelOf(state)}}));
}

void CallbackAdapterConsumer::invoke(const ProgressState& state, const char* phase) {
    try {
        callback_(state.getCurrent(), state.getTotal());
    } catch (const std::exception& e) {
        reportCallbackFailure(state, phase, e.what());
    } catch (...) {
        reportCallbackFailure(state, phase, "unknown exception");
    }
}

// ---------------------------------------------------------------------------
// ThrottledLoggingConsumer
// ---------------------------------------------------------------------------

ThrottledLoggingConsumer::ThrottledLoggingConsumer(Logger& logger, LogLevel level,
                                                   std::chrono::milliseconds log_interval,
                                                   std::string module)
    : logger_(logger), level_(level), log_interval_(log_interval), module_(std::move(module)) {
    if (log_interval_.count() < 0) {
        throw InvalidEmitterArgument("log interval must be non-negative");
    }
}

void ThrottledLoggingConsumer::onProgress(const ProgressUpdate& update) {
    const auto now = Clock::now();
    if (last_log_time_ && now - *last_log_time_ < log_interval_) {
        return;
    }
    last_log_time_ = now;

    const ProgressState& state = update.getState();
    logger_.log(level_, module_, formatProgressMessage(state), buildMetadata(state, update.getType()));
}

// EN: Completion bypasses the interval check.
// FR: La complétion ignore la vérification d'intervalle.
void ThrottledLoggingConsumer::onComplete(const ProgressState& state) {
    last_log_time_ = Clock::now();
    logger_.log(level_, module_, formatCompletionMessage(state), buildMetadata(state, UpdateType::COMPLETED));
}

std::string ThrottledLoggingConsumer::formatProgressMessage(const ProgressState& state) {
    if (state.isIndeterminate()) {
        return labelOf(state) + ": " + std::to_string(state.getCurrent()) + " items";
    }

    std::string message = labelOf(state) + ": " + std::to_string(state.getCurrent()) + "/" +
                          std::to_string(*state.getTotal());

    // EN: A zero total has no percentage
    // FR: Un total nul n'a pas de pourcentage
    if (const auto percentage = state.percentage()) {
        char pct[32];
        std::snprintf(pct, sizeof(pct), " (%.1f%%)", *percentage);
        message += pct;
    }
    return message;
}

std::string ThrottledLoggingConsumer::formatCompletionMessage(const ProgressState& state) {
    if (state.isIndeterminate()) {
        return labelOf(state) + ": complete (" + std::to_string(state.getCurrent()) + " items)";
    }
    return labelOf(state) + ": complete (" + std::to_string(state.getCurrent()) + "/" +
           std::to_string(*state.getTotal()) + ")";
}

Logger::Metadata ThrottledLoggingConsumer::buildMetadata(const ProgressState& state, UpdateType type) const {
    Logger::Metadata metadata{
        {"current", std::to_string(state.getCurrent())},
        {"total", state.getTotal() ? std::to_string(*state.getTotal()) : "none"},
        {"update_type", updateTypeToString(type)}
    };
    for (const auto& [key, value] : state.getMetadata()) {
        metadata.emplace(key, value.is_string() ? value.get<std::string>() : value.dump());
    }
    return metadata;
}

// ---------------------------------------------------------------------------
// TerminalBarConsumer
// ---------------------------------------------------------------------------

TerminalBarConsumer::TerminalBarConsumer(TerminalBarOptions options)
    : options_(std::move(options)) {}

// EN: An abandoned consumer still releases its bar.
// FR: Un consommateur abandonné libère quand même sa barre.
TerminalBarConsumer::~TerminalBarConsumer() {
    closeBar();
}

void TerminalBarConsumer::onProgress(const ProgressUpdate& update) {
    const ProgressState& state = update.getState();

    if (!bar_ || state.getTotal() != bar_total_) {
        closeBar();
        openBar(state);
    }

    advanceTo(state.getCurrent());

    // EN: With a title override the label moves to the trailing text
    // FR: Avec un titre imposé, le label passe dans le texte de fin
    if (options_.title && state.getLabel()) {
        bar_->setText(*state.getLabel());
    }
}

void TerminalBarConsumer::onComplete(const ProgressState& state) {
    if (!bar_) {
        return;
    }
    if (!bar_->isIndeterminate() && state.getTotal()) {
        advanceTo(*state.getTotal());
    }
    closeBar();
}

void TerminalBarConsumer::openBar(const ProgressState& state) {
    TerminalBarStyle style;
    style.output_stream = options_.output_stream;
    style.bar_width = options_.bar_width;
    style.show_percentage = options_.show_percentage;
    style.show_count = options_.show_count;

    const std::string title = options_.title ? *options_.title : labelOf(state);
    bar_ = std::make_unique<TerminalBar>(state.getTotal(), title, style);
    bar_total_ = state.getTotal();
    ++bars_opened_;
}

void TerminalBarConsumer::closeBar() {
    if (bar_) {
        bar_->close();
        bar_.reset();
    }
}

// EN: Advance by the gap only, so skipped (throttled) states do not matter.
// FR: Avance uniquement de l'écart, les états sautés (limités) n'ont donc pas d'importance.
void TerminalBarConsumer::advanceTo(int64_t target) {
    const int64_t gap = target - bar_->getPosition();
    if (gap > 0) {
        bar_->advance(gap);
    }
}

} // namespace Progress
} // namespace AFP
