// EN: Collaborator-facing helpers implementation
// FR: Implémentation des aides côté collaborateur

#include "progress/progress_reporting.hpp"
#include "infrastructure/logging/logger.hpp"

#include <unistd.h>

namespace AFP {
namespace Progress {

bool isInteractiveTerminal() {
    return ::isatty(STDERR_FILENO) == 1;
}

ReporterKind selectReporter(const ReportingOptions& options, bool interactive) {
    if (!options.progress && !options.verbose) {
        return ReporterKind::NONE;
    }
    return interactive ? ReporterKind::TERMINAL_BAR : ReporterKind::THROTTLED_LOG;
}

std::shared_ptr<ProgressConsumer> attachReporter(ProgressEmitter& emitter,
                                                 const ReportingOptions& options,
                                                 const ProgressSettings& settings) {
    const bool interactive = options.interactive.value_or(isInteractiveTerminal());
    std::shared_ptr<ProgressConsumer> consumer;

    switch (selectReporter(options, interactive)) {
        case ReporterKind::NONE:
            return nullptr;

        case ReporterKind::TERMINAL_BAR: {
            TerminalBarOptions bar_options;
            bar_options.show_percentage = settings.show_percentage;
            bar_options.show_count = settings.show_count;
            bar_options.title = settings.title;
            bar_options.bar_width = settings.bar_width;
            bar_options.output_stream = options.output_stream;
            consumer = std::make_shared<TerminalBarConsumer>(bar_options);
            break;
        }

        case ReporterKind::THROTTLED_LOG:
            consumer = std::make_shared<ThrottledLoggingConsumer>(
                Logger::getInstance(), settings.log_level, settings.log_interval);
            break;
    }

    emitter.addConsumer(consumer);
    return consumer;
}

std::shared_ptr<ProgressConsumer> adaptLegacyCallback(ProgressEmitter& emitter, LegacyProgressCallback callback) {
    if (!callback) {
        return nullptr;
    }
    auto consumer = std::make_shared<CallbackAdapterConsumer>(std::move(callback));
    emitter.addConsumer(consumer);
    return consumer;
}

ProgressScope::~ProgressScope() {
    if (emitter_.isCompleted()) {
        return;
    }
    try {
        emitter_.complete();
    } catch (const std::exception& e) {
        LOG_ERROR("progress_scope", std::string("Failed to complete progress on scope exit: ") + e.what());
    } catch (...) {
        LOG_ERROR("progress_scope", "Failed to complete progress on scope exit: unknown exception");
    }
}

void ProgressScope::fail(const std::string& message) {
    emitter_.reportError(message);
}

} // namespace Progress
} // namespace AFP
