// EN: Collaborator-facing helpers - reporter selection from CLI flags, legacy callback wiring, completion scope
// FR: Aides côté collaborateur - choix du rapporteur selon les options CLI, câblage du callback, portée de complétion

#pragma once

#include <memory>
#include <optional>

#include "infrastructure/config/progress_config.hpp"
#include "progress/progress_consumers.hpp"
#include "progress/progress_emitter.hpp"

namespace AFP {
namespace Progress {

// EN: Flags owned by the pipeline CLIs (--progress / --verbose)
// FR: Options détenues par les CLI des pipelines (--progress / --verbose)
struct ReportingOptions {
    bool progress = false;
    bool verbose = false;
    std::optional<bool> interactive;  // EN: Unset means detect from stderr / FR: Non défini signifie détection via stderr
    std::ostream* output_stream = nullptr;
};

enum class ReporterKind {
    NONE,
    TERMINAL_BAR,
    THROTTLED_LOG
};

bool isInteractiveTerminal();

// EN: No flag -> NONE; interactive -> TERMINAL_BAR; otherwise THROTTLED_LOG
// FR: Aucune option -> NONE ; interactif -> TERMINAL_BAR ; sinon THROTTLED_LOG
ReporterKind selectReporter(const ReportingOptions& options, bool interactive);

// EN: Build the selected consumer from the settings and attach it to the emitter. Returns nullptr for NONE.
// FR: Construit le consommateur choisi selon les paramètres et l'attache à l'émetteur. Retourne nullptr pour NONE.
std::shared_ptr<ProgressConsumer> attachReporter(ProgressEmitter& emitter,
                                                 const ReportingOptions& options,
                                                 const ProgressSettings& settings = {});

// EN: Wrap an old-style progressCallback(current, total). Empty callbacks attach nothing.
// FR: Enveloppe un ancien progressCallback(current, total). Un callback vide n'attache rien.
std::shared_ptr<ProgressConsumer> adaptLegacyCallback(ProgressEmitter& emitter, LegacyProgressCallback callback);

// EN: RAII guard completing the emitter when the scope exits early, so consumer resources are released.
// FR: Garde RAII qui complète l'émetteur si la portée se termine prématurément, libérant les ressources des consommateurs.
class ProgressScope {
public:
    explicit ProgressScope(ProgressEmitter& emitter) : emitter_(emitter) {}
    ~ProgressScope();

    ProgressScope(const ProgressScope&) = delete;
    ProgressScope& operator=(const ProgressScope&) = delete;

    ProgressEmitter& emitter() { return emitter_; }

    // EN: Report an error now; completion still happens when the scope exits
    // FR: Signale une erreur maintenant ; la complétion a toujours lieu en sortie de portée
    void fail(const std::string& message);

private:
    ProgressEmitter& emitter_;
};

} // namespace Progress
} // namespace AFP
