// EN: Notification interface implemented by every progress sink
// FR: Interface de notification implémentée par chaque récepteur de progression

#pragma once

#include "progress/progress_state.hpp"

namespace AFP {
namespace Progress {

class ProgressConsumer {
public:
    virtual ~ProgressConsumer() = default;

    // EN: Called for every notification that passes the emitter's throttle
    // FR: Appelé pour chaque notification qui passe la limitation de l'émetteur
    virtual void onProgress(const ProgressUpdate& update) = 0;

    // EN: Called once when the emitter completes, after onProgress(COMPLETED)
    // FR: Appelé une fois à la fin de l'émetteur, après onProgress(COMPLETED)
    virtual void onComplete(const ProgressState& state) = 0;
};

} // namespace Progress
} // namespace AFP
