// EN: Error taxonomy for the progress-reporting core
// FR: Taxonomie des erreurs du noyau de suivi de progression

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace AFP {
namespace Progress {

// EN: Snapshot invariant violation (negative current, current above total, label too long)
// FR: Violation d'invariant d'un instantané (current négatif, current au-dessus du total, label trop long)
class InvalidProgressState : public std::invalid_argument {
public:
    explicit InvalidProgressState(const std::string& message)
        : std::invalid_argument("Invalid progress state: " + message) {}
};

// EN: Rejected emitter call argument (delta, weight, total, absolute position)
// FR: Argument d'appel d'émetteur rejeté (delta, poids, total, position absolue)
class InvalidEmitterArgument : public std::invalid_argument {
public:
    explicit InvalidEmitterArgument(const std::string& message)
        : std::invalid_argument("Invalid emitter argument: " + message) {}
};

// EN: Failure raised by a consumer while being notified. Isolated and logged, never propagated.
// FR: Échec levé par un consommateur pendant sa notification. Isolé et journalisé, jamais propagé.
class ConsumerNotificationError : public std::runtime_error {
public:
    ConsumerNotificationError(size_t consumer_index, const std::string& phase, const std::string& cause)
        : std::runtime_error("Consumer #" + std::to_string(consumer_index) + " failed in " + phase + ": " + cause),
          consumer_index_(consumer_index),
          phase_(phase) {}

    size_t getConsumerIndex() const { return consumer_index_; }
    const std::string& getPhase() const { return phase_; }

private:
    size_t consumer_index_;
    std::string phase_;
};

} // namespace Progress
} // namespace AFP
