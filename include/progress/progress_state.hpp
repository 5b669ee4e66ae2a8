// EN: Progress snapshot model - immutable ProgressState and ProgressUpdate event envelope
// FR: Modèle d'instantané de progression - ProgressState immuable et enveloppe d'événement ProgressUpdate

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace AFP {
namespace Progress {

using Clock = std::chrono::steady_clock;

// EN: Free-form context attached to a snapshot, kept in insertion order
// FR: Contexte libre attaché à un instantané, conservé dans l'ordre d'insertion
using ProgressMetadata = nlohmann::ordered_map<std::string, nlohmann::json>;

// EN: Maximum label length accepted by a snapshot
// FR: Longueur maximale de label acceptée par un instantané
constexpr size_t kMaxLabelLength = 100;

// EN: Progress event types carried by every notification
// FR: Types d'événements de progression portés par chaque notification
enum class UpdateType {
    STARTED,        // EN: First activity on an emitter / FR: Première activité sur un émetteur
    PROGRESS,       // EN: Regular advance, may be throttled / FR: Avancement régulier, peut être limité
    TOTAL_CHANGED,  // EN: Denominator replaced / FR: Dénominateur remplacé
    COMPLETED,      // EN: Operation finished / FR: Opération terminée
    ERROR           // EN: Collaborator reported a failure / FR: Le collaborateur a signalé un échec
};

std::string updateTypeToString(UpdateType type);

// EN: Immutable snapshot of progress. Every observable change creates a new one.
// FR: Instantané immuable de progression. Chaque changement observable en crée un nouveau.
class ProgressState {
public:
    // EN: Throws InvalidProgressState when an invariant is violated. Values are never clamped.
    // FR: Lance InvalidProgressState si un invariant est violé. Les valeurs ne sont jamais bornées.
    ProgressState(int64_t current,
                  std::optional<int64_t> total,
                  std::optional<std::string> label = std::nullopt,
                  ProgressMetadata metadata = {},
                  Clock::time_point timestamp = Clock::now());

    int64_t getCurrent() const { return current_; }
    std::optional<int64_t> getTotal() const { return total_; }
    const std::optional<std::string>& getLabel() const { return label_; }
    Clock::time_point getTimestamp() const { return timestamp_; }
    const ProgressMetadata& getMetadata() const { return metadata_; }

    // EN: Derived values, computed on demand
    // FR: Valeurs dérivées, calculées à la demande
    std::optional<double> percentage() const;
    bool isComplete() const;
    bool isIndeterminate() const { return !total_.has_value(); }
    std::optional<int64_t> itemsRemaining() const;

    // EN: Copy of this snapshot with one extra metadata entry (fresh timestamp)
    // FR: Copie de cet instantané avec une entrée de métadonnées en plus (nouvel horodatage)
    ProgressState withMetadata(const std::string& key, const nlohmann::json& value) const;

    nlohmann::json toJson() const;

private:
    int64_t current_;
    std::optional<int64_t> total_;
    std::optional<std::string> label_;
    ProgressMetadata metadata_;
    Clock::time_point timestamp_;
};

// EN: Event envelope pairing a snapshot with the signed change that produced it
// FR: Enveloppe d'événement associant un instantané au changement signé qui l'a produit
class ProgressUpdate {
public:
    ProgressUpdate(ProgressState state, int64_t delta, UpdateType type)
        : state_(std::move(state)), delta_(delta), type_(type) {}

    const ProgressState& getState() const { return state_; }
    int64_t getDelta() const { return delta_; }
    UpdateType getType() const { return type_; }

private:
    ProgressState state_;
    int64_t delta_;
    UpdateType type_;
};

} // namespace Progress
} // namespace AFP
