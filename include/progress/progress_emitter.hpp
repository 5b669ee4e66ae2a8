// EN: Progress emitter for AnyFile Pipeline - mutable progress driver with weighted child aggregation
// FR: Émetteur de progression pour AnyFile Pipeline - pilote mutable avec agrégation pondérée des enfants

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "progress/progress_consumer.hpp"
#include "progress/progress_state.hpp"

namespace AFP {
namespace Progress {

// EN: Owns the current snapshot, its consumers and the child emitters it spawned.
//     Not internally synchronized: callers serialize access to one emitter tree.
// FR: Possède l'instantané courant, ses consommateurs et les émetteurs enfants qu'il a créés.
//     Non synchronisé en interne : les appelants sérialisent l'accès à un arbre d'émetteurs.
class ProgressEmitter {
public:
    explicit ProgressEmitter(std::optional<int64_t> total,
                             std::optional<std::string> label = std::nullopt,
                             std::chrono::milliseconds throttle_interval = std::chrono::milliseconds(0));
    ~ProgressEmitter() = default;

    ProgressEmitter(const ProgressEmitter&) = delete;
    ProgressEmitter& operator=(const ProgressEmitter&) = delete;
    ProgressEmitter(ProgressEmitter&&) = delete;
    ProgressEmitter& operator=(ProgressEmitter&&) = delete;

    // EN: Progress updates
    // FR: Mises à jour de progression
    void update(int64_t delta = 1, bool force = false);
    void setCurrent(int64_t value, bool force = false);
    void updateTotal(std::optional<int64_t> new_total);
    void complete();
    void reportError(const std::string& message);

    // EN: Metadata carried by every snapshot created after this call
    // FR: Métadonnées portées par chaque instantané créé après cet appel
    void setMetadata(const std::string& key, const nlohmann::json& value);

    // EN: Hierarchy. The returned child is owned by this emitter.
    // FR: Hiérarchie. L'enfant retourné appartient à cet émetteur.
    ProgressEmitter& createChild(std::optional<int64_t> total, double weight = 1.0,
                                 std::optional<std::string> label = std::nullopt);

    // EN: Consumer registration. Registration order is notification order.
    // FR: Enregistrement des consommateurs. L'ordre d'enregistrement est l'ordre de notification.
    void addConsumer(std::shared_ptr<ProgressConsumer> consumer);
    void removeConsumer(const std::shared_ptr<ProgressConsumer>& consumer);
    size_t getConsumerCount() const { return consumers_.size(); }

    const ProgressState& getState() const { return state_; }
    int64_t getCurrent() const { return state_.getCurrent(); }
    std::optional<int64_t> getTotal() const { return state_.getTotal(); }
    const std::optional<std::string>& getLabel() const { return state_.getLabel(); }
    std::chrono::milliseconds getThrottleInterval() const { return throttle_interval_; }

    bool isCompleted() const { return completed_; }
    bool isStarted() const { return started_; }
    ProgressEmitter* getParent() const { return parent_; }
    size_t getChildCount() const { return children_.size(); }

    // EN: Number of consumer failures caught and isolated so far
    // FR: Nombre d'échecs de consommateurs interceptés et isolés jusqu'ici
    size_t getConsumerErrorCount() const { return consumer_error_count_; }

    // EN: Fraction in [0, 1] this emitter contributes to its parent
    // FR: Fraction dans [0, 1] que cet émetteur apporte à son parent
    double getFractionComplete() const;

private:
    struct ChildEntry {
        std::unique_ptr<ProgressEmitter> emitter;
        double weight;
    };

    ProgressEmitter(std::optional<int64_t> total, std::optional<std::string> label,
                    std::chrono::milliseconds throttle_interval, ProgressEmitter* parent);

    ProgressState makeState(int64_t current, std::optional<int64_t> total) const;
    UpdateType nextAdvanceType();
    bool shouldNotify(bool force);
    void notifyConsumers(const ProgressUpdate& update);
    void handleConsumerFailure(size_t index, const std::string& phase, const std::string& cause);
    void applyAdvance(int64_t new_current, bool force);

    // EN: Upward propagation hooks
    // FR: Points d'accroche de la propagation ascendante
    void propagateToParent(int64_t delta);
    void recalculateFromChildren(int64_t child_delta);

    // EN: round(total * sum(weight * fraction) / sum(weight)), clamped to [0, total]
    // FR: round(total * somme(poids * fraction) / somme(poids)), borné à [0, total]
    std::optional<int64_t> aggregatedPosition(int64_t total) const;

    ProgressState state_;
    std::chrono::milliseconds throttle_interval_;
    std::optional<Clock::time_point> last_notify_time_;
    ProgressMetadata metadata_;

    ProgressEmitter* parent_ = nullptr;
    std::vector<ChildEntry> children_;
    std::vector<std::shared_ptr<ProgressConsumer>> consumers_;

    bool started_ = false;
    bool completed_ = false;
    size_t consumer_error_count_ = 0;
};

} // namespace Progress
} // namespace AFP
