// EN: Progress emitter implementation - state advance, throttling, consumer fan-out and weighted aggregation
// FR: Implémentation de l'émetteur - avancement d'état, limitation, diffusion aux consommateurs et agrégation pondérée

#include "progress/progress_emitter.hpp"
#include "progress/progress_errors.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace AFP {
namespace Progress {

namespace {

const char* const kModule = "progress_emitter";

std::optional<int64_t> checkedTotal(std::optional<int64_t> total) {
    if (total && *total < 0) {
        throw InvalidEmitterArgument("total must be non-negative (got " + std::to_string(*total) + ")");
    }
    return total;
}

std::chrono::milliseconds checkedInterval(std::chrono::milliseconds interval) {
    if (interval.count() < 0) {
        throw InvalidEmitterArgument("throttle interval must be non-negative");
    }
    return interval;
}

std::string describeTotal(std::optional<int64_t> total) {
    return total ? std::to_string(*total) : "none";
}

// EN: current + delta (delta >= 1), capped at the total or at INT64_MAX without overflowing
// FR: current + delta (delta >= 1), borné au total ou à INT64_MAX sans dépassement
int64_t advancedPosition(int64_t current, int64_t delta, std::optional<int64_t> total) {
    const int64_t limit = total ? *total : std::numeric_limits<int64_t>::max();
    if (delta >= limit - current) {
        return limit;
    }
    return current + delta;
}

} // namespace

ProgressEmitter::ProgressEmitter(std::optional<int64_t> total,
                                 std::optional<std::string> label,
                                 std::chrono::milliseconds throttle_interval)
    : ProgressEmitter(total, std::move(label), throttle_interval, nullptr) {}

ProgressEmitter::ProgressEmitter(std::optional<int64_t> total,
                                 std::optional<std::string> label,
                                 std::chrono::milliseconds throttle_interval,
                                 ProgressEmitter* parent)
    : state_(0, checkedTotal(total), std::move(label)),
      throttle_interval_(checkedInterval(throttle_interval)),
      parent_(parent) {}

// EN: Relative advance. The new position is clamped to the total when one is set.
// FR: Avancement relatif. La nouvelle position est bornée au total s'il existe.
void ProgressEmitter::update(int64_t delta, bool force) {
    if (delta < 1) {
        throw InvalidEmitterArgument("delta must be at least 1 (got " + std::to_string(delta) + ")");
    }
    if (completed_) {
        LOG_WARN(kModule, "Ignoring update on completed emitter '" + getLabel().value_or("") + "'");
        return;
    }

    applyAdvance(advancedPosition(getCurrent(), delta, getTotal()), force);
}

// EN: Absolute position. Unlike update(), out-of-range values are rejected rather than clamped.
// FR: Position absolue. Contrairement à update(), les valeurs hors bornes sont rejetées.
void ProgressEmitter::setCurrent(int64_t value, bool force) {
    const auto total = getTotal();
    if (value < 0 || (total && value > *total)) {
        throw InvalidEmitterArgument("value " + std::to_string(value) +
                                     " outside [0, " + describeTotal(total) + "]");
    }
    if (completed_) {
        LOG_WARN(kModule, "Ignoring setCurrent on completed emitter '" + getLabel().value_or("") + "'");
        return;
    }
    applyAdvance(value, force);
}

void ProgressEmitter::applyAdvance(int64_t new_current, bool force) {
    const int64_t old_current = getCurrent();
    const UpdateType type = nextAdvanceType();

    state_ = makeState(new_current, getTotal());
    const bool reached_total = state_.isComplete() && new_current != old_current;

    // EN: STARTED and the update reaching the total are never throttled
    // FR: STARTED et la mise à jour atteignant le total ne sont jamais limités
    if (shouldNotify(force || type == UpdateType::STARTED || reached_total)) {
        notifyConsumers(ProgressUpdate(state_, new_current - old_current, type));
    }

    propagateToParent(new_current - old_current);
}

void ProgressEmitter::updateTotal(std::optional<int64_t> new_total) {
    checkedTotal(new_total);
    if (completed_) {
        LOG_WARN(kModule, "Ignoring total change on completed emitter '" + getLabel().value_or("") + "'");
        return;
    }

    const int64_t old_current = getCurrent();
    int64_t new_current = new_total ? std::min(old_current, *new_total) : old_current;

    // EN: A parent's position follows its children under the new total
    // FR: La position d'un parent suit ses enfants sous le nouveau total
    if (new_total && !children_.empty()) {
        new_current = aggregatedPosition(*new_total).value_or(new_current);
    }

    state_ = makeState(new_current, new_total);
    shouldNotify(true);
    notifyConsumers(ProgressUpdate(state_, new_current - old_current, UpdateType::TOTAL_CHANGED));

    propagateToParent(new_current - old_current);
}

void ProgressEmitter::complete() {
    if (completed_) {
        LOG_DEBUG(kModule, "complete() called twice on '" + getLabel().value_or("") + "'");
        return;
    }
    completed_ = true;
    started_ = true;

    const int64_t old_current = getCurrent();
    const auto total = getTotal();
    const int64_t new_current = total ? *total : old_current;

    state_ = makeState(new_current, total);
    shouldNotify(true);
    notifyConsumers(ProgressUpdate(state_, new_current - old_current, UpdateType::COMPLETED));

    propagateToParent(new_current - old_current);
}

void ProgressEmitter::reportError(const std::string& message) {
    shouldNotify(true);
    notifyConsumers(ProgressUpdate(state_.withMetadata("error", message), 0, UpdateType::ERROR));
}

void ProgressEmitter::setMetadata(const std::string& key, const nlohmann::json& value) {
    metadata_[key] = value;
    state_ = makeState(getCurrent(), getTotal());
}

ProgressEmitter& ProgressEmitter::createChild(std::optional<int64_t> total, double weight,
                                              std::optional<std::string> label) {
    if (!std::isfinite(weight) || weight <= 0.0) {
        throw InvalidEmitterArgument("child weight must be positive (got " + std::to_string(weight) + ")");
    }

    std::unique_ptr<ProgressEmitter> child(
        new ProgressEmitter(total, std::move(label), throttle_interval_, this));
    children_.push_back(ChildEntry{std::move(child), weight});
    return *children_.back().emitter;
}

void ProgressEmitter::addConsumer(std::shared_ptr<ProgressConsumer> consumer) {
    if (!consumer) {
        throw InvalidEmitterArgument("consumer must not be null");
    }
    consumers_.push_back(std::move(consumer));
}

void ProgressEmitter::removeConsumer(const std::shared_ptr<ProgressConsumer>& consumer) {
    consumers_.erase(std::remove(consumers_.begin(), consumers_.end(), consumer), consumers_.end());
}

double ProgressEmitter::getFractionComplete() const {
    if (completed_) {
        return 1.0;
    }
    const auto total = getTotal();
    if (total && *total > 0) {
        return static_cast<double>(getCurrent()) / static_cast<double>(*total);
    }
    return 0.0;
}

ProgressState ProgressEmitter::makeState(int64_t current, std::optional<int64_t> total) const {
    return ProgressState(current, total, state_.getLabel(), metadata_);
}

UpdateType ProgressEmitter::nextAdvanceType() {
    if (!started_) {
        started_ = true;
        return UpdateType::STARTED;
    }
    return UpdateType::PROGRESS;
}

// EN: Per-emitter throttle. A zero interval always notifies.
// FR: Limitation propre à l'émetteur. Un intervalle nul notifie toujours.
bool ProgressEmitter::shouldNotify(bool force) {
    const auto now = Clock::now();
    if (force || throttle_interval_.count() == 0 || !last_notify_time_ ||
        now - *last_notify_time_ >= throttle_interval_) {
        last_notify_time_ = now;
        return true;
    }
    return false;
}

// EN: Iterates over a copy so consumers may register others while being notified.
// FR: Itère sur une copie pour que les consommateurs puissent en enregistrer d'autres pendant la notification.
void ProgressEmitter::notifyConsumers(const ProgressUpdate& update) {
    const auto consumers = consumers_;
    const bool completing = update.getType() == UpdateType::COMPLETED;

    for (size_t i = 0; i < consumers.size(); ++i) {
        try {
            consumers[i]->onProgress(update);
        } catch (const std::exception& e) {
            handleConsumerFailure(i, "onProgress", e.what());
        } catch (...) {
            handleConsumerFailure(i, "onProgress", "unknown exception");
        }

        if (completing) {
            try {
                consumers[i]->onComplete(update.getState());
            } catch (const std::exception& e) {
                handleConsumerFailure(i, "onComplete", e.what());
            } catch (...) {
                handleConsumerFailure(i, "onComplete", "unknown exception");
            }
        }
    }
}

void ProgressEmitter::handleConsumerFailure(size_t index, const std::string& phase, const std::string& cause) {
    const ConsumerNotificationError failure(index, phase, cause);
    ++consumer_error_count_;

    LOG_WARN_META(kModule, failure.what(), (Logger::Metadata{
        {"label", getLabel().value_or("")},
        {"phase", failure.getPhase()},
        {"consumer_index", std::to_string(failure.getConsumerIndex())}
    }));
}

void ProgressEmitter::propagateToParent(int64_t delta) {
    if (parent_) {
        parent_->recalculateFromChildren(delta);
    }
}

// EN: Parent position = round(total * sum(weight * fraction) / sum(weight)).
//     An indeterminate parent only counts the units its children report.
// FR: Position du parent = round(total * somme(poids * fraction) / somme(poids)).
//     Un parent indéterminé compte seulement les unités rapportées par ses enfants.
void ProgressEmitter::recalculateFromChildren(int64_t child_delta) {
    if (children_.empty() || completed_) {
        return;
    }

    const int64_t old_current = getCurrent();
    const auto total = getTotal();
    int64_t new_current = old_current;

    if (total) {
        const auto aggregated = aggregatedPosition(*total);
        if (!aggregated) {
            return;
        }
        new_current = *aggregated;
    } else {
        if (child_delta <= 0) {
            return;
        }
        new_current = advancedPosition(old_current, child_delta, std::nullopt);
    }

    if (new_current == old_current && started_) {
        return;
    }

    const UpdateType type = nextAdvanceType();
    state_ = makeState(new_current, total);
    const bool reached_total = state_.isComplete() && new_current != old_current;

    if (shouldNotify(type == UpdateType::STARTED || reached_total)) {
        notifyConsumers(ProgressUpdate(state_, new_current - old_current, type));
    }

    propagateToParent(new_current - old_current);
}

std::optional<int64_t> ProgressEmitter::aggregatedPosition(int64_t total) const {
    double weight_sum = 0.0;
    double weighted_fraction = 0.0;
    for (const auto& child : children_) {
        weight_sum += child.weight;
        weighted_fraction += child.weight * child.emitter->getFractionComplete();
    }
    if (weight_sum <= 0.0) {
        return std::nullopt;
    }
    const double scaled = static_cast<double>(total) * weighted_fraction / weight_sum;
    if (scaled >= static_cast<double>(total)) {
        return total;
    }
    return std::clamp<int64_t>(static_cast<int64_t>(std::llround(scaled)), 0, total);
}

} // namespace Progress
} // namespace AFP
