// EN: ProgressState / ProgressUpdate implementation - invariant checks and derived values
// FR: Implémentation ProgressState / ProgressUpdate - vérification des invariants et valeurs dérivées

#include "progress/progress_state.hpp"
#include "progress/progress_errors.hpp"

namespace AFP {
namespace Progress {

std::string updateTypeToString(UpdateType type) {
    switch (type) {
        case UpdateType::STARTED:       return "started";
        case UpdateType::PROGRESS:      return "progress";
        case UpdateType::TOTAL_CHANGED: return "total_changed";
        case UpdateType::COMPLETED:     return "completed";
        case UpdateType::ERROR:         return "error";
        default:                        return "unknown";
    }
}

ProgressState::ProgressState(int64_t current,
                             std::optional<int64_t> total,
                             std::optional<std::string> label,
                             ProgressMetadata metadata,
                             Clock::time_point timestamp)
    : current_(current),
      total_(total),
      label_(std::move(label)),
      metadata_(std::move(metadata)),
      timestamp_(timestamp) {
    if (current_ < 0) {
        throw InvalidProgressState("current must be non-negative (got " + std::to_string(current_) + ")");
    }
    if (total_ && *total_ < 0) {
        throw InvalidProgressState("total must be non-negative (got " + std::to_string(*total_) + ")");
    }
    if (total_ && current_ > *total_) {
        throw InvalidProgressState("current " + std::to_string(current_) +
                                   " exceeds total " + std::to_string(*total_));
    }
    if (label_ && label_->size() > kMaxLabelLength) {
        throw InvalidProgressState("label too long (" + std::to_string(label_->size()) +
                                   " > " + std::to_string(kMaxLabelLength) + " characters)");
    }
}

std::optional<double> ProgressState::percentage() const {
    if (!total_ || *total_ == 0) {
        return std::nullopt;
    }
    return static_cast<double>(current_) / static_cast<double>(*total_) * 100.0;
}

bool ProgressState::isComplete() const {
    return total_.has_value() && current_ == *total_;
}

std::optional<int64_t> ProgressState::itemsRemaining() const {
    if (!total_) {
        return std::nullopt;
    }
    return *total_ - current_;
}

ProgressState ProgressState::withMetadata(const std::string& key, const nlohmann::json& value) const {
    ProgressMetadata metadata = metadata_;
    metadata[key] = value;
    return ProgressState(current_, total_, label_, std::move(metadata));
}

nlohmann::json ProgressState::toJson() const {
    nlohmann::json json;
    json["current"] = current_;
    json["total"] = total_ ? nlohmann::json(*total_) : nlohmann::json(nullptr);
    json["label"] = label_ ? nlohmann::json(*label_) : nlohmann::json(nullptr);

    auto pct = percentage();
    json["percentage"] = pct ? nlohmann::json(*pct) : nlohmann::json(nullptr);

    nlohmann::json meta = nlohmann::json::object();
    for (const auto& [key, value] : metadata_) {
        meta[key] = value;
    }
    json["metadata"] = meta;
    return json;
}

} // namespace Progress
} // namespace AFP
