#pragma once

#include "env/observation.hpp"

#include <functional>
#include <string>

namespace codegym {

/// A stage of the observation pipeline: takes the observation by
/// value and returns the adjusted one.
using ObservationTransform = std::function<Observation(Observation)>;

/// Base class for the built-in observation stages.
/// Stages adjust reward additively and add metadata keys. They never
/// remove or overwrite keys written before them.
class Transform {
public:
    virtual ~Transform() = default;

    /// Human-readable name of this stage.
    virtual std::string name() const = 0;

    virtual Observation apply(Observation obs) const = 0;

    Observation operator()(Observation obs) const { return apply(std::move(obs)); }
};

/// The code the observation was produced from ("" when absent).
inline std::string submittedCode(const Observation& obs) {
    auto it = obs.metadata.find("core_code");
    if (it == obs.metadata.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

/// Add delta to the reward; a missing reward counts as 0.
inline void adjustReward(Observation& obs, double delta) {
    obs.reward = obs.reward.value_or(0.0) + delta;
}

/// Set metadata[key] unless an earlier stage already wrote it.
inline void addMetadata(Observation& obs, const std::string& key, nlohmann::json value) {
    if (!obs.metadata.is_object()) obs.metadata = nlohmann::json::object();
    if (!obs.metadata.contains(key)) obs.metadata[key] = std::move(value);
}

} // namespace codegym
