#include "transforms/transform_pipeline.hpp"

#include <algorithm>
#include <stdexcept>

namespace codegym {

void TransformPipeline::add(const std::string& name, ObservationTransform stage) {
    if (!stage) throw std::invalid_argument("empty transform stage: " + name);
    for (auto& s : stages_) {
        if (s.name == name) {
            s.fn = std::move(stage);
            return;
        }
    }
    stages_.push_back({name, std::move(stage)});
}

void TransformPipeline::add(std::shared_ptr<const Transform> transform) {
    if (!transform) throw std::invalid_argument("null transform");
    std::string n = transform->name();
    add(n, [t = std::move(transform)](Observation obs) { return t->apply(std::move(obs)); });
}

bool TransformPipeline::remove(const std::string& name) {
    auto it = std::find_if(stages_.begin(), stages_.end(),
                           [&](const Stage& s) { return s.name == name; });
    if (it == stages_.end()) return false;
    stages_.erase(it);
    return true;
}

bool TransformPipeline::contains(const std::string& name) const {
    for (const auto& s : stages_) {
        if (s.name == name) return true;
    }
    return false;
}

std::vector<std::string> TransformPipeline::names() const {
    std::vector<std::string> result;
    for (const auto& s : stages_) result.push_back(s.name);
    return result;
}

Observation TransformPipeline::apply(Observation obs) const {
    for (const auto& s : stages_) {
        obs = s.fn(std::move(obs));
    }
    return obs;
}

TransformPipeline makeDefaultPipeline(const SafetyConfig& safety, const QualityConfig& quality) {
    TransformPipeline pipeline;
    pipeline.add(std::make_shared<SafetyTransform>(safety));
    pipeline.add(std::make_shared<QualityTransform>(quality));
    return pipeline;
}

} // namespace codegym
