#pragma once

#include "transforms/code_transforms.hpp"
#include "transforms/transform_base.hpp"

#include <memory>
#include <string>
#include <vector>

namespace codegym {

/// Ordered list of named observation stages.
/// apply() runs them in insertion order, each seeing the previous
/// stage's output.
class TransformPipeline {
public:
    /// Append a stage. A stage with an existing name replaces it in place.
    void add(const std::string& name, ObservationTransform stage);

    /// Append a built-in stage under its own name.
    void add(std::shared_ptr<const Transform> transform);

    /// Remove a stage by name. Returns true if found.
    bool remove(const std::string& name);

    bool contains(const std::string& name) const;
    std::vector<std::string> names() const;
    size_t count() const { return stages_.size(); }

    Observation apply(Observation obs) const;

private:
    struct Stage {
        std::string name;
        ObservationTransform fn;
    };
    std::vector<Stage> stages_;
};

/// Safety followed by quality.
TransformPipeline makeDefaultPipeline(const SafetyConfig& safety, const QualityConfig& quality);

} // namespace codegym
