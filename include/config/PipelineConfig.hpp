#pragma once
#include <cstddef>
#include <string>

#include "nlohmann/json.hpp"

namespace wordspace {

struct PipelineConfig {
    size_t window_size = 4;    // context radius in tokens, each side
    double epsilon = 1e-10;    // idf zero-guard
    size_t top_k = 10;         // rows printed per similarity table
};

// throws std::invalid_argument on a zero window, zero top_k or non-positive epsilon
void validate(const PipelineConfig& cfg);

// keys not present keep their defaults; unknown keys are ignored
PipelineConfig parse_pipeline_config(const nlohmann::json& j);
PipelineConfig load_pipeline_config(const std::string& path);

nlohmann::json to_json(const PipelineConfig& cfg);

}  // namespace wordspace
