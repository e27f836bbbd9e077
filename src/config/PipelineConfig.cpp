#include "config/PipelineConfig.hpp"

#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace wordspace {

static size_t require_positive_integer(const json& j, const char* key, const std::string& where) {
    const json& v = j.at(key);
    if (!v.is_number_integer()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be an integer");
    }
    const long long x = v.get<long long>();
    if (x <= 0) {
        throw std::runtime_error(where + "." + std::string(key) + " must be positive");
    }
    return static_cast<size_t>(x);
}

static double require_positive_number(const json& j, const char* key, const std::string& where) {
    const json& v = j.at(key);
    if (!v.is_number()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a number");
    }
    const double x = v.get<double>();
    if (!(x > 0.0)) {
        throw std::runtime_error(where + "." + std::string(key) + " must be positive");
    }
    return x;
}

void validate(const PipelineConfig& cfg) {
    if (cfg.window_size == 0) throw std::invalid_argument("window_size must be positive");
    if (cfg.top_k == 0) throw std::invalid_argument("top_k must be positive");
    if (!(cfg.epsilon > 0.0)) throw std::invalid_argument("epsilon must be positive");
}

PipelineConfig parse_pipeline_config(const json& j) {
    if (!j.is_object()) throw std::runtime_error("config root must be an object");

    PipelineConfig cfg;
    if (j.contains("window_size")) cfg.window_size = require_positive_integer(j, "window_size", "config");
    if (j.contains("epsilon")) cfg.epsilon = require_positive_number(j, "epsilon", "config");
    if (j.contains("top_k")) cfg.top_k = require_positive_integer(j, "top_k", "config");
    return cfg;
}

PipelineConfig load_pipeline_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("failed to open config file: " + path);

    json j;
    try {
        in >> j;
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("failed to parse JSON: ") + e.what());
    }
    return parse_pipeline_config(j);
}

json to_json(const PipelineConfig& cfg) {
    return {
        {"window_size", cfg.window_size},
        {"epsilon", cfg.epsilon},
        {"top_k", cfg.top_k},
    };
}

}  // namespace wordspace
