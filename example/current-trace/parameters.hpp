#pragma once

#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include <spikeflowio/json_helpers.hpp>

// Parameters of a single-episode run: component descriptions in the format
// accepted by spikeflowio, plus the spike pattern of one period.
struct trace_params {
    trace_params() = default;

    std::string name = "default";
    nlohmann::json transformer = {{"kind", "exp-decay-current"}, {"tau", 5.0}, {"amplitude", 1.0}};
    std::optional<nlohmann::json> connection = nlohmann::json{
        {"kind", "linear"}, {"in-num", 3}, {"out-num", 1}, {"weights", nlohmann::json::array({nlohmann::json::array({0.5, 0.25, -0.5})})}};
    nlohmann::json spikes = {{true, false, false}, {false, true, false}, {false, false, false}, {false, false, true}};
    unsigned repeat = 4;             // Number of times the spike pattern is replayed.
    std::string output;              // Optional path of a JSON trace file.
};

inline trace_params read_options(int argc, char** argv) {
    using spikeflowio::param_from_json;

    trace_params params;
    if (argc<2) {
        std::cout << "Using default parameters.\n";
        return params;
    }
    if (argc>2) {
        throw std::runtime_error("More than one command line option is not permitted.");
    }

    std::string fname = argv[1];
    std::cout << "Loading parameters from file: " << fname << "\n";
    std::ifstream f(fname);

    if (!f.good()) {
        throw std::runtime_error("Unable to open input parameter file: "+fname);
    }

    nlohmann::json json;
    f >> json;

    param_from_json(params.name, "name", json);
    param_from_json(params.transformer, "transformer", json);
    if (auto c = spikeflowio::find_and_remove_json<nlohmann::json>("connection", json)) {
        // An explicit null runs the transformer on its own.
        params.connection = c->is_null()? std::nullopt: std::optional<nlohmann::json>(*c);
    }
    param_from_json(params.spikes, "spikes", json);
    param_from_json(params.repeat, "repeat", json);
    param_from_json(params.output, "output", json);

    if (!json.empty()) {
        for (auto it=json.begin(); it!=json.end(); ++it) {
            std::cout << "  Warning: unused input parameter: \"" << it.key() << "\"\n";
        }
        std::cout << "\n";
    }

    return params;
}
