/*
 * Drive one transformer, optionally followed by a linear connection, through
 * a single episode and print the current at every step.
 */

#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <nlohmann/json.hpp>

#include <spikeflow/step_driver.hpp>
#include <spikeflow/tensor.hpp>
#include <spikeflowio/jsonio.hpp>

#include "parameters.hpp"

void write_trace_json(const std::string& path, const std::string& name, const std::vector<spf::current_tensor>& trace);

int main(int argc, char** argv) {
    try {
        auto params = read_options(argc, argv);

        auto pattern = spikeflowio::load_spike_trains(params.spikes);
        std::vector<spf::spike_tensor> episode;
        episode.reserve(pattern.size()*params.repeat);
        for (unsigned r = 0; r<params.repeat; ++r) {
            episode.insert(episode.end(), pattern.begin(), pattern.end());
        }

        auto driver = params.connection
            ? spf::step_driver(spikeflowio::load_transformer(params.transformer),
                               spikeflowio::load_connection(*params.connection))
            : spf::step_driver(spikeflowio::load_transformer(params.transformer));

        fmt::print("{}: {} steps, {}\n", params.name, episode.size(),
                   driver.has_connection()? "transformer and connection": "transformer only");

        auto trace = driver.run(episode);
        for (std::size_t t = 0; t<trace.size(); ++t) {
            fmt::print("{:5d} | {:8.4f}\n", t, fmt::join(trace[t], " "));
        }

        if (!params.output.empty()) {
            write_trace_json(params.output, params.name, trace);
            fmt::print("trace written to {}\n", params.output);
        }
    }
    catch (std::exception& e) {
        std::cerr << "exception caught in current-trace: " << e.what() << "\n";
        return 1;
    }

    return 0;
}

void write_trace_json(const std::string& path, const std::string& name, const std::vector<spf::current_tensor>& trace) {
    nlohmann::json json;
    json["name"] = name;
    json["shape"] = trace.empty()? spf::shape_type{}: trace.front().shape();

    auto& jc = json["data"]["current"];
    jc = nlohmann::json::array();
    for (const auto& current: trace) {
        jc.push_back(current.values());
    }

    std::ofstream file(path);
    if (!file.good()) {
        std::cerr << "Warning: unable to open file " << path << " for trace output\n";
        return;
    }
    file << std::setw(1) << json << "\n";
}
