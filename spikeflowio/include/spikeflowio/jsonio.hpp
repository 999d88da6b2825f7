#pragma once

#include <string>
#include <vector>

#include <spikeflow/connection.hpp>
#include <spikeflow/export.hpp>
#include <spikeflow/sfexcept.hpp>
#include <spikeflow/tensor.hpp>
#include <spikeflow/transformer.hpp>

#include <nlohmann/json.hpp>

namespace spikeflowio {

struct SPF_SYMBOL_VISIBLE jsonio_error: public spf::spikeflow_exception {
    jsonio_error(const std::string& msg);
};

// Input in JSON not used
struct SPF_SYMBOL_VISIBLE jsonio_unused_input: jsonio_error {
    explicit jsonio_unused_input(const std::string& key);
    std::string key;
};

struct SPF_SYMBOL_VISIBLE jsonio_missing_field: jsonio_error {
    explicit jsonio_missing_field(const std::string& field);
    std::string field;
};

// Unknown component kind
struct SPF_SYMBOL_VISIBLE jsonio_type_error: jsonio_error {
    explicit jsonio_type_error(const std::string& kind);
    std::string kind;
};

// Entry present but holding a value of the wrong form
struct SPF_SYMBOL_VISIBLE jsonio_load_error: jsonio_error {
    jsonio_load_error(const std::string& field, const std::string& err);
    std::string field;
};

// Transformer from {"kind": "spike-current" | "exp-decay-current", ...}.
SPF_SPIKEFLOWIO_API spf::transformer load_transformer(const nlohmann::json&);

// Connection from {"kind": "linear", "in-num": n, "out-num": m, ...}.
SPF_SPIKEFLOWIO_API spf::connection load_connection(const nlohmann::json&);

// Weight matrix from an array of equal-length rows, one row per output.
SPF_SPIKEFLOWIO_API spf::shared_weights load_weights(const nlohmann::json&);

// Spike trains from an array of steps, each an array of booleans (or 0/1)
// giving a [1, n] spike tensor.
SPF_SPIKEFLOWIO_API std::vector<spf::spike_tensor> load_spike_trains(const nlohmann::json&);

} // namespace spikeflowio
