#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <spikeflow/common_types.hpp>
#include <spikeflow/connection.hpp>
#include <spikeflow/tensor.hpp>
#include <spikeflow/transformer.hpp>

#include <spikeflowio/json_helpers.hpp>
#include <spikeflowio/jsonio.hpp>

namespace spikeflowio {

using spf::current_type;
using spf::shape_type;
using spf::size_type;

jsonio_error::jsonio_error(const std::string& msg):
    spf::spikeflow_exception(msg) {}

jsonio_unused_input::jsonio_unused_input(const std::string& key):
    jsonio_error("Unused input parameter: \"" + key + "\""),
    key(key)
{}

jsonio_missing_field::jsonio_missing_field(const std::string& field):
    jsonio_error("Missing \"" + field + "\" field."),
    field(field)
{}

jsonio_type_error::jsonio_type_error(const std::string& kind):
    jsonio_error("Unsupported kind: \"" + kind + "\"."),
    kind(kind)
{}

jsonio_load_error::jsonio_load_error(const std::string& field, const std::string& err):
    jsonio_error("Error loading \"" + field + "\": " + err),
    field(field)
{}

void throw_if_not_empty(const nlohmann::json& json) {
    if (!json.empty()) {
        throw jsonio_unused_input(json.begin().key());
    }
}

// Extents must be non-negative integers; nlohmann would convert -1 silently.
static std::optional<shape_type> find_and_remove_shape(nlohmann::json& j) {
    auto shape = find_and_remove_json<nlohmann::json>("shape", j);
    if (!shape) return std::nullopt;

    if (!shape->is_array()) {
        throw jsonio_load_error("shape", "expected an array of extents, got " + shape->dump());
    }
    shape_type extents;
    for (const auto& e: *shape) {
        if (!e.is_number_unsigned()) {
            throw jsonio_load_error("shape", "extents must be non-negative integers, got " + e.dump());
        }
        extents.push_back(e.get<size_type>());
    }
    return extents;
}

spf::transformer load_transformer(const nlohmann::json& json) {
    auto j_copy = json;
    auto kind = find_and_remove_required_json<std::string>("kind", j_copy);

    current_type amplitude = 1;
    param_from_json(amplitude, "amplitude", j_copy);

    if (kind=="spike-current") {
        throw_if_not_empty(j_copy);
        return spf::spike_current(amplitude);
    }
    if (kind=="exp-decay-current") {
        auto tau = find_and_remove_required_json<current_type>("tau", j_copy);
        auto shape = find_and_remove_shape(j_copy);
        throw_if_not_empty(j_copy);
        return shape? spf::exp_decay_current(tau, amplitude, std::move(*shape))
                    : spf::exp_decay_current(tau, amplitude);
    }
    throw jsonio_type_error(kind);
}

spf::shared_weights load_weights(const nlohmann::json& json) {
    std::vector<std::vector<current_type>> rows;
    try {
        rows = json.get<std::vector<std::vector<current_type>>>();
    }
    catch (nlohmann::json::exception& e) {
        throw jsonio_load_error("weights", e.what());
    }

    const size_type n_out = rows.size();
    const size_type n_in = n_out? rows.front().size(): 0;

    std::vector<current_type> values;
    values.reserve(n_out*n_in);
    for (const auto& row: rows) {
        if (row.size()!=n_in) {
            throw jsonio_load_error("weights", "rows differ in length");
        }
        values.insert(values.end(), row.begin(), row.end());
    }
    return std::make_shared<spf::weight_matrix>(shape_type{n_out, n_in}, std::move(values));
}

spf::connection load_connection(const nlohmann::json& json) {
    auto j_copy = json;
    auto kind = find_and_remove_required_json<std::string>("kind", j_copy);

    if (kind=="linear") {
        auto in_num = find_and_remove_required_json<size_type>("in-num", j_copy);
        auto out_num = find_and_remove_required_json<size_type>("out-num", j_copy);

        // Explicit weights take the place of a seed for random initialisation.
        if (auto weights = find_and_remove_json<nlohmann::json>("weights", j_copy)) {
            throw_if_not_empty(j_copy);
            return spf::linear_connection(in_num, out_num, load_weights(*weights));
        }
        spf::seed_type seed = spf::default_seed;
        param_from_json(seed, "seed", j_copy);
        throw_if_not_empty(j_copy);
        return spf::linear_connection(in_num, out_num, seed);
    }
    throw jsonio_type_error(kind);
}

std::vector<spf::spike_tensor> load_spike_trains(const nlohmann::json& json) {
    if (!json.is_array()) {
        throw jsonio_load_error("spikes", "expected an array of steps");
    }

    std::vector<spf::spike_tensor> trains;
    trains.reserve(json.size());
    for (const auto& step: json) {
        if (!step.is_array()) {
            throw jsonio_load_error("spikes", "expected an array of spikes per step");
        }
        std::vector<bool> spikes;
        spikes.reserve(step.size());
        for (const auto& s: step) {
            if (s.is_boolean()) {
                spikes.push_back(s.get<bool>());
            }
            else if (s.is_number_integer() && (s==0 || s==1)) {
                spikes.push_back(s==1);
            }
            else {
                throw jsonio_load_error("spikes", "spike values must be booleans, 0 or 1, got " + s.dump());
            }
        }
        const size_type n = spikes.size();
        trains.emplace_back(shape_type{1, n}, std::move(spikes));
    }
    return trains;
}

} // namespace spikeflowio
