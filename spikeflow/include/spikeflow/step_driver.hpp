#pragma once

#include <optional>
#include <vector>

#include <spikeflow/common_types.hpp>
#include <spikeflow/connection.hpp>
#include <spikeflow/export.hpp>
#include <spikeflow/tensor.hpp>
#include <spikeflow/transformer.hpp>

namespace spf {

// Sequential driver for one transformer and an optional connection.
//
// Each call to step() is one discrete simulation step: the transformer
// converts the spikes of that step into current, which the connection (if
// any) then maps onto its output population. Steps are applied strictly in
// call order; reset() marks the start of a new episode.
class SPF_SPIKEFLOW_API step_driver {
public:
    explicit step_driver(transformer t);
    step_driver(transformer t, connection c);

    current_tensor step(const spike_tensor& spikes);

    // Reset all components and run one step per entry of the episode.
    std::vector<current_tensor> run(const std::vector<spike_tensor>& episode);

    void reset();

    // Steps applied since construction or the last reset.
    step_type steps() const { return steps_; }

    bool has_connection() const { return connection_.has_value(); }

private:
    transformer transformer_;
    std::optional<connection> connection_;
    step_type steps_ = 0;
};

} // namespace spf
