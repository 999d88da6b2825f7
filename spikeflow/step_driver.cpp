#include <utility>
#include <vector>

#include <spikeflow/sfexcept.hpp>
#include <spikeflow/step_driver.hpp>

namespace spf {

step_driver::step_driver(transformer t):
    transformer_(std::move(t))
{}

step_driver::step_driver(transformer t, connection c):
    transformer_(std::move(t)),
    connection_(std::move(c))
{}

current_tensor step_driver::step(const spike_tensor& spikes) {
    if (connection_) {
        const auto in_num = connection_->in_num();
        if (spikes.rank()==0 || spikes.trailing_extent()!=in_num) {
            throw bad_input_extent(spikes.shape(), in_num);
        }
    }

    // The transformer state is committed only once the connection has accepted
    // the current; a rejected step leaves the driver as it was.
    auto next = transformer_;
    auto current = next.forward(spikes);
    if (connection_) {
        current = connection_->forward(current);
    }
    transformer_ = std::move(next);
    ++steps_;
    return current;
}

std::vector<current_tensor> step_driver::run(const std::vector<spike_tensor>& episode) {
    reset();

    std::vector<current_tensor> trace;
    trace.reserve(episode.size());
    for (const auto& spikes: episode) {
        trace.push_back(step(spikes));
    }
    return trace;
}

void step_driver::reset() {
    transformer_.reset();
    if (connection_) connection_->reset();
    steps_ = 0;
}

} // namespace spf
