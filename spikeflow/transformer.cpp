#include <cmath>
#include <optional>
#include <utility>

#include <spikeflow/common_types.hpp>
#include <spikeflow/sfexcept.hpp>
#include <spikeflow/tensor.hpp>
#include <spikeflow/transformer.hpp>

namespace spf {

// Current proportional to the spikes of the present step.
struct spike_current_impl {
    explicit spike_current_impl(current_type amplitude): amplitude_(amplitude) {
        if (!std::isfinite(amplitude_)) throw bad_amplitude(amplitude_);
    }

    current_tensor forward(const spike_tensor& spikes) const {
        current_tensor current(spikes.shape());
        for (size_type i = 0; i<spikes.size(); ++i) {
            current[i] = current_type(spikes[i])*amplitude_;
        }
        return current;
    }

    current_type amplitude_;
};

// Capacitor-like current: charged to amplitude by a spike, discharged with
// time constant tau otherwise. Uses a unit-step explicit Euler update for the
// decay, i <- i - i/tau, not the exact factor exp(-1/tau).
struct exp_decay_current_impl {
    exp_decay_current_impl(current_type tau, current_type amplitude, std::optional<shape_type> shape):
        tau_(tau), amplitude_(amplitude), shape_(std::move(shape))
    {
        if (!(tau_>0) || !std::isfinite(tau_)) throw bad_time_constant(tau_);
        if (!std::isfinite(amplitude_)) throw bad_amplitude(amplitude_);
        reset();
    }

    void reset() {
        if (shape_) {
            state_ = current_tensor(*shape_);
        }
        else {
            state_.reset();
        }
    }

    current_tensor forward(const spike_tensor& spikes) {
        // Validate before touching the state: a rejected call leaves it as it was.
        if (state_ && state_->shape()!=spikes.shape()) {
            throw bad_input_shape(spikes.shape(), state_->shape());
        }
        if (!state_) {
            state_ = current_tensor(spikes.shape());
        }

        auto& i = *state_;
        for (size_type k = 0; k<spikes.size(); ++k) {
            const current_type s = spikes[k];
            const current_type decay = -i[k]/tau_;
            // A spike sets the state to amplitude; it does not add to it.
            i[k] = (i[k] + decay)*(1-s) + amplitude_*s;
        }
        return i;
    }

    current_type tau_;
    current_type amplitude_;
    std::optional<shape_type> shape_;   // Configured state shape, if any.
    std::optional<current_tensor> state_;
};

transformer spike_current(current_type amplitude) {
    return transformer(spike_current_impl(amplitude));
}

transformer exp_decay_current(current_type tau, current_type amplitude) {
    return transformer(exp_decay_current_impl(tau, amplitude, std::nullopt));
}

transformer exp_decay_current(current_type tau, current_type amplitude, shape_type shape) {
    return transformer(exp_decay_current_impl(tau, amplitude, std::move(shape)));
}

} // namespace spf
