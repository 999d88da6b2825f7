#pragma once

#include <memory>
#include <type_traits>
#include <utility>

#include <spikeflow/common_types.hpp>
#include <spikeflow/export.hpp>
#include <spikeflow/tensor.hpp>
#include <spikeflow/util/extra_traits.hpp>

namespace spf {

// Type erased wrapper
// A transformer converts the spike tensor of one simulation step into an
// input current tensor of the same shape. It is called once per step, in step
// order. Stateful transformers provide `reset()`, which is called at episode
// boundaries only; for stateless implementations `reset()` does nothing.
//
// Any type with `current_tensor forward(const spike_tensor&)` can be wrapped.
// Copying a transformer copies the wrapped implementation and its state.
struct SPF_SPIKEFLOW_API transformer {
    template <typename Impl, typename = std::enable_if_t<!std::is_same_v<std::decay_t<Impl>, transformer>>>
    explicit transformer(Impl&& impl):
        impl_(new wrap<std::decay_t<Impl>>(std::forward<Impl>(impl))) {}

    transformer(transformer&& other) = default;
    transformer& operator=(transformer&& other) = default;

    transformer(const transformer& other):
        impl_(other.impl_->clone()) {}

    transformer& operator=(const transformer& other) {
        impl_ = other.impl_->clone();
        return *this;
    }

    current_tensor forward(const spike_tensor& spikes) { return impl_->forward(spikes); }

    void reset() { impl_->reset(); }

    bool stateful() const { return impl_->stateful(); }

private:
    struct interface {
        virtual current_tensor forward(const spike_tensor& spikes) = 0;
        virtual void reset() = 0;
        virtual bool stateful() const = 0;
        virtual std::unique_ptr<interface> clone() = 0;
        virtual ~interface() {}
    };

    using iface_ptr = std::unique_ptr<interface>;

    iface_ptr impl_;

    template <typename Impl>
    struct wrap: interface {
        explicit wrap(const Impl& impl): wrapped(impl) {}
        explicit wrap(Impl&& impl): wrapped(std::move(impl)) {}

        current_tensor forward(const spike_tensor& spikes) override { return wrapped.forward(spikes); }

        void reset() override {
            if constexpr (util::has_reset_v<Impl>) wrapped.reset();
        }

        bool stateful() const override { return util::has_reset_v<Impl>; }

        iface_ptr clone() override { return std::make_unique<wrap<Impl>>(wrapped); }

        Impl wrapped;
    };
};

// Constructors

/// Stateless transformer: each spike contributes `amplitude` current at its
/// own step and nothing afterwards.
SPF_SPIKEFLOW_API transformer spike_current(current_type amplitude = 1);

/// Stateful transformer: current jumps to `amplitude` on a spike and otherwise
/// decays towards zero by one explicit Euler step of time constant `tau` per
/// simulation step. The state shape is taken from the first call to forward().
SPF_SPIKEFLOW_API transformer exp_decay_current(current_type tau, current_type amplitude = 1);

/// As above, with the state shape fixed at construction.
SPF_SPIKEFLOW_API transformer exp_decay_current(current_type tau, current_type amplitude, shape_type shape);

} // namespace spf
