#pragma once

#include <memory>
#include <type_traits>
#include <utility>

#include <spikeflow/common_types.hpp>
#include <spikeflow/export.hpp>
#include <spikeflow/tensor.hpp>
#include <spikeflow/util/extra_traits.hpp>

namespace spf {

// Synaptic weights of shape [out_num, in_num].
using weight_matrix = current_tensor;

// Weights are shared between a connection and whatever updates them between
// calls to forward(), e.g. a learning rule. Connections only read them.
using shared_weights = std::shared_ptr<weight_matrix>;

// Type erased wrapper
// A connection maps current of shape [*, in_num] to current of shape
// [*, out_num], where * stands for any leading (batch) dimensions.
//
// Wrapped types provide `current_tensor forward(const current_tensor&)`,
// `size_type in_num() const` and `size_type out_num() const`; stateful
// connections also provide `reset()`.
struct SPF_SPIKEFLOW_API connection {
    template <typename Impl, typename = std::enable_if_t<!std::is_same_v<std::decay_t<Impl>, connection>>>
    explicit connection(Impl&& impl):
        impl_(new wrap<std::decay_t<Impl>>(std::forward<Impl>(impl))) {}

    connection(connection&& other) = default;
    connection& operator=(connection&& other) = default;

    connection(const connection& other):
        impl_(other.impl_->clone()) {}

    connection& operator=(const connection& other) {
        impl_ = other.impl_->clone();
        return *this;
    }

    current_tensor forward(const current_tensor& input) { return impl_->forward(input); }

    void reset() { impl_->reset(); }

    bool stateful() const { return impl_->stateful(); }

    size_type in_num() const { return impl_->in_num(); }
    size_type out_num() const { return impl_->out_num(); }

private:
    struct interface {
        virtual current_tensor forward(const current_tensor& input) = 0;
        virtual void reset() = 0;
        virtual bool stateful() const = 0;
        virtual size_type in_num() const = 0;
        virtual size_type out_num() const = 0;
        virtual std::unique_ptr<interface> clone() = 0;
        virtual ~interface() {}
    };

    using iface_ptr = std::unique_ptr<interface>;

    iface_ptr impl_;

    template <typename Impl>
    struct wrap: interface {
        explicit wrap(const Impl& impl): wrapped(impl) {}
        explicit wrap(Impl&& impl): wrapped(std::move(impl)) {}

        current_tensor forward(const current_tensor& input) override { return wrapped.forward(input); }

        void reset() override {
            if constexpr (util::has_reset_v<Impl>) wrapped.reset();
        }

        bool stateful() const override { return util::has_reset_v<Impl>; }

        size_type in_num() const override { return wrapped.in_num(); }
        size_type out_num() const override { return wrapped.out_num(); }

        iface_ptr clone() override { return std::make_unique<wrap<Impl>>(wrapped); }

        Impl wrapped;
    };
};

// Weight matrix of shape [out_num, in_num] drawn uniformly from
// [-1/sqrt(in_num), 1/sqrt(in_num)).
SPF_SPIKEFLOW_API shared_weights uniform_weights(size_type in_num, size_type out_num, seed_type seed = default_seed);

// Constructors

/// Linear connection y = x·Wᵀ with freshly drawn uniform weights.
SPF_SPIKEFLOW_API connection linear_connection(size_type in_num, size_type out_num, seed_type seed = default_seed);

/// Linear connection y = x·Wᵀ reading the shared weight matrix on every call.
SPF_SPIKEFLOW_API connection linear_connection(size_type in_num, size_type out_num, shared_weights weights);

} // namespace spf
