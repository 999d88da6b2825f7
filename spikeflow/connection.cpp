#include <cmath>
#include <random>
#include <utility>

#include <spikeflow/common_types.hpp>
#include <spikeflow/connection.hpp>
#include <spikeflow/sfexcept.hpp>
#include <spikeflow/tensor.hpp>

namespace spf {

static void assert_connection_size(size_type in_num, size_type out_num) {
    if (!in_num || !out_num) throw bad_connection_size(in_num, out_num);
}

static void assert_weight_shape(const shared_weights& w, size_type in_num, size_type out_num) {
    if (!w) throw bad_weight_shape({}, in_num, out_num);
    if (w->shape()!=shape_type{out_num, in_num}) throw bad_weight_shape(w->shape(), in_num, out_num);
}

// Stateless y = x·Wᵀ over the trailing dimension.
// The weights are read through the shared pointer on every call, so that
// updates made between calls take effect at the next step.
struct linear_connection_impl {
    linear_connection_impl(size_type in_num, size_type out_num, shared_weights weights):
        in_num_(in_num), out_num_(out_num), weights_(std::move(weights))
    {
        assert_connection_size(in_num_, out_num_);
        assert_weight_shape(weights_, in_num_, out_num_);
    }

    size_type in_num() const { return in_num_; }
    size_type out_num() const { return out_num_; }

    current_tensor forward(const current_tensor& input) const {
        if (input.rank()==0 || input.trailing_extent()!=in_num_) {
            throw bad_input_extent(input.shape(), in_num_);
        }
        // The weights may have been replaced by their owner since the last call.
        assert_weight_shape(weights_, in_num_, out_num_);
        const auto& w = *weights_;

        auto shape = input.shape();
        shape.back() = out_num_;
        current_tensor output(shape);

        const size_type n_rows = input.size()/in_num_;
        for (size_type r = 0; r<n_rows; ++r) {
            const size_type x0 = r*in_num_;
            for (size_type o = 0; o<out_num_; ++o) {
                const size_type w0 = o*in_num_;
                current_type sum = 0;
                for (size_type i = 0; i<in_num_; ++i) {
                    sum += input[x0+i]*w[w0+i];
                }
                output[r*out_num_+o] = sum;
            }
        }
        return output;
    }

    size_type in_num_;
    size_type out_num_;
    shared_weights weights_;
};

shared_weights uniform_weights(size_type in_num, size_type out_num, seed_type seed) {
    assert_connection_size(in_num, out_num);

    const current_type bound = 1/std::sqrt(current_type(in_num));
    engine_type rng(seed);
    std::uniform_real_distribution<current_type> dist(-bound, bound);

    auto w = std::make_shared<weight_matrix>(shape_type{out_num, in_num});
    for (auto& v: *w) v = dist(rng);
    return w;
}

connection linear_connection(size_type in_num, size_type out_num, seed_type seed) {
    return linear_connection(in_num, out_num, uniform_weights(in_num, out_num, seed));
}

connection linear_connection(size_type in_num, size_type out_num, shared_weights weights) {
    return connection(linear_connection_impl(in_num, out_num, std::move(weights)));
}

} // namespace spf
