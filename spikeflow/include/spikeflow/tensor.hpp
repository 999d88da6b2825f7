#pragma once

#include <utility>
#include <vector>

#include <spikeflow/common_types.hpp>
#include <spikeflow/sfexcept.hpp>

namespace spf {

// Dense row-major n-dimensional array.
//
// The shape lists the extents outermost first; values are stored in a flat
// vector whose length is the product of the extents. Spike and current
// signals are both tensors of shape [batch_size, *, neuron_count].

template <typename T>
class basic_tensor {
public:
    using value_type = T;
    using storage_type = std::vector<T>;
    using reference = typename storage_type::reference;
    using const_reference = typename storage_type::const_reference;
    using iterator = typename storage_type::iterator;
    using const_iterator = typename storage_type::const_iterator;

    // Empty tensor of shape [0].
    basic_tensor(): shape_{0} {}

    // Value-initialised (zero or false) tensor of the given shape.
    explicit basic_tensor(shape_type shape):
        shape_(std::move(shape)), data_(shape_size(shape_))
    {}

    // Tensor of the given shape with values in row-major order.
    basic_tensor(shape_type shape, storage_type data):
        shape_(std::move(shape)), data_(std::move(data))
    {
        if (data_.size()!=shape_size(shape_)) {
            throw bad_tensor_data(shape_, data_.size());
        }
    }

    const shape_type& shape() const { return shape_; }
    size_type rank() const { return shape_.size(); }
    size_type size() const { return data_.size(); }
    bool empty() const { return data_.empty(); }

    // Extent of the last dimension, or zero for a rank zero tensor.
    size_type trailing_extent() const { return shape_.empty()? 0: shape_.back(); }

    reference operator[](size_type i) { return data_[i]; }
    const_reference operator[](size_type i) const { return data_[i]; }

    const storage_type& values() const { return data_; }

    iterator begin() { return data_.begin(); }
    iterator end() { return data_.end(); }
    const_iterator begin() const { return data_.begin(); }
    const_iterator end() const { return data_.end(); }

    void fill(const T& value) { data_.assign(data_.size(), value); }

    friend bool operator==(const basic_tensor& a, const basic_tensor& b) {
        return a.shape_==b.shape_ && a.data_==b.data_;
    }

    friend bool operator!=(const basic_tensor& a, const basic_tensor& b) {
        return !(a==b);
    }

private:
    shape_type shape_;
    storage_type data_;
};

// Spike events at one simulation step: true where a neuron fired.
using spike_tensor = basic_tensor<bool>;

// Input current; also the type of transformer state and of weight matrices.
using current_tensor = basic_tensor<current_type>;

} // namespace spf
