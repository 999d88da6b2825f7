#pragma once

#include <stdexcept>
#include <string>

#include <spikeflow/common_types.hpp>
#include <spikeflow/export.hpp>

// Spikeflow-specific exception hierarchy.

namespace spf {

// Common base-class for spikeflow run-time errors.

struct SPF_SYMBOL_VISIBLE spikeflow_exception: std::runtime_error {
    spikeflow_exception(const std::string&);
};

// Configuration errors: invalid construction parameters.
// Raised when a component is built; the component is not created.

struct SPF_SYMBOL_VISIBLE configuration_error: spikeflow_exception {
    configuration_error(const std::string&);
};

struct SPF_SYMBOL_VISIBLE bad_time_constant: configuration_error {
    explicit bad_time_constant(current_type tau);
    current_type tau;
};

struct SPF_SYMBOL_VISIBLE bad_amplitude: configuration_error {
    explicit bad_amplitude(current_type amplitude);
    current_type amplitude;
};

struct SPF_SYMBOL_VISIBLE bad_connection_size: configuration_error {
    bad_connection_size(size_type in_num, size_type out_num);
    size_type in_num, out_num;
};

// Weight matrix is missing or its shape is not [out_num, in_num].
struct SPF_SYMBOL_VISIBLE bad_weight_shape: configuration_error {
    bad_weight_shape(const shape_type& weight_shape, size_type in_num, size_type out_num);
    shape_type weight_shape;
    size_type in_num, out_num;
};

// Shape errors: a tensor does not fit the dimensionality of the component
// or container it is given to. Raised per call; state is left unchanged.

struct SPF_SYMBOL_VISIBLE shape_mismatch_error: spikeflow_exception {
    shape_mismatch_error(const std::string&);
};

// Trailing extent of the input differs from the expected extent.
struct SPF_SYMBOL_VISIBLE bad_input_extent: shape_mismatch_error {
    bad_input_extent(const shape_type& input_shape, size_type expected_extent);
    shape_type input_shape;
    size_type expected_extent;
};

// Input shape differs from the shape established by earlier calls or configuration.
struct SPF_SYMBOL_VISIBLE bad_input_shape: shape_mismatch_error {
    bad_input_shape(const shape_type& input_shape, const shape_type& expected_shape);
    shape_type input_shape;
    shape_type expected_shape;
};

// Number of elements implied by the shape is not representable.
struct SPF_SYMBOL_VISIBLE bad_tensor_shape: shape_mismatch_error {
    explicit bad_tensor_shape(const shape_type& shape);
    shape_type shape;
};

// Number of values supplied for a tensor does not match its shape.
struct SPF_SYMBOL_VISIBLE bad_tensor_data: shape_mismatch_error {
    bad_tensor_data(const shape_type& shape, size_type n_values);
    shape_type shape;
    size_type n_values;
};

} // namespace spf
