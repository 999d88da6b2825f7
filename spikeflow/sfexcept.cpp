#include <string>

#include <spikeflow/common_types.hpp>
#include <spikeflow/sfexcept.hpp>

#include "util/strprintf.hpp"

namespace spf {

using spf::util::pprintf;

spikeflow_exception::spikeflow_exception(const std::string& what):
    std::runtime_error{what}
{}

configuration_error::configuration_error(const std::string& what):
    spikeflow_exception(what)
{}

bad_time_constant::bad_time_constant(current_type tau):
    configuration_error(pprintf("time constant must be positive and finite, got {}", tau)),
    tau(tau)
{}

bad_amplitude::bad_amplitude(current_type amplitude):
    configuration_error(pprintf("amplitude must be finite, got {}", amplitude)),
    amplitude(amplitude)
{}

bad_connection_size::bad_connection_size(size_type in_num, size_type out_num):
    configuration_error(pprintf("connection dimensions must be non-zero, got in_num={} out_num={}", in_num, out_num)),
    in_num(in_num), out_num(out_num)
{}

bad_weight_shape::bad_weight_shape(const shape_type& weight_shape, size_type in_num, size_type out_num):
    configuration_error(pprintf("weight matrix has shape {}, connection requires [{}, {}] (out_num, in_num)",
                                weight_shape, out_num, in_num)),
    weight_shape(weight_shape), in_num(in_num), out_num(out_num)
{}

shape_mismatch_error::shape_mismatch_error(const std::string& what):
    spikeflow_exception(what)
{}

bad_input_extent::bad_input_extent(const shape_type& input_shape, size_type expected_extent):
    shape_mismatch_error(pprintf("input of shape {} does not have trailing extent {}", input_shape, expected_extent)),
    input_shape(input_shape), expected_extent(expected_extent)
{}

bad_input_shape::bad_input_shape(const shape_type& input_shape, const shape_type& expected_shape):
    shape_mismatch_error(pprintf("input of shape {} does not match established shape {}", input_shape, expected_shape)),
    input_shape(input_shape), expected_shape(expected_shape)
{}

bad_tensor_shape::bad_tensor_shape(const shape_type& shape):
    shape_mismatch_error(pprintf("tensor of shape {} has more elements than can be addressed", shape)),
    shape(shape)
{}

bad_tensor_data::bad_tensor_data(const shape_type& shape, size_type n_values):
    shape_mismatch_error(pprintf("tensor of shape {} requires {} values, got {}", shape, shape_size(shape), n_values)),
    shape(shape), n_values(n_values)
{}

} // namespace spf
