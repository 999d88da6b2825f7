#pragma once

/*
 * Common definitions for value, index and shape types used across the
 * spikeflow library.
 */

#include <cstddef>
#include <cstdint>
#include <random>
#include <string>
#include <type_traits>
#include <vector>

#include <spikeflow/export.hpp>

namespace spf {

// Floating point type of current values, weights and transformer state.
// All computation is performed on the host in this precision.

using current_type = double;

// For extents of tensor dimensions and flat indexes into tensors.

using size_type = std::size_t;

// Extents of a tensor, outermost dimension first.

using shape_type = std::vector<size_type>;

// For counting discrete simulation steps.

using step_type = std::uint64_t;

// Random number engine used for weight initialisation.

using engine_type = std::mt19937_64;
using seed_type = std::remove_cv_t<decltype(engine_type::default_seed)>;

constexpr static auto default_seed = engine_type::default_seed;

// Number of elements described by a shape; 1 for the empty (scalar) shape.
// Throws bad_tensor_shape if the count overflows size_type.

SPF_SPIKEFLOW_API size_type shape_size(const shape_type& shape);

// Shape as text, e.g. "[2, 3]".

SPF_SPIKEFLOW_API std::string to_string(const shape_type& shape);

} // namespace spf
