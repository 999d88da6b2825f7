#include <algorithm>
#include <limits>
#include <string>

#include <spikeflow/common_types.hpp>
#include <spikeflow/sfexcept.hpp>

#include "util/strprintf.hpp"

namespace spf {

size_type shape_size(const shape_type& shape) {
    if (std::find(shape.begin(), shape.end(), size_type(0))!=shape.end()) return 0;

    constexpr auto max_size = std::numeric_limits<size_type>::max();
    size_type n = 1;
    for (auto extent: shape) {
        if (n>max_size/extent) throw bad_tensor_shape(shape);
        n *= extent;
    }
    return n;
}

std::string to_string(const shape_type& shape) {
    return util::pprintf("{}", shape);
}

} // namespace spf
