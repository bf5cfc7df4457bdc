#ifndef NABLA_COMMON_SHAPE_HPP
#define NABLA_COMMON_SHAPE_HPP

#include <cstdint>
#include <functional>
#include <numeric>
#include <sstream>
#include <string>
#include <vector>

#include <torch/torch.h>

namespace Nabla {
    // Per-sample shape. The batch dimension is never stored.
    using Shape = std::vector<std::int64_t>;

    [[nodiscard]] inline std::string format_shape(const Shape& shape)
    {
        std::ostringstream stream;
        stream << '(';
        for (std::size_t i = 0; i < shape.size(); ++i) {
            if (i > 0) {
                stream << ", ";
            }
            stream << shape[i];
        }
        if (shape.size() == 1) {
            stream << ',';
        }
        stream << ')';
        return stream.str();
    }

    [[nodiscard]] inline std::int64_t shape_numel(const Shape& shape)
    {
        return std::accumulate(shape.begin(), shape.end(), std::int64_t{1}, std::multiplies<>());
    }

    // Drops the leading (batch) dimension of a tensor.
    [[nodiscard]] inline Shape sample_shape(const torch::Tensor& tensor)
    {
        if (!tensor.defined() || tensor.dim() == 0) {
            return {};
        }
        const auto sizes = tensor.sizes();
        return Shape(sizes.begin() + 1, sizes.end());
    }
}

#endif // NABLA_COMMON_SHAPE_HPP
