#ifndef NABLA_FLATTEN_HPP
#define NABLA_FLATTEN_HPP
#include <cstdint>
#include <string_view>
#include <vector>

#include <torch/torch.h>

#include "../../common/error.hpp"
#include "../../common/shape.hpp"
#include "context.hpp"

namespace Nabla::Layer::Details {

    struct FlattenOptions {};

    struct FlattenDescriptor {
        FlattenOptions options{};
    };

    class FlattenImpl {
    public:
        static constexpr std::string_view kind{"Flatten"};

        FlattenImpl() = default;
        explicit FlattenImpl(FlattenOptions options) : options_(options) {}

        [[nodiscard]] Shape infer(const Shape& input_shape) const
        {
            if (input_shape.empty()) {
                throw ::Nabla::ShapeError("Flatten expects samples of rank >= 1.");
            }
            return {shape_numel(input_shape)};
        }

        [[nodiscard]] torch::Tensor transform(const LayerState& state,
                                              ForwardContext&,
                                              const torch::Tensor& inputs,
                                              bool) const
        {
            return inputs.reshape({inputs.size(0), state.output_shape.front()});
        }

        [[nodiscard]] torch::Tensor d_inputs(const LayerState& state,
                                             const ForwardContext&,
                                             const torch::Tensor& delta) const
        {
            std::vector<std::int64_t> sizes{delta.size(0)};
            sizes.insert(sizes.end(), state.input_shape.begin(), state.input_shape.end());
            return delta.reshape(sizes);
        }

        [[nodiscard]] FlattenDescriptor descriptor(const LayerState&) const { return FlattenDescriptor{options_}; }

    private:
        FlattenOptions options_{};
    };

}

#endif //NABLA_FLATTEN_HPP
