#ifndef NABLA_INPUT_HPP
#define NABLA_INPUT_HPP

#include <string_view>
#include <utility>

#include <torch/torch.h>

#include "../../common/error.hpp"
#include "../../common/shape.hpp"
#include "context.hpp"

namespace Nabla::Layer::Details {

    struct InputOptions {
        Shape shape{};  // empty: taken from the first batch seen by fit
    };

    struct InputDescriptor {
        InputOptions options{};
    };

    class InputImpl {
    public:
        static constexpr std::string_view kind{"Input"};

        explicit InputImpl(InputOptions options = {}) : options_(std::move(options)) {}

        [[nodiscard]] Shape infer(const Shape& input_shape) const
        {
            if (!options_.shape.empty() && options_.shape != input_shape) {
                throw ::Nabla::ShapeError("Input layer declared shape " + format_shape(options_.shape)
                                          + " but received " + format_shape(input_shape) + ".");
            }
            return input_shape;
        }

        [[nodiscard]] torch::Tensor transform(const LayerState&, ForwardContext&, const torch::Tensor& inputs, bool) const
        {
            return inputs;
        }

        [[nodiscard]] torch::Tensor d_inputs(const LayerState&, const ForwardContext&, const torch::Tensor& delta) const
        {
            return delta;
        }

        [[nodiscard]] InputDescriptor descriptor(const LayerState& state) const
        {
            return InputDescriptor{.options = {.shape = state.initialized ? state.input_shape : options_.shape}};
        }

        [[nodiscard]] const InputOptions& options() const noexcept { return options_; }

    private:
        InputOptions options_{};
    };
}

#endif // NABLA_INPUT_HPP
