#ifndef NABLA_DROPOUT_HPP
#define NABLA_DROPOUT_HPP

#include <stdexcept>
#include <string_view>

#include <torch/torch.h>

#include "../../common/shape.hpp"
#include "context.hpp"

namespace Nabla::Layer::Details {

    struct DropoutOptions {
        double probability{0.5};
    };

    struct DropoutDescriptor {
        DropoutOptions options{};
    };

    // Inverted dropout: kept units are scaled by 1 / (1 - p) during training
    // so inference is a plain identity.
    class DropoutImpl {
    public:
        static constexpr std::string_view kind{"Dropout"};

        explicit DropoutImpl(DropoutOptions options = {})
            : options_(options)
        {
            if (!(options_.probability >= 0.0 && options_.probability < 1.0)) {
                throw std::invalid_argument("Dropout probability must be in the range [0, 1).");
            }
        }

        [[nodiscard]] Shape infer(const Shape& input_shape) const { return input_shape; }

        [[nodiscard]] torch::Tensor transform(const LayerState&,
                                              ForwardContext& context,
                                              const torch::Tensor& inputs,
                                              bool training) const
        {
            if (!training || options_.probability == 0.0) {
                context.mask = torch::ones_like(inputs);
                return inputs;
            }

            const double keep_prob = 1.0 - options_.probability;
            context.mask = torch::bernoulli(torch::full_like(inputs, keep_prob)) / keep_prob;
            return inputs * context.mask;
        }

        [[nodiscard]] torch::Tensor d_inputs(const LayerState&,
                                             const ForwardContext& context,
                                             const torch::Tensor& delta) const
        {
            return delta * context.mask;
        }

        [[nodiscard]] DropoutDescriptor descriptor(const LayerState&) const { return DropoutDescriptor{options_}; }

        [[nodiscard]] const DropoutOptions& options() const noexcept { return options_; }

    private:
        DropoutOptions options_{};
    };

}

#endif //NABLA_DROPOUT_HPP
