#ifndef NABLA_LEAKY_RELU_HPP
#define NABLA_LEAKY_RELU_HPP

#include <torch/torch.h>

#include <utility>

#include "../activation.hpp"

namespace Nabla::Activation::Details {
    struct LeakyReLU {
        double negative_slope{0.01};

        [[nodiscard]] torch::Tensor operator()(torch::Tensor input) const {
            return torch::leaky_relu(std::move(input), negative_slope);
        }

        [[nodiscard]] torch::Tensor gradient(const torch::Tensor& input) const {
            return torch::where(input.gt(0),
                                torch::ones_like(input),
                                torch::full_like(input, negative_slope));
        }
    };
}

#endif //NABLA_LEAKY_RELU_HPP
