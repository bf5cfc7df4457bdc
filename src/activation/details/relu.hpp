#ifndef NABLA_RELU_HPP
#define NABLA_RELU_HPP

#include <torch/torch.h>

#include <utility>

#include "../activation.hpp"

namespace Nabla::Activation::Details {
    struct ReLU {
        [[nodiscard]] torch::Tensor operator()(torch::Tensor input) const {
            return torch::relu(std::move(input));
        }

        [[nodiscard]] torch::Tensor gradient(const torch::Tensor& input) const {
            return input.gt(0).to(input.scalar_type());
        }
    };
}

#endif //NABLA_RELU_HPP
