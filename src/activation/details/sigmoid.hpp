#ifndef NABLA_SIGMOID_HPP
#define NABLA_SIGMOID_HPP

#include <torch/torch.h>

#include <utility>

#include "../activation.hpp"

namespace Nabla::Activation::Details {
    struct Sigmoid {
        [[nodiscard]] torch::Tensor operator()(torch::Tensor input) const {
            return torch::sigmoid(std::move(input));
        }

        [[nodiscard]] torch::Tensor gradient(const torch::Tensor& input) const {
            auto s = torch::sigmoid(input);
            return s * (1.0 - s);
        }
    };
}

#endif //NABLA_SIGMOID_HPP
