#ifndef NABLA_TANH_HPP
#define NABLA_TANH_HPP

#include <torch/torch.h>

#include <utility>

#include "../activation.hpp"

namespace Nabla::Activation::Details {
    struct Tanh {
        [[nodiscard]] torch::Tensor operator()(torch::Tensor input) const {
            return torch::tanh(std::move(input));
        }

        [[nodiscard]] torch::Tensor gradient(const torch::Tensor& input) const {
            auto t = torch::tanh(input);
            return 1.0 - t * t;
        }
    };
}

#endif //NABLA_TANH_HPP
