#ifndef NABLA_SOFTMAX_HPP
#define NABLA_SOFTMAX_HPP

#include <torch/torch.h>

#include <utility>

#include "../activation.hpp"

namespace Nabla::Activation::Details {

    struct Softmax {
        [[nodiscard]] torch::Tensor operator()(torch::Tensor input) const {
            if (input.dim() == 0) {
                return input;
            }
            const auto dim = input.dim() - 1;
            return torch::softmax(std::move(input), dim);
        }

        // Every output depends on every input of its row, so the derivative is a
        // per-sample Jacobian J = diag(s) - s s^T with shape [..., n, n].
        [[nodiscard]] torch::Tensor gradient(const torch::Tensor& input) const {
            auto s = torch::softmax(input, input.dim() - 1);
            return torch::diag_embed(s) - s.unsqueeze(-1) * s.unsqueeze(-2);
        }
    };

}

#endif //NABLA_SOFTMAX_HPP
