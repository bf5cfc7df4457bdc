#ifndef NABLA_MAE_HPP
#define NABLA_MAE_HPP

#include <torch/torch.h>

#include "reduction.hpp"

namespace Nabla::Loss::Details {
    struct MAEOptions {
        Reduction reduction{Reduction::Mean};
    };

    struct MAEDescriptor {
        MAEOptions options{};
    };

    inline torch::Tensor compute(const MAEDescriptor& descriptor, const torch::Tensor& prediction, const torch::Tensor& target) {
        return torch::nn::functional::l1_loss(
            prediction,
            target,
            torch::nn::functional::L1LossFuncOptions().reduction(
                to_torch_reduction<torch::nn::functional::L1LossFuncOptions>(descriptor.options.reduction)));
    }

    // Subgradient 0 where prediction == target.
    inline torch::Tensor gradient(const MAEDescriptor& descriptor, const torch::Tensor& prediction, const torch::Tensor& target) {
        return torch::sign(prediction - target) / reduction_scale(descriptor.options.reduction, prediction.numel());
    }
}

#endif // NABLA_MAE_HPP
