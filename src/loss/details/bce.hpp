#ifndef NABLA_BCE_HPP
#define NABLA_BCE_HPP

#include <torch/torch.h>

#include "reduction.hpp"

namespace Nabla::Loss::Details {

    // Expects probabilities (e.g. a Sigmoid output), not logits.
    struct BinaryCrossEntropyOptions {
        Reduction reduction{Reduction::Mean};
        double eps{1e-7};
    };

    struct BinaryCrossEntropyDescriptor {
        BinaryCrossEntropyOptions options{};
    };

    inline torch::Tensor compute(const BinaryCrossEntropyDescriptor& descriptor, const torch::Tensor& prediction, const torch::Tensor& target) {
        const double eps = descriptor.options.eps;
        auto clamped = prediction.clamp(eps, 1.0 - eps);
        auto opts = torch::nn::functional::BinaryCrossEntropyFuncOptions{};
        opts = opts.reduction(to_torch_reduction<torch::nn::functional::BinaryCrossEntropyFuncOptions>(descriptor.options.reduction));
        return torch::nn::functional::binary_cross_entropy(clamped, target, opts);
    }

    inline torch::Tensor gradient(const BinaryCrossEntropyDescriptor& descriptor, const torch::Tensor& prediction, const torch::Tensor& target) {
        const double eps = descriptor.options.eps;
        auto clamped = prediction.clamp(eps, 1.0 - eps);
        return (clamped - target) / (clamped * (1.0 - clamped))
               / reduction_scale(descriptor.options.reduction, prediction.numel());
    }

}

#endif // NABLA_BCE_HPP
