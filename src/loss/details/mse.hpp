#ifndef NABLA_MSE_HPP
#define NABLA_MSE_HPP

#include <torch/torch.h>

#include "reduction.hpp"

namespace Nabla::Loss::Details {

    namespace F = torch::nn::functional;

    struct MSEOptions {
        Reduction reduction{Reduction::Mean};
    };

    struct MSEDescriptor {
        MSEOptions options{};
    };

    inline torch::Tensor compute(const MSEDescriptor& descriptor,
                                 const torch::Tensor& prediction,
                                 const torch::Tensor& target)
    {
        return F::mse_loss(
            prediction,
            target,
            F::MSELossFuncOptions().reduction(to_torch_reduction<F::MSELossFuncOptions>(descriptor.options.reduction)));
    }

    inline torch::Tensor gradient(const MSEDescriptor& descriptor,
                                  const torch::Tensor& prediction,
                                  const torch::Tensor& target)
    {
        return 2.0 * (prediction - target) / reduction_scale(descriptor.options.reduction, prediction.numel());
    }

}

#endif // NABLA_MSE_HPP
