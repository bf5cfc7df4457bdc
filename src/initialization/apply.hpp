#ifndef NABLA_INITIALIZATION_APPLY_HPP
#define NABLA_INITIALIZATION_APPLY_HPP
#include <cmath>
#include <cstdint>

#include <torch/torch.h>

#include "initialization.hpp"

namespace Nabla::Initialization::Details {
    namespace detail {
        inline void zero_bias_if_present(torch::Tensor& bias) {
            if (bias.defined()) {
                torch::nn::init::zeros_(bias);
            }
        }
    }  // namespace detail

    // FC weights are stored [fan_in, fan_out], the transpose of torch::nn::Linear,
    // so He schemes read their fan from dimension 0 (kFanOut). Conv2d weights keep
    // torch's layout and pass kFanIn.
    inline void apply(const ::Nabla::Initialization::Descriptor& descriptor,
                      torch::Tensor& weights,
                      torch::Tensor& bias,
                      std::int64_t fan_in,
                      torch::nn::init::FanModeType fan_mode = torch::kFanOut) {
        torch::NoGradGuard no_grad{};
        switch (descriptor.type) {
            case ::Nabla::Initialization::Type::XavierNormal:
                torch::nn::init::xavier_normal_(weights);
                detail::zero_bias_if_present(bias);
                break;
            case ::Nabla::Initialization::Type::XavierUniform:
                torch::nn::init::xavier_uniform_(weights);
                detail::zero_bias_if_present(bias);
                break;
            case ::Nabla::Initialization::Type::HeNormal:
                torch::nn::init::kaiming_normal_(weights,
                                                 /*a=*/0.0,
                                                 fan_mode,
                                                 torch::kReLU);
                detail::zero_bias_if_present(bias);
                break;
            case ::Nabla::Initialization::Type::HeUniform:
                torch::nn::init::kaiming_uniform_(weights,
                                                  /*a=*/0.0,
                                                  fan_mode,
                                                  torch::kReLU);
                detail::zero_bias_if_present(bias);
                break;
            case ::Nabla::Initialization::Type::Zeros:
                torch::nn::init::zeros_(weights);
                detail::zero_bias_if_present(bias);
                break;
            case ::Nabla::Initialization::Type::Default:
            default: {
                // Same bound as torch::nn::Linear::reset_parameters.
                const double bound = fan_in > 0 ? 1.0 / std::sqrt(static_cast<double>(fan_in)) : 0.0;
                torch::nn::init::uniform_(weights, -bound, bound);
                if (bias.defined()) {
                    torch::nn::init::uniform_(bias, -bound, bound);
                }
                break;
            }
        }
    }
}
#endif // NABLA_INITIALIZATION_APPLY_HPP
