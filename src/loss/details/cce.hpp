#ifndef NABLA_CCE_HPP
#define NABLA_CCE_HPP

#include <cstdint>
#include <stdexcept>

#include <torch/torch.h>

#include "reduction.hpp"

namespace Nabla::Loss::Details {
    // Cross entropy on probabilities (e.g. a Softmax output) against one-hot
    // targets. Mean reduction averages over samples, not over elements.
    struct CategoricalCrossEntropyOptions {
        Reduction reduction{Reduction::Mean};
        double eps{1e-7};
    };

    struct CategoricalCrossEntropyDescriptor {
        CategoricalCrossEntropyOptions options{};
    };

    namespace detail {
        inline std::int64_t sample_count(const torch::Tensor& prediction) {
            if (prediction.dim() < 1) {
                throw std::invalid_argument("Categorical cross entropy expects predictions with a class dimension.");
            }
            return prediction.dim() == 1 ? 1 : prediction.size(0);
        }
    }

    inline torch::Tensor compute(const CategoricalCrossEntropyDescriptor& descriptor,
                                 const torch::Tensor& prediction,
                                 const torch::Tensor& target) {
        const auto samples = detail::sample_count(prediction);
        auto log_probs = torch::log(prediction.clamp(descriptor.options.eps, 1.0));
        auto total = -(target * log_probs).sum();
        return total / reduction_scale(descriptor.options.reduction, samples);
    }

    inline torch::Tensor gradient(const CategoricalCrossEntropyDescriptor& descriptor,
                                  const torch::Tensor& prediction,
                                  const torch::Tensor& target) {
        const auto samples = detail::sample_count(prediction);
        auto clamped = prediction.clamp(descriptor.options.eps, 1.0);
        return -target / clamped / reduction_scale(descriptor.options.reduction, samples);
    }
}

#endif // NABLA_CCE_HPP
