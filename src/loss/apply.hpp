#ifndef NABLA_LOSS_APPLY_HPP
#define NABLA_LOSS_APPLY_HPP

#include <string>
#include <type_traits>
#include <variant>

#include <torch/torch.h>

#include "../common/error.hpp"
#include "../common/shape.hpp"
#include "loss.hpp"

namespace Nabla::Loss::Details {
    namespace detail {
        inline torch::Tensor aligned_target(const torch::Tensor& prediction, const torch::Tensor& target) {
            if (!prediction.defined() || !target.defined()) {
                throw ::Nabla::ShapeError("Loss received an undefined tensor.");
            }
            if (prediction.sizes() != target.sizes()) {
                throw ::Nabla::ShapeError("Loss operands disagree: prediction " + std::string(c10::str(prediction.sizes()))
                                          + " vs target " + std::string(c10::str(target.sizes())) + ".");
            }
            return target.to(prediction.scalar_type());
        }
    }

    // Scalar loss value of one batch.
    inline double compute(const ::Nabla::Loss::Descriptor& descriptor,
                          const torch::Tensor& prediction,
                          const torch::Tensor& target) {
        torch::NoGradGuard no_grad{};
        auto aligned = detail::aligned_target(prediction, target);
        return std::visit([&](const auto& concrete) {
            return compute(concrete, prediction, aligned).template item<double>();
        }, descriptor);
    }

    // dL/d(prediction), same shape as prediction.
    inline torch::Tensor gradient(const ::Nabla::Loss::Descriptor& descriptor,
                                  const torch::Tensor& prediction,
                                  const torch::Tensor& target) {
        torch::NoGradGuard no_grad{};
        auto aligned = detail::aligned_target(prediction, target);
        return std::visit([&](const auto& concrete) {
            return gradient(concrete, prediction, aligned);
        }, descriptor);
    }

    [[nodiscard]] inline std::string to_string(const ::Nabla::Loss::Descriptor& descriptor) {
        return std::visit([](const auto& concrete) -> std::string {
            using T = std::decay_t<decltype(concrete)>;
            if constexpr (std::is_same_v<T, MSEDescriptor>) return "MSE";
            else if constexpr (std::is_same_v<T, MAEDescriptor>) return "MAE";
            else if constexpr (std::is_same_v<T, BinaryCrossEntropyDescriptor>) return "BinaryCrossEntropy";
            else return "CategoricalCrossEntropy";
        }, descriptor);
    }
}

#endif // NABLA_LOSS_APPLY_HPP
