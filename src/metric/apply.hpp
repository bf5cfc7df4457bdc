#ifndef NABLA_METRIC_APPLY_HPP
#define NABLA_METRIC_APPLY_HPP

#include <array>
#include <string>
#include <string_view>

#include <torch/torch.h>

#include "../common/error.hpp"
#include "metric.hpp"

namespace Nabla::Metric {
    namespace detail {
        inline constexpr std::array<Kind, 3> kAllKinds{Kind::Accuracy, Kind::MeanSquaredError, Kind::MeanAbsoluteError};

        // Class index per sample: argmax over the last dimension for multi-column
        // tensors, a 0.5 threshold for single-column ones.
        inline torch::Tensor to_labels(const torch::Tensor& tensor) {
            if (tensor.dim() >= 2 && tensor.size(-1) > 1) {
                return tensor.argmax(-1);
            }
            return tensor.reshape({tensor.size(0), -1}).select(1, 0).ge(0.5).to(torch::kLong);
        }
    }

    [[nodiscard]] inline std::string_view name(Kind kind) noexcept {
        switch (kind) {
            case Kind::MeanSquaredError: return "mse";
            case Kind::MeanAbsoluteError: return "mae";
            case Kind::Accuracy:
            default: return "accuracy";
        }
    }

    [[nodiscard]] inline std::string_view name(const Descriptor& descriptor) noexcept { return name(descriptor.kind); }

    [[nodiscard]] inline Descriptor from_name(std::string_view metric_name) {
        for (auto kind : detail::kAllKinds) {
            if (name(kind) == metric_name) {
                return Descriptor{kind};
            }
        }
        throw ::Nabla::ConfigurationError("Unknown metric '" + std::string(metric_name)
                                          + "'. Expected one of: accuracy, mse, mae.");
    }

    // Metric value of predictions against targets of the same shape.
    [[nodiscard]] inline double compute(const Descriptor& descriptor,
                                        const torch::Tensor& prediction,
                                        const torch::Tensor& target) {
        if (!prediction.defined() || !target.defined() || prediction.sizes() != target.sizes()) {
            throw ::Nabla::ShapeError("Metric '" + std::string(name(descriptor))
                                      + "' expects predictions and targets of identical shape.");
        }
        torch::NoGradGuard no_grad{};
        auto aligned = target.to(prediction.scalar_type());
        switch (descriptor.kind) {
            case Kind::MeanSquaredError:
                return (prediction - aligned).pow(2).mean().item<double>();
            case Kind::MeanAbsoluteError:
                return (prediction - aligned).abs().mean().item<double>();
            case Kind::Accuracy:
            default: {
                if (prediction.dim() == 0 || prediction.size(0) == 0) {
                    return 0.0;
                }
                auto predicted = detail::to_labels(prediction);
                auto expected = detail::to_labels(aligned);
                return predicted.eq(expected).to(torch::kFloat64).mean().item<double>();
            }
        }
    }
}

#endif // NABLA_METRIC_APPLY_HPP
