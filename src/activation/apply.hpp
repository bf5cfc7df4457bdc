#ifndef NABLA_ACTIVATION_APPLY_HPP
#define NABLA_ACTIVATION_APPLY_HPP

#include <torch/torch.h>

#include <string>
#include <utility>

#include "../common/error.hpp"
#include "activation.hpp"
#include "details/leaky_relu.hpp"
#include "details/relu.hpp"
#include "details/sigmoid.hpp"
#include "details/softmax.hpp"
#include "details/tanh.hpp"

namespace Nabla::Activation::Details {
    inline torch::Tensor apply(::Nabla::Activation::Type type, torch::Tensor input) {
        switch (type) {
            case ::Nabla::Activation::Type::ReLU:
                return ReLU{}(std::move(input));
            case ::Nabla::Activation::Type::LeakyReLU:
                return LeakyReLU{}(std::move(input));
            case ::Nabla::Activation::Type::Sigmoid:
                return Sigmoid{}(std::move(input));
            case ::Nabla::Activation::Type::Tanh:
                return Tanh{}(std::move(input));
            case ::Nabla::Activation::Type::Softmax:
                return Softmax{}(std::move(input));
            case ::Nabla::Activation::Type::Identity:
            default:
                return input;
        }
    }

    // Derivative of the activation at `input`. Elementwise activations return a
    // tensor shaped like `input`; Softmax returns one Jacobian per sample.
    inline torch::Tensor gradient(::Nabla::Activation::Type type, const torch::Tensor& input) {
        switch (type) {
            case ::Nabla::Activation::Type::ReLU:
                return ReLU{}.gradient(input);
            case ::Nabla::Activation::Type::LeakyReLU:
                return LeakyReLU{}.gradient(input);
            case ::Nabla::Activation::Type::Sigmoid:
                return Sigmoid{}.gradient(input);
            case ::Nabla::Activation::Type::Tanh:
                return Tanh{}.gradient(input);
            case ::Nabla::Activation::Type::Softmax:
                return Softmax{}.gradient(input);
            case ::Nabla::Activation::Type::Identity:
            default:
                return torch::ones_like(input);
        }
    }

    // Chain rule through an activation: maps dL/d(output) to dL/d(pre-activation).
    // A gradient shaped like d_out is a diagonal Jacobian and reduces to a product;
    // a gradient with one extra trailing dimension is contracted row-by-Jacobian
    // for the whole batch in a single bmm.
    inline torch::Tensor contract(const torch::Tensor& d_out, const torch::Tensor& gradient) {
        if (gradient.sizes() == d_out.sizes()) {
            return d_out * gradient;
        }

        const auto rank = d_out.dim();
        if (rank >= 1 && gradient.dim() == rank + 1) {
            const auto n = d_out.size(-1);
            const bool square = gradient.size(-1) == n && gradient.size(-2) == n;
            const bool leading_match = gradient.sizes().slice(0, rank - 1) == d_out.sizes().slice(0, rank - 1);
            if (square && leading_match) {
                auto rows = d_out.reshape({-1, 1, n});
                auto jacobians = gradient.reshape({-1, n, n}).to(d_out.scalar_type());
                return torch::bmm(rows, jacobians).reshape(d_out.sizes());
            }
        }

        throw ::Nabla::ShapeError("Activation gradient of shape " + std::string(c10::str(gradient.sizes()))
                                  + " cannot be chained with an output gradient of shape "
                                  + std::string(c10::str(d_out.sizes())) + ".");
    }

    [[nodiscard]] inline std::string to_string(::Nabla::Activation::Type type) {
        switch (type) {
            case ::Nabla::Activation::Type::ReLU: return "ReLU";
            case ::Nabla::Activation::Type::LeakyReLU: return "LeakyReLU";
            case ::Nabla::Activation::Type::Sigmoid: return "Sigmoid";
            case ::Nabla::Activation::Type::Tanh: return "Tanh";
            case ::Nabla::Activation::Type::Softmax: return "Softmax";
            case ::Nabla::Activation::Type::Identity:
            default: return "Identity";
        }
    }
}
#endif // NABLA_ACTIVATION_APPLY_HPP
