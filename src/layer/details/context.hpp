#ifndef NABLA_LAYER_CONTEXT_HPP
#define NABLA_LAYER_CONTEXT_HPP

#include <string>

#include <torch/torch.h>

#include "../../activation/activation.hpp"
#include "../../common/shape.hpp"

namespace Nabla::Layer::Details {

    // Everything a layer owns besides its kind-specific options.
    struct LayerState {
        std::string name{};
        Shape input_shape{};
        Shape output_shape{};
        torch::Tensor weights{};
        torch::Tensor bias{};
        ::Nabla::Activation::Descriptor activation{::Nabla::Activation::Identity};
        bool trainable{true};
        bool initialized{false};
    };

    // Values recorded by one forward call and consumed by the matching backward call.
    struct ForwardContext {
        torch::Tensor inputs{};
        torch::Tensor pre_activation{};
        torch::Tensor mask{};

        ForwardContext() = default;
        ForwardContext(const ForwardContext&) = delete;
        ForwardContext& operator=(const ForwardContext&) = delete;
        ForwardContext(ForwardContext&&) noexcept = default;
        ForwardContext& operator=(ForwardContext&&) noexcept = default;

        [[nodiscard]] bool empty() const noexcept { return !pre_activation.defined(); }
    };

    struct Forward {
        torch::Tensor output{};
        ForwardContext context{};
    };

    struct ParameterGradients {
        torch::Tensor weights{};
        torch::Tensor bias{};

        [[nodiscard]] bool empty() const noexcept { return !weights.defined() && !bias.defined(); }
    };

    struct Backward {
        torch::Tensor d_inputs{};
        ParameterGradients parameters{};
    };
}

#endif // NABLA_LAYER_CONTEXT_HPP
