#ifndef NABLA_FC_HPP
#define NABLA_FC_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

#include <torch/torch.h>

#include "../../activation/activation.hpp"
#include "../../common/error.hpp"
#include "../../common/shape.hpp"
#include "../../initialization/apply.hpp"
#include "../../initialization/initialization.hpp"
#include "context.hpp"


namespace Nabla::Layer::Details {
    struct FCOptions {
        std::int64_t in_features{};  // 0: inferred from the predecessor
        std::int64_t out_features{};
        bool bias{true};
    };

    struct FCDescriptor {
        FCOptions options;
        ::Nabla::Activation::Descriptor activation{::Nabla::Activation::Identity};
        ::Nabla::Initialization::Descriptor initialization{::Nabla::Initialization::Default};
    };

    // Dense layer, z = x W + b with W stored [in_features, out_features].
    class FCImpl {
    public:
        static constexpr std::string_view kind{"FC"};

        explicit FCImpl(FCOptions options,
                        ::Nabla::Initialization::Descriptor initialization = ::Nabla::Initialization::Default)
            : options_(options), initialization_(initialization)
        {
            if (options_.out_features <= 0) {
                throw std::invalid_argument("Fully connected layers require positive out features.");
            }
            if (options_.in_features < 0) {
                throw std::invalid_argument("Fully connected layers require non-negative in features.");
            }
        }

        [[nodiscard]] Shape infer(const Shape& input_shape) const
        {
            if (input_shape.size() != 1) {
                throw ::Nabla::ShapeError("FC layer expects a rank-1 sample shape, got " + format_shape(input_shape)
                                          + ". Add a Flatten layer first.");
            }
            if (options_.in_features > 0 && options_.in_features != input_shape.front()) {
                throw ::Nabla::ShapeError("FC layer declared " + std::to_string(options_.in_features)
                                          + " input features but received " + format_shape(input_shape) + ".");
            }
            return {options_.out_features};
        }

        [[nodiscard]] bool has_parameters() const noexcept { return true; }

        void allocate(LayerState& state) const
        {
            const auto fan_in = state.input_shape.front();
            const auto options = torch::TensorOptions().dtype(torch::kFloat32);
            state.weights = torch::empty({fan_in, options_.out_features}, options);
            state.bias = options_.bias ? torch::empty({options_.out_features}, options) : torch::Tensor{};
            ::Nabla::Initialization::Details::apply(initialization_, state.weights, state.bias, fan_in);
        }

        [[nodiscard]] torch::Tensor transform(const LayerState& state,
                                              ForwardContext&,
                                              const torch::Tensor& inputs,
                                              bool) const
        {
            auto x = inputs.to(state.weights.scalar_type());
            auto z = torch::matmul(x, state.weights);
            if (state.bias.defined()) {
                z = z + state.bias;
            }
            return z;
        }

        [[nodiscard]] ParameterGradients parameter_gradients(const LayerState& state,
                                                             const ForwardContext& context,
                                                             const torch::Tensor& delta) const
        {
            auto x = context.inputs.to(delta.scalar_type());
            ParameterGradients gradients{};
            gradients.weights = torch::matmul(x.transpose(0, 1), delta);
            if (state.bias.defined()) {
                gradients.bias = delta.sum(0);
            }
            return gradients;
        }

        [[nodiscard]] torch::Tensor d_inputs(const LayerState& state,
                                             const ForwardContext&,
                                             const torch::Tensor& delta) const
        {
            return torch::matmul(delta, state.weights.transpose(0, 1));
        }

        [[nodiscard]] FCDescriptor descriptor(const LayerState& state) const
        {
            FCDescriptor descriptor{.options = options_,
                                    .activation = state.activation,
                                    .initialization = initialization_};
            if (state.initialized) {
                descriptor.options.in_features = state.input_shape.front();
            }
            return descriptor;
        }

        [[nodiscard]] const FCOptions& options() const noexcept { return options_; }

    private:
        FCOptions options_{};
        ::Nabla::Initialization::Descriptor initialization_{};
    };
}

#endif //NABLA_FC_HPP
