#ifndef NABLA_LAYER_REGISTRY_HPP
#define NABLA_LAYER_REGISTRY_HPP

#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

#include <torch/torch.h>

#include "../activation/activation.hpp"
#include "../activation/apply.hpp"
#include "../common/error.hpp"
#include "../common/shape.hpp"
#include "../optimizer/registry.hpp"
#include "details/context.hpp"
#include "details/conv.hpp"
#include "details/dropout.hpp"
#include "details/fc.hpp"
#include "details/flatten.hpp"
#include "details/input.hpp"


namespace Nabla::Layer::Details {

    using Descriptor = std::variant<InputDescriptor,
                                    FCDescriptor,
                                    Conv2dDescriptor,
                                    FlattenDescriptor,
                                    DropoutDescriptor>;

    // One link of the chain. The kind-specific part lives in Impl; everything
    // the chain relies on (shapes, parameters, lifecycle) lives in LayerState.
    class RegisteredLayer {
    public:
        using Impl = std::variant<InputImpl, FCImpl, Conv2dImpl, FlattenImpl, DropoutImpl>;

        RegisteredLayer(Impl impl, std::string name, ::Nabla::Activation::Descriptor activation = ::Nabla::Activation::Identity)
            : impl_(std::move(impl))
        {
            state_.name = std::move(name);
            state_.activation = activation;
        }

        void initialize(const Shape& input_shape)
        {
            auto output_shape = std::visit([&](const auto& impl) { return impl.infer(input_shape); }, impl_);
            state_.input_shape = input_shape;
            state_.output_shape = std::move(output_shape);
            std::visit([&](const auto& impl) {
                if constexpr (requires { impl.allocate(state_); }) {
                    impl.allocate(state_);
                }
            }, impl_);
            state_.initialized = true;
        }

        [[nodiscard]] Forward forward(const torch::Tensor& inputs, bool training) const
        {
            require_initialized("forward");
            if (!inputs.defined()) {
                throw std::invalid_argument("Layer '" + state_.name + "' received an undefined tensor.");
            }
            if (sample_shape(inputs) != state_.input_shape) {
                throw ::Nabla::ShapeError("Layer '" + state_.name + "' expects samples of shape "
                                          + format_shape(state_.input_shape) + " but received "
                                          + format_shape(sample_shape(inputs)) + ".");
            }

            torch::NoGradGuard no_grad{};
            Forward result{};
            result.context.inputs = inputs;
            auto z = std::visit([&](const auto& impl) {
                return impl.transform(state_, result.context, inputs, training);
            }, impl_);
            result.output = ::Nabla::Activation::Details::apply(state_.activation.type, z);
            result.context.pre_activation = std::move(z);
            return result;
        }

        // dL/dz from dL/d(output).
        [[nodiscard]] torch::Tensor get_delta(const ForwardContext& context, const torch::Tensor& d_out) const
        {
            require_initialized("get_delta");
            require_context(context);
            torch::NoGradGuard no_grad{};
            if (state_.activation.type == ::Nabla::Activation::Type::Identity) {
                return d_out;
            }
            auto gradient = ::Nabla::Activation::Details::gradient(state_.activation.type, context.pre_activation);
            return ::Nabla::Activation::Details::contract(d_out, gradient);
        }

        [[nodiscard]] torch::Tensor get_d_inputs(const ForwardContext& context, const torch::Tensor& delta) const
        {
            require_initialized("get_d_inputs");
            require_context(context);
            torch::NoGradGuard no_grad{};
            return std::visit([&](const auto& impl) { return impl.d_inputs(state_, context, delta); }, impl_);
        }

        [[nodiscard]] ParameterGradients parameter_gradients(const ForwardContext& context, const torch::Tensor& delta) const
        {
            require_initialized("parameter_gradients");
            require_context(context);
            torch::NoGradGuard no_grad{};
            return std::visit([&](const auto& impl) -> ParameterGradients {
                if constexpr (requires { impl.parameter_gradients(state_, context, delta); }) {
                    return impl.parameter_gradients(state_, context, delta);
                } else {
                    return {};
                }
            }, impl_);
        }

        // d_inputs is taken with the weights used by forward; the optional update runs last.
        Backward backward(ForwardContext context,
                          const torch::Tensor& d_out,
                          ::Nabla::Optimizer::Details::Binding* optimizer = nullptr)
        {
            require_initialized("backward");
            const auto delta = get_delta(context, d_out);
            Backward result{};
            result.parameters = parameter_gradients(context, delta);
            result.d_inputs = get_d_inputs(context, delta);
            if (optimizer != nullptr) {
                update(*optimizer, result.parameters);
            }
            return result;
        }

        void update(::Nabla::Optimizer::Details::Binding& optimizer, const ParameterGradients& gradients)
        {
            if (!state_.trainable || !has_parameters() || gradients.empty()) {
                return;
            }
            optimizer.update(state_, gradients);
        }

        [[nodiscard]] std::int64_t count_params() const
        {
            std::int64_t total = 0;
            if (state_.weights.defined()) total += state_.weights.numel();
            if (state_.bias.defined()) total += state_.bias.numel();
            return total;
        }

        [[nodiscard]] std::string summary() const
        {
            std::ostringstream stream;
            stream << std::left << std::setw(18) << state_.name
                   << std::setw(10) << kind()
                   << std::setw(16) << (state_.initialized ? format_shape(state_.output_shape) : std::string{"?"})
                   << std::right << std::setw(10) << count_params()
                   << "  " << ::Nabla::Activation::Details::to_string(state_.activation.type);
            return stream.str();
        }

        [[nodiscard]] Descriptor descriptor() const
        {
            return std::visit([&](const auto& impl) -> Descriptor { return impl.descriptor(state_); }, impl_);
        }

        [[nodiscard]] std::string_view kind() const
        {
            return std::visit([](const auto& impl) -> std::string_view { return impl.kind; }, impl_);
        }

        [[nodiscard]] bool has_parameters() const
        {
            return std::visit([](const auto& impl) {
                if constexpr (requires { impl.has_parameters(); }) {
                    return impl.has_parameters();
                } else {
                    return false;
                }
            }, impl_);
        }

        [[nodiscard]] bool is_input() const noexcept { return std::holds_alternative<InputImpl>(impl_); }
        [[nodiscard]] bool initialized() const noexcept { return state_.initialized; }
        [[nodiscard]] bool trainable() const noexcept { return state_.trainable; }
        void set_trainable(bool trainable) noexcept { state_.trainable = trainable; }

        [[nodiscard]] const std::string& name() const noexcept { return state_.name; }
        [[nodiscard]] const Shape& input_shape() const noexcept { return state_.input_shape; }
        [[nodiscard]] const Shape& output_shape() const noexcept { return state_.output_shape; }
        [[nodiscard]] const ::Nabla::Activation::Descriptor& activation() const noexcept { return state_.activation; }
        [[nodiscard]] const torch::Tensor& weights() const noexcept { return state_.weights; }
        [[nodiscard]] const torch::Tensor& bias() const noexcept { return state_.bias; }

        [[nodiscard]] LayerState& state() noexcept { return state_; }
        [[nodiscard]] const LayerState& state() const noexcept { return state_; }

    private:
        void require_initialized(std::string_view operation) const
        {
            if (!state_.initialized) {
                throw ::Nabla::StateError("Layer '" + state_.name + "' must be initialized before "
                                          + std::string(operation) + ".");
            }
        }

        void require_context(const ForwardContext& context) const
        {
            if (context.empty()) {
                throw ::Nabla::StateError("Layer '" + state_.name
                                          + "' received a context that was not produced by forward (or was already consumed).");
            }
        }

        Impl impl_;
        LayerState state_{};
    };

    // An Input with a declared shape is ready as soon as it is built.
    inline RegisteredLayer build_registered_layer(const InputDescriptor& descriptor, std::string name)
    {
        RegisteredLayer layer{InputImpl(descriptor.options), std::move(name)};
        if (!descriptor.options.shape.empty()) {
            layer.initialize(descriptor.options.shape);
        }
        return layer;
    }

    inline RegisteredLayer build_registered_layer(const FCDescriptor& descriptor, std::string name)
    {
        return RegisteredLayer{FCImpl(descriptor.options, descriptor.initialization), std::move(name), descriptor.activation};
    }

    inline RegisteredLayer build_registered_layer(const Conv2dDescriptor& descriptor, std::string name)
    {
        return RegisteredLayer{Conv2dImpl(descriptor.options, descriptor.initialization), std::move(name), descriptor.activation};
    }

    inline RegisteredLayer build_registered_layer(const FlattenDescriptor& descriptor, std::string name)
    {
        return RegisteredLayer{FlattenImpl(descriptor.options), std::move(name)};
    }

    inline RegisteredLayer build_registered_layer(const DropoutDescriptor& descriptor, std::string name)
    {
        return RegisteredLayer{DropoutImpl(descriptor.options), std::move(name)};
    }

    template <class... DescriptorTypes>
    RegisteredLayer build_registered_layer(const std::variant<DescriptorTypes...>& descriptor, std::string name) {
        return std::visit(
            [&](const auto& concrete_descriptor) {
                return build_registered_layer(concrete_descriptor, name);
            },
            descriptor);
    }

    [[nodiscard]] inline std::string default_name(const Descriptor& descriptor, std::size_t index)
    {
        const std::string_view prefix = std::visit([](const auto& concrete) -> std::string_view {
            using T = std::decay_t<decltype(concrete)>;
            if constexpr (std::is_same_v<T, InputDescriptor>) return "input";
            else if constexpr (std::is_same_v<T, FCDescriptor>) return "fc";
            else if constexpr (std::is_same_v<T, Conv2dDescriptor>) return "conv2d";
            else if constexpr (std::is_same_v<T, FlattenDescriptor>) return "flatten";
            else return "dropout";
        }, descriptor);
        return std::string(prefix) + "_" + std::to_string(index);
    }

}
#endif // NABLA_LAYER_REGISTRY_HPP
