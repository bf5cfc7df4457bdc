#ifndef NABLA_OPTIMIZER_REGISTRY_HPP
#define NABLA_OPTIMIZER_REGISTRY_HPP


#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

#include <torch/torch.h>

#include "../common/error.hpp"
#include "../layer/details/context.hpp"
#include "details/adagrad.hpp"
#include "details/adam.hpp"
#include "details/rmsprop.hpp"
#include "details/sgd.hpp"

namespace Nabla::Optimizer::Details {

    // A compiled optimizer. Each parameterised layer owns one slot (a torch
    // param group plus its per-parameter state), keyed by the identity of its
    // weight tensor. Parameters are updated in place and never re-allocated,
    // so the key stays valid for the lifetime of the layer.
    class Binding {
    public:
        using SlotRegistrar = std::function<void(std::vector<at::Tensor>)>;

        Binding() = default;
        Binding(std::unique_ptr<torch::optim::Optimizer> instance, SlotRegistrar register_slot)
            : instance_(std::move(instance)), register_slot_(std::move(register_slot)) {}

        Binding(Binding&&) noexcept = default;
        Binding& operator=(Binding&&) noexcept = default;
        Binding(const Binding&) = delete;
        Binding& operator=(const Binding&) = delete;

        [[nodiscard]] explicit operator bool() const noexcept { return instance_ != nullptr; }

        void add_slot(const ::Nabla::Layer::Details::LayerState& layer)
        {
            if (!instance_ || !layer.weights.defined() || has_slot(layer)) {
                return;
            }
            std::vector<at::Tensor> params{layer.weights};
            if (layer.bias.defined()) {
                params.push_back(layer.bias);
            }
            register_slot_(std::move(params));
            slots_.insert(layer.weights.unsafeGetTensorImpl());
        }

        [[nodiscard]] bool has_slot(const ::Nabla::Layer::Details::LayerState& layer) const
        {
            return layer.weights.defined() && slots_.count(layer.weights.unsafeGetTensorImpl()) > 0;
        }

        // Installs the gradients on the slot's parameters, steps, then clears them.
        // Parameters of other slots carry no gradient and are skipped by step().
        void update(::Nabla::Layer::Details::LayerState& layer,
                    const ::Nabla::Layer::Details::ParameterGradients& gradients)
        {
            if (!has_slot(layer)) {
                throw ::Nabla::StateError("Layer '" + layer.name
                                          + "' has no optimizer slot. Compile the model after the layer is initialized.");
            }

            torch::NoGradGuard no_grad{};
            install_gradient(layer.weights, gradients.weights, layer.name);
            install_gradient(layer.bias, gradients.bias, layer.name);
            instance_->step();
            clear_gradient(layer.weights);
            clear_gradient(layer.bias);
        }

        [[nodiscard]] std::size_t slot_count() const noexcept { return slots_.size(); }

    private:
        static void install_gradient(torch::Tensor& parameter, const torch::Tensor& gradient, const std::string& name)
        {
            if (!parameter.defined() || !gradient.defined()) {
                return;
            }
            if (parameter.sizes() != gradient.sizes()) {
                throw ::Nabla::ShapeError("Gradient of shape " + std::string(c10::str(gradient.sizes()))
                                          + " does not match parameter of shape "
                                          + std::string(c10::str(parameter.sizes())) + " in layer '" + name + "'.");
            }
            parameter.mutable_grad() = gradient.detach().to(parameter.scalar_type());
        }

        static void clear_gradient(torch::Tensor& parameter)
        {
            if (parameter.defined()) {
                parameter.mutable_grad() = torch::Tensor{};
            }
        }

        std::unique_ptr<torch::optim::Optimizer> instance_{};
        SlotRegistrar register_slot_{};
        std::unordered_set<const void*> slots_{};
    };

    template <class Optimizer, class Descriptor>
    Binding make_binding(const Descriptor& descriptor) {
        auto optimizer = std::make_unique<Optimizer>(to_torch_options(descriptor.options));
        auto* raw = optimizer.get();
        return Binding(std::move(optimizer), [raw](std::vector<at::Tensor> params) {
            raw->add_slot(std::move(params));
        });
    }

    inline Binding build_binding(const SGDDescriptor& descriptor) {
        return make_binding<SGD>(descriptor);
    }

    inline Binding build_binding(const AdamDescriptor& descriptor) {
        return make_binding<Adam>(descriptor);
    }

    inline Binding build_binding(const AdamWDescriptor& descriptor) {
        return make_binding<AdamW>(descriptor);
    }

    inline Binding build_binding(const RMSpropDescriptor& descriptor) {
        return make_binding<RMSProp>(descriptor);
    }

    inline Binding build_binding(const AdagradDescriptor& descriptor) {
        return make_binding<Adagrad>(descriptor);
    }

    template <class... DescriptorTypes>
    Binding build_binding(const std::variant<DescriptorTypes...>& descriptor) {
        return std::visit([](const auto& concrete_descriptor) { return build_binding(concrete_descriptor); },
                          descriptor);
    }
}

#endif // NABLA_OPTIMIZER_REGISTRY_HPP
