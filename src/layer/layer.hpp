#ifndef NABLA_LAYER_HPP
#define NABLA_LAYER_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include <utility>
#include <variant>

#include "../activation/activation.hpp"
#include "../initialization/initialization.hpp"
#include "details/context.hpp"
#include "details/conv.hpp"
#include "details/dropout.hpp"
#include "details/fc.hpp"
#include "details/flatten.hpp"
#include "details/input.hpp"

#include "registry.hpp"

namespace Nabla::Layer {
    using InputOptions = Details::InputOptions;
    using InputDescriptor = Details::InputDescriptor;

    using FCOptions = Details::FCOptions;
    using FCDescriptor = Details::FCDescriptor;

    using Conv2dOptions = Details::Conv2dOptions;
    using Conv2dDescriptor = Details::Conv2dDescriptor;

    using FlattenOptions = Details::FlattenOptions;
    using FlattenDescriptor = Details::FlattenDescriptor;

    using DropoutOptions = Details::DropoutOptions;
    using DropoutDescriptor = Details::DropoutDescriptor;

    using Descriptor = Details::Descriptor;

    using LayerState = Details::LayerState;
    using ForwardContext = Details::ForwardContext;
    using Forward = Details::Forward;
    using ParameterGradients = Details::ParameterGradients;
    using Backward = Details::Backward;
    using RegisteredLayer = Details::RegisteredLayer;

    [[nodiscard]] inline auto Input(InputOptions options = {}) -> InputDescriptor {
        return {std::move(options)};
    }

    [[nodiscard]] inline auto FC(const FCOptions& options,
                                 ::Nabla::Activation::Descriptor activation = ::Nabla::Activation::Identity,
                                 ::Nabla::Initialization::Descriptor initialization = ::Nabla::Initialization::Default) -> FCDescriptor {
        return {options, activation, initialization};
    }

    [[nodiscard]] inline auto Conv2d(const Conv2dOptions& options,
                                     ::Nabla::Activation::Descriptor activation = ::Nabla::Activation::Identity,
                                     ::Nabla::Initialization::Descriptor initialization = ::Nabla::Initialization::Default) -> Conv2dDescriptor {
        return {options, activation, initialization};
    }

    [[nodiscard]] inline auto Flatten(const FlattenOptions& options = {}) -> FlattenDescriptor {
        return {options};
    }

    [[nodiscard]] inline auto Dropout(const DropoutOptions& options = {}) -> DropoutDescriptor {
        return {options};
    }
}

#endif //NABLA_LAYER_HPP
