#ifndef NABLA_OPTIMIZER_HPP
#define NABLA_OPTIMIZER_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include <variant>

#include "registry.hpp"

#include "details/adagrad.hpp"
#include "details/adam.hpp"
#include "details/rmsprop.hpp"
#include "details/sgd.hpp"


namespace Nabla::Optimizer {
    using SGDOptions = Details::SGDOptions;
    using SGDDescriptor = Details::SGDDescriptor;

    using RMSpropOptions = Details::RMSpropOptions;
    using RMSpropDescriptor = Details::RMSpropDescriptor;

    using AdagradOptions = Details::AdagradOptions;
    using AdagradDescriptor = Details::AdagradDescriptor;

    using AdamOptions = Details::AdamOptions;
    using AdamDescriptor = Details::AdamDescriptor;

    using AdamWOptions = Details::AdamWOptions;
    using AdamWDescriptor = Details::AdamWDescriptor;

    using Binding = Details::Binding;

    using Descriptor = std::variant<SGDDescriptor,
                                    RMSpropDescriptor,
                                    AdamDescriptor,
                                    AdamWDescriptor,
                                    AdagradDescriptor>;


    [[nodiscard]] inline constexpr auto SGD(const SGDOptions& options = {}) noexcept -> SGDDescriptor {
        return SGDDescriptor{.options = options};
    }

    [[nodiscard]] constexpr auto RMSprop(const RMSpropOptions& options = {}) noexcept -> RMSpropDescriptor {
        return RMSpropDescriptor{.options = options};
    }

    [[nodiscard]] constexpr auto Adagrad(const AdagradOptions& options = {}) noexcept -> AdagradDescriptor {
        return AdagradDescriptor{.options = options};
    }

    [[nodiscard]] inline constexpr auto AdamW(const AdamWOptions& options = {}) noexcept -> AdamWDescriptor {
        return AdamWDescriptor{.options = options};
    }

    [[nodiscard]] constexpr auto Adam(const AdamOptions& options = {}) noexcept -> AdamDescriptor {
        return AdamDescriptor{.options = options};
    }

}

#endif //NABLA_OPTIMIZER_HPP
