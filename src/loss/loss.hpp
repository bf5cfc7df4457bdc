#ifndef NABLA_LOSS_HPP
#define NABLA_LOSS_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include <variant>

#include "details/bce.hpp"
#include "details/cce.hpp"
#include "details/mae.hpp"
#include "details/mse.hpp"
#include "details/reduction.hpp"

namespace Nabla::Loss {
    using Reduction = Details::Reduction;

    using MSEOptions = Details::MSEOptions;
    using MAEOptions = Details::MAEOptions;
    using BinaryCrossEntropyOptions = Details::BinaryCrossEntropyOptions;
    using CategoricalCrossEntropyOptions = Details::CategoricalCrossEntropyOptions;

    using Descriptor = std::variant<
        Details::MSEDescriptor,
        Details::MAEDescriptor,
        Details::BinaryCrossEntropyDescriptor,
        Details::CategoricalCrossEntropyDescriptor>;


    [[nodiscard]] constexpr auto MSE(const Details::MSEOptions& options = {}) noexcept -> Details::MSEDescriptor {
        return {options};
    }

    [[nodiscard]] constexpr auto MAE(const Details::MAEOptions& options = {}) noexcept -> Details::MAEDescriptor {
        return {options};
    }

    [[nodiscard]] constexpr auto BinaryCrossEntropy(const Details::BinaryCrossEntropyOptions& options = {}) noexcept -> Details::BinaryCrossEntropyDescriptor {
        return {options};
    }

    [[nodiscard]] constexpr auto CategoricalCrossEntropy(const Details::CategoricalCrossEntropyOptions& options = {}) noexcept -> Details::CategoricalCrossEntropyDescriptor {
        return {options};
    }
}

#endif //NABLA_LOSS_HPP
