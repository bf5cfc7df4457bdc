#ifndef NABLA_METRIC_HPP
#define NABLA_METRIC_HPP
// This file is an factory, must exempt it from any logical-code. For functions look into "/apply.hpp"
namespace Nabla::Metric {
    enum class Kind {
        Accuracy,
        MeanSquaredError,
        MeanAbsoluteError,
    };

    struct Descriptor {
        Kind kind;
    };

    inline constexpr Descriptor Accuracy{Kind::Accuracy};
    inline constexpr Descriptor MeanSquaredError{Kind::MeanSquaredError};
    inline constexpr Descriptor MeanAbsoluteError{Kind::MeanAbsoluteError};
}

#endif //NABLA_METRIC_HPP
