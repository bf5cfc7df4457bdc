#ifndef NABLA_COMMON_ERROR_HPP
#define NABLA_COMMON_ERROR_HPP

#include <stdexcept>

namespace Nabla {
    // Misuse of the model API: wrong layer ordering, missing compile(), conflicting fit options.
    class ConfigurationError : public std::logic_error {
    public:
        using std::logic_error::logic_error;
    };

    // A layer (or optimizer slot) used before it was initialized.
    class StateError : public std::logic_error {
    public:
        using std::logic_error::logic_error;
    };

    class ShapeError : public std::invalid_argument {
    public:
        using std::invalid_argument::invalid_argument;
    };
}

#endif // NABLA_COMMON_ERROR_HPP
