#ifndef NABLA_ACTIVATION_HPP
#define NABLA_ACTIVATION_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"

namespace Nabla::Activation {
    enum class Type {
        Identity,
        ReLU,
        LeakyReLU,
        Sigmoid,
        Tanh,
        Softmax,
    };

    struct Descriptor {
        Type type{Type::Identity};
    };

    inline constexpr Descriptor Identity{Type::Identity};
    inline constexpr Descriptor ReLU{Type::ReLU};
    inline constexpr Descriptor LeakyReLU{Type::LeakyReLU};
    inline constexpr Descriptor Sigmoid{Type::Sigmoid};
    inline constexpr Descriptor Tanh{Type::Tanh};
    inline constexpr Descriptor Softmax{Type::Softmax};
}

#endif //NABLA_ACTIVATION_HPP
