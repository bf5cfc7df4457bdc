#ifndef NABLA_INITIALIZATION_HPP
#define NABLA_INITIALIZATION_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"

namespace Nabla::Initialization {
    enum class Type {
        Default,
        XavierNormal,
        XavierUniform,
        HeNormal,
        HeUniform,
        Zeros,
    };

    struct Descriptor {
        Type type{Type::Default};
    };

    inline constexpr Descriptor Default{Type::Default};
    inline constexpr Descriptor XavierNormal{Type::XavierNormal};
    inline constexpr Descriptor XavierUniform{Type::XavierUniform};
    inline constexpr Descriptor HeNormal{Type::HeNormal};
    inline constexpr Descriptor HeUniform{Type::HeUniform};
    inline constexpr Descriptor Zeros{Type::Zeros};
}

#endif //NABLA_INITIALIZATION_HPP
