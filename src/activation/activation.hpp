#ifndef FATHOM_ACTIVATION_HPP
#define FATHOM_ACTIVATION_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "apply.hpp"

namespace Fathom::Activation {
    enum class Type {
        Identity,
        ReLU,
        LeakyReLU,
        ELU,
        Tanh,
        Sigmoid,
        SiLU,
        GeLU,
        Softplus,
    };

    struct Descriptor {
        Type type{Type::ReLU};
    };

    inline constexpr Descriptor Identity{Type::Identity};
    inline constexpr Descriptor ReLU{Type::ReLU};
    inline constexpr Descriptor LeakyReLU{Type::LeakyReLU};
    inline constexpr Descriptor ELU{Type::ELU};
    inline constexpr Descriptor Tanh{Type::Tanh};
    inline constexpr Descriptor Sigmoid{Type::Sigmoid};
    inline constexpr Descriptor SiLU{Type::SiLU};
    inline constexpr Descriptor GeLU{Type::GeLU};
    inline constexpr Descriptor Softplus{Type::Softplus};
}

#endif //FATHOM_ACTIVATION_HPP
