#ifndef FATHOM_INITIALIZATION_HPP
#define FATHOM_INITIALIZATION_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "apply.hpp"

namespace Fathom::Initialization {
    enum class Type {
        Default,
        XavierNormal,
        XavierUniform,
        HeNormal,
        HeUniform,
        ZeroBias,
    };

    // gain scales the drawn weights; Default and ZeroBias leave the weights untouched.
    struct Descriptor {
        Type type{Type::Default};
        double gain{1.0};
    };

    inline constexpr Descriptor Default{Type::Default};
    inline constexpr Descriptor XavierNormal{Type::XavierNormal};
    inline constexpr Descriptor XavierUniform{Type::XavierUniform};
    inline constexpr Descriptor HeNormal{Type::HeNormal};
    inline constexpr Descriptor HeUniform{Type::HeUniform};
    inline constexpr Descriptor ZeroBias{Type::ZeroBias};

    [[nodiscard]] constexpr auto Scaled(Descriptor descriptor, double gain) noexcept -> Descriptor {
        descriptor.gain = gain;
        return descriptor;
    }
}

#endif //FATHOM_INITIALIZATION_HPP
