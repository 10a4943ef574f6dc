#ifndef GRADUS_INITIALIZATION_HPP
#define GRADUS_INITIALIZATION_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "apply.hpp"

namespace Gradus::Initialization {
    enum class Type {
        Default,
        XavierNormal,
        XavierUniform,
        HeNormal,
        HeUniform,
        SmallNormal, // N(0, 0.01) weights, zero bias
        ZeroBias,
    };

    struct Descriptor {
        Type type{Type::Default};
    };

    inline constexpr Descriptor Default{Type::Default};
    inline constexpr Descriptor XavierNormal{Type::XavierNormal};
    inline constexpr Descriptor XavierUniform{Type::XavierUniform};
    inline constexpr Descriptor HeNormal{Type::HeNormal};
    inline constexpr Descriptor HeUniform{Type::HeUniform};
    inline constexpr Descriptor SmallNormal{Type::SmallNormal};
    inline constexpr Descriptor ZeroBias{Type::ZeroBias};
}

#endif //GRADUS_INITIALIZATION_HPP
