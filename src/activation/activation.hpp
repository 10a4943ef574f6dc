#ifndef GRADUS_ACTIVATION_HPP
#define GRADUS_ACTIVATION_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"

namespace Gradus::Activation {
    enum class Type {
        Identity,
        ReLU,
        Sigmoid,
        Tanh,
        LeakyReLU,
        Softmax,
        LogSoftmax,
    };

    struct Descriptor {
        Type type{Type::Identity};
    };

    inline constexpr Descriptor Identity{Type::Identity};
    inline constexpr Descriptor ReLU{Type::ReLU};
    inline constexpr Descriptor Sigmoid{Type::Sigmoid};
    inline constexpr Descriptor Tanh{Type::Tanh};
    inline constexpr Descriptor LeakyReLU{Type::LeakyReLU};
    inline constexpr Descriptor Softmax{Type::Softmax};
    inline constexpr Descriptor LogSoftmax{Type::LogSoftmax}; // pairs with Loss::NegativeLogLikelihood
}

#endif //GRADUS_ACTIVATION_HPP
