#ifndef GRADUS_LAYER_HPP
#define GRADUS_LAYER_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include <variant>

#include "details/dropout.hpp"
#include "details/fc.hpp"
#include "details/flatten.hpp"

#include "registry.hpp"

namespace Gradus::Layer {
    using FCOptions = Details::FCOptions;
    using FCDescriptor = Details::FCDescriptor;

    using FlattenOptions = Details::FlattenOptions;
    using FlattenDescriptor = Details::FlattenDescriptor;

    using DropoutOptions = Details::DropoutOptions;
    using DropoutDescriptor = Details::DropoutDescriptor;

    using Descriptor = std::variant<FCDescriptor,
                                    FlattenDescriptor,
                                    DropoutDescriptor>;

    [[nodiscard]] inline auto FC(const FCOptions& options,
                                 ::Gradus::Activation::Descriptor activation = ::Gradus::Activation::Identity,
                                 ::Gradus::Initialization::Descriptor initialization = ::Gradus::Initialization::Default) -> FCDescriptor {
        return {options, activation, initialization};
    }

    [[nodiscard]] inline auto Flatten(const FlattenOptions& options = {},
                                      ::Gradus::Activation::Descriptor activation = ::Gradus::Activation::Identity) -> FlattenDescriptor {
        return {options, activation};
    }

    [[nodiscard]] inline auto Dropout(const DropoutOptions& options = {},
                                      ::Gradus::Activation::Descriptor activation = ::Gradus::Activation::Identity) -> DropoutDescriptor {
        return {options, activation};
    }
}

#endif //GRADUS_LAYER_HPP
