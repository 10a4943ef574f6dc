#ifndef GRADUS_DROPOUT_HPP
#define GRADUS_DROPOUT_HPP
#include <stdexcept>
#include <string>
#include <utility>

#include <torch/torch.h>

#include "../../activation/activation.hpp"
#include "../registry.hpp"

namespace Gradus::Layer::Details {

    struct DropoutOptions {
        double probability{0.5};
    };

    struct DropoutDescriptor {
        DropoutOptions options{};
        ::Gradus::Activation::Descriptor activation{::Gradus::Activation::Identity};
    };

    // Inverted dropout; a no-op once the model is switched to eval().
    [[nodiscard]] inline std::string kind_of(const DropoutDescriptor&) { return "dropout"; }

    template <class Owner>
    RegisteredLayer build_registered_layer(Owner& owner, const DropoutDescriptor& descriptor, std::size_t index)
    {
        if (descriptor.options.probability < 0.0 || descriptor.options.probability >= 1.0) {
            throw std::invalid_argument("Dropout probability must be in the range [0, 1).");
        }
        auto module = owner.register_module(
            kind_of(descriptor) + "_" + std::to_string(index),
            torch::nn::Dropout(torch::nn::DropoutOptions(descriptor.options.probability)));

        RegisteredLayer registered_layer{};
        registered_layer.activation = descriptor.activation.type;
        registered_layer.module = to_shared_module_ptr(module);
        registered_layer.kind = kind_of(descriptor);
        registered_layer.bind_module_forward(module.get());
        return registered_layer;
    }
}

#endif //GRADUS_DROPOUT_HPP
