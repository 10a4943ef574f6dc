#ifndef GRADUS_FLATTEN_HPP
#define GRADUS_FLATTEN_HPP
#include <cstdint>
#include <string>
#include <utility>

#include <torch/nn/modules/linear.h>
#include <torch/nn/options/linear.h>
#include "../../activation/activation.hpp"
#include "../registry.hpp"

namespace Gradus::Layer::Details {

    // [B, 1, 28, 28] -> [B, 784] with the defaults.
    struct FlattenOptions {
        std::int64_t start_dim{1};
        std::int64_t end_dim{-1};
    };

    struct FlattenDescriptor {
        FlattenOptions options{};
        ::Gradus::Activation::Descriptor activation{::Gradus::Activation::Identity};
    };

    [[nodiscard]] inline std::string kind_of(const FlattenDescriptor&) { return "flatten"; }

    template <class Owner>
    RegisteredLayer build_registered_layer(Owner& owner, const FlattenDescriptor& descriptor, std::size_t index)
    {
        const auto torch_options = torch::nn::FlattenOptions()
                                       .start_dim(descriptor.options.start_dim)
                                       .end_dim(descriptor.options.end_dim);
        auto module = owner.register_module(kind_of(descriptor) + "_" + std::to_string(index), torch::nn::Flatten(torch_options));

        RegisteredLayer registered_layer{};
        registered_layer.activation = descriptor.activation.type;
        registered_layer.module = to_shared_module_ptr(module);
        registered_layer.kind = kind_of(descriptor);
        registered_layer.bind_module_forward(module.get());
        return registered_layer;
    }

}

#endif //GRADUS_FLATTEN_HPP
