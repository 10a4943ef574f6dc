#ifndef GRADUS_LAYER_REGISTRY_HPP
#define GRADUS_LAYER_REGISTRY_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

#include <torch/torch.h>

#include "../activation/activation.hpp"

namespace Gradus::Layer::Details {
    template <class Impl>
    [[nodiscard]] inline std::shared_ptr<torch::nn::Module>
    to_shared_module_ptr(const torch::nn::ModuleHolder<Impl>& holder)
    {
        static_assert(std::is_base_of_v<torch::nn::Module, Impl>, "ModuleHolder implementation must derive from torch::nn::Module.");
        return std::static_pointer_cast<torch::nn::Module>(holder.ptr());
    }

    struct RegisteredLayer {
        struct ForwardBinding {
            using Invoker = torch::Tensor (*)(void*, torch::Tensor);

            Invoker invoke{nullptr};
            void* context{nullptr};

            [[nodiscard]] explicit operator bool() const noexcept { return invoke != nullptr; }

            torch::Tensor operator()(torch::Tensor input) const
            {
                if (!invoke) {
                    throw std::logic_error("Attempted to invoke an empty forward binding.");
                }
                return invoke(context, std::move(input));
            }
        };

        // The context pointer stays valid because `module` keeps the implementation alive.
        template <class Module>
        void bind_module_forward(Module* module)
        {
            forward = ForwardBinding{&dispatch_module<Module>, module};
        }

        [[nodiscard]] std::int64_t parameter_count() const
        {
            if (!module) {
                return 0;
            }
            std::int64_t total = 0;
            for (const auto& parameter : module->parameters(/*recurse=*/true)) {
                total += parameter.numel();
            }
            return total;
        }

        ForwardBinding forward{};
        ::Gradus::Activation::Type activation{::Gradus::Activation::Type::Identity};
        std::shared_ptr<torch::nn::Module> module{};
        std::string kind{};
        std::string name{};

    private:
        template <class Module>
        static torch::Tensor dispatch_module(void* context, torch::Tensor input)
        {
            auto* module = static_cast<Module*>(context);
            return module->forward(std::move(input));
        }
    };

    // Each layer kind provides an overload next to its descriptor.
    template <class Owner, class Descriptor>
    RegisteredLayer build_registered_layer(Owner&, const Descriptor&, std::size_t) {
        static_assert(sizeof(Descriptor) == 0, "No layer builder for this descriptor.");
        return {};
    }
}
#endif // GRADUS_LAYER_REGISTRY_HPP
