#ifndef GRADUS_INITIALIZATION_APPLY_HPP
#define GRADUS_INITIALIZATION_APPLY_HPP
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

#include <torch/torch.h>

#include "initialization.hpp"

namespace Gradus::Initialization::Details {
    inline constexpr double kSmallNormalStd = 0.01;

    namespace detail {
        template <class Module>
        inline void zero_bias_if_present(const Module& module) {
            if constexpr (requires { module->bias; }) {
                if (module->bias.defined()) {
                    torch::nn::init::zeros_(module->bias);
                }
            }
        }
    }  // namespace detail

    template <class Module, class Descriptor>
    inline void apply_module_initialization(const Module& module, const Descriptor& descriptor) {
        torch::NoGradGuard no_grad{};
        switch (descriptor.initialization.type) {
            case ::Gradus::Initialization::Type::XavierNormal:
                torch::nn::init::xavier_normal_(module->weight);
                detail::zero_bias_if_present(module);
                break;
            case ::Gradus::Initialization::Type::XavierUniform:
                torch::nn::init::xavier_uniform_(module->weight);
                detail::zero_bias_if_present(module);
                break;
            case ::Gradus::Initialization::Type::HeNormal:
                torch::nn::init::kaiming_normal_(module->weight, /*a=*/0.0, torch::kFanIn, torch::kReLU);
                detail::zero_bias_if_present(module);
                break;
            case ::Gradus::Initialization::Type::HeUniform:
                torch::nn::init::kaiming_uniform_(module->weight, /*a=*/0.0, torch::kFanIn, torch::kReLU);
                detail::zero_bias_if_present(module);
                break;
            case ::Gradus::Initialization::Type::SmallNormal:
                torch::nn::init::normal_(module->weight, /*mean=*/0.0, kSmallNormalStd);
                detail::zero_bias_if_present(module);
                break;
            case ::Gradus::Initialization::Type::ZeroBias:
                detail::zero_bias_if_present(module);
                break;
            case ::Gradus::Initialization::Type::Default:
            default:
                break;
        }
    }

    // Re-draws an already registered linear layer in place.
    inline void reinitialize(const std::shared_ptr<torch::nn::Module>& module, ::Gradus::Initialization::Descriptor initialization) {
        auto linear = std::dynamic_pointer_cast<torch::nn::LinearImpl>(module);
        if (!linear) {
            throw std::invalid_argument("Only fully connected layers can be re-initialised.");
        }
        struct Request {
            ::Gradus::Initialization::Descriptor initialization;
        };
        apply_module_initialization(linear, Request{initialization});
    }

    inline std::string_view to_string(::Gradus::Initialization::Type type) {
        switch (type) {
            case ::Gradus::Initialization::Type::XavierNormal: return "xavier_normal";
            case ::Gradus::Initialization::Type::XavierUniform: return "xavier_uniform";
            case ::Gradus::Initialization::Type::HeNormal: return "he_normal";
            case ::Gradus::Initialization::Type::HeUniform: return "he_uniform";
            case ::Gradus::Initialization::Type::SmallNormal: return "small_normal";
            case ::Gradus::Initialization::Type::ZeroBias: return "zero_bias";
            case ::Gradus::Initialization::Type::Default: return "default";
        }
        return "default";
    }

    inline ::Gradus::Initialization::Type from_string(std::string_view name) {
        using Type = ::Gradus::Initialization::Type;
        for (auto type : {Type::Default, Type::XavierNormal, Type::XavierUniform, Type::HeNormal,
                          Type::HeUniform, Type::SmallNormal, Type::ZeroBias}) {
            if (to_string(type) == name) {
                return type;
            }
        }
        throw std::invalid_argument("Unknown initialization '" + std::string(name) + "'.");
    }
}
#endif // GRADUS_INITIALIZATION_APPLY_HPP
