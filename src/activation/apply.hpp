#ifndef GRADUS_ACTIVATION_APPLY_HPP
#define GRADUS_ACTIVATION_APPLY_HPP

#include <torch/torch.h>

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "activation.hpp"
#include "details/pointwise.hpp"
#include "details/softmax.hpp"

namespace Gradus::Activation::Details {
    inline torch::Tensor apply(::Gradus::Activation::Type type, torch::Tensor input) {
        switch (type) {
            case ::Gradus::Activation::Type::ReLU:
                return ReLU{}(std::move(input));
            case ::Gradus::Activation::Type::Sigmoid:
                return Sigmoid{}(std::move(input));
            case ::Gradus::Activation::Type::Tanh:
                return Tanh{}(std::move(input));
            case ::Gradus::Activation::Type::LeakyReLU:
                return LeakyReLU{}(std::move(input));
            case ::Gradus::Activation::Type::Softmax:
                return Softmax{}(std::move(input));
            case ::Gradus::Activation::Type::LogSoftmax:
                return LogSoftmax{}(std::move(input));
            case ::Gradus::Activation::Type::Identity:
            default:
                return input;
        }
    }

    inline std::string_view to_string(::Gradus::Activation::Type type) {
        switch (type) {
            case ::Gradus::Activation::Type::ReLU: return "relu";
            case ::Gradus::Activation::Type::Sigmoid: return "sigmoid";
            case ::Gradus::Activation::Type::Tanh: return "tanh";
            case ::Gradus::Activation::Type::LeakyReLU: return "leaky_relu";
            case ::Gradus::Activation::Type::Softmax: return "softmax";
            case ::Gradus::Activation::Type::LogSoftmax: return "log_softmax";
            case ::Gradus::Activation::Type::Identity: return "identity";
        }
        return "identity";
    }

    inline ::Gradus::Activation::Type from_string(std::string_view name) {
        using Type = ::Gradus::Activation::Type;
        for (auto type : {Type::Identity, Type::ReLU, Type::Sigmoid, Type::Tanh,
                          Type::LeakyReLU, Type::Softmax, Type::LogSoftmax}) {
            if (to_string(type) == name) {
                return type;
            }
        }
        throw std::invalid_argument("Unknown activation '" + std::string(name) + "'.");
    }
}
#endif // GRADUS_ACTIVATION_APPLY_HPP
