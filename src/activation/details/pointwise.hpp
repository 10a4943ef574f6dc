#ifndef GRADUS_ACTIVATION_POINTWISE_HPP
#define GRADUS_ACTIVATION_POINTWISE_HPP

#include <torch/torch.h>

#include <utility>

#include "../activation.hpp"

namespace Gradus::Activation::Details {
    struct ReLU {
        [[nodiscard]] torch::Tensor operator()(torch::Tensor input) const {
            return torch::relu(std::move(input));
        }
    };

    struct LeakyReLU {
        double negative_slope{0.01};

        [[nodiscard]] torch::Tensor operator()(torch::Tensor input) const {
            return torch::leaky_relu(std::move(input), negative_slope);
        }
    };

    struct Sigmoid {
        [[nodiscard]] torch::Tensor operator()(torch::Tensor input) const {
            return torch::sigmoid(std::move(input));
        }
    };

    struct Tanh {
        [[nodiscard]] torch::Tensor operator()(torch::Tensor input) const {
            return torch::tanh(std::move(input));
        }
    };
}

#endif //GRADUS_ACTIVATION_POINTWISE_HPP
