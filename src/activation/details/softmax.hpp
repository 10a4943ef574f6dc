#ifndef GRADUS_SOFTMAX_HPP
#define GRADUS_SOFTMAX_HPP

#include <torch/torch.h>

#include <utility>

#include "../activation.hpp"

namespace Gradus::Activation::Details {
    // Both normalise over the last axis, i.e. the class axis of [batch, classes] logits.
    struct Softmax {
        [[nodiscard]] torch::Tensor operator()(torch::Tensor input) const {
            if (input.dim() == 0) {
                return input;
            }
            const auto dim = input.dim() - 1;
            return torch::softmax(std::move(input), dim);
        }
    };

    struct LogSoftmax {
        [[nodiscard]] torch::Tensor operator()(torch::Tensor input) const {
            if (input.dim() == 0) {
                return input;
            }
            const auto dim = input.dim() - 1;
            return torch::log_softmax(std::move(input), dim);
        }
    };
}

#endif //GRADUS_SOFTMAX_HPP
