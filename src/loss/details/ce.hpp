#ifndef GRADUS_CE_HPP
#define GRADUS_CE_HPP
#include <optional>
#include <vector>

#include <torch/torch.h>

#include "helper.hpp"
#include "reduction.hpp"

namespace Gradus::Loss::Details {
    // Expects raw logits [B, C] and class indices [B]; log-softmax is applied internally.
    struct CrossEntropyOptions {
        Reduction reduction{Reduction::Mean};
        std::vector<double> weight{};
        double label_smoothing{0.0};
    };

    struct CrossEntropyDescriptor {
        CrossEntropyOptions options{};
    };

    inline torch::Tensor compute(const CrossEntropyDescriptor& descriptor,
                                 const torch::Tensor& prediction,
                                 const torch::Tensor& target,
                                 const std::optional<torch::Tensor>& weight = std::nullopt) {
        auto opts = torch::nn::functional::CrossEntropyFuncOptions{};
        opts = opts.reduction(to_torch_reduction<torch::nn::functional::CrossEntropyFuncOptions>(descriptor.options.reduction));
        opts = opts.label_smoothing(descriptor.options.label_smoothing);
        if (auto resolved = resolve_weight(descriptor.options.weight, weight, prediction)) {
            opts = opts.weight(*resolved);
        }
        return torch::nn::functional::cross_entropy(prediction, target, opts);
    }
}
#endif //GRADUS_CE_HPP
