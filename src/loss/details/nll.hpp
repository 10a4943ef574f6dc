#ifndef GRADUS_NLL_HPP
#define GRADUS_NLL_HPP

#include <cstdint>
#include <optional>
#include <vector>

#include <torch/torch.h>

#include "helper.hpp"
#include "reduction.hpp"

namespace Gradus::Loss::Details {
    // Expects log-probabilities, e.g. the output of an FC layer with Activation::LogSoftmax.
    struct NegativeLogLikelihoodOptions {
        Reduction reduction{Reduction::Mean};
        std::vector<double> weight{};
        std::optional<std::int64_t> ignore_index{};
    };

    struct NegativeLogLikelihoodDescriptor {
        NegativeLogLikelihoodOptions options{};
    };

    inline torch::Tensor compute(const NegativeLogLikelihoodDescriptor& descriptor,
                                 const torch::Tensor& prediction,
                                 const torch::Tensor& target,
                                 const std::optional<torch::Tensor>& weight = std::nullopt)
    {
        auto opts = torch::nn::functional::NLLLossFuncOptions{};
        opts = opts.reduction(to_torch_reduction<torch::nn::functional::NLLLossFuncOptions>(descriptor.options.reduction));
        if (auto resolved = resolve_weight(descriptor.options.weight, weight, prediction)) {
            opts = opts.weight(*resolved);
        }
        if (descriptor.options.ignore_index.has_value()) {
            opts = opts.ignore_index(descriptor.options.ignore_index.value());
        }
        return torch::nn::functional::nll_loss(prediction, target, opts);
    }

}

#endif // GRADUS_NLL_HPP
