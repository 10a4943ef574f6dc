#ifndef GRADUS_LOSS_HELPER_HPP
#define GRADUS_LOSS_HELPER_HPP
#include <optional>
#include <vector>

#include <torch/torch.h>

#include "reduction.hpp"

namespace Gradus::Loss::Details {
    inline torch::Tensor apply_reduction_weighted(torch::Tensor loss, const torch::Tensor& weight, Reduction reduction) {
        auto w = weight.to(loss.options()).expand_as(loss);

        switch (reduction) {
            case Reduction::None:
                return loss * w;
            case Reduction::Sum:
                return (loss * w).sum();
            case Reduction::Mean:
            default: {
                auto num = (loss * w).sum();
                auto den = w.sum().clamp_min(1e-12);
                return num / den;
            }
        }
    }

    // Descriptor weights take precedence over a per-call weight tensor.
    inline std::optional<torch::Tensor> resolve_weight(const std::vector<double>& configured,
                                                       const std::optional<torch::Tensor>& provided,
                                                       const torch::Tensor& prediction) {
        if (!configured.empty()) {
            return torch::tensor(configured,
                                 torch::TensorOptions().dtype(prediction.scalar_type()).device(prediction.device()));
        }
        if (provided.has_value() && provided->defined()) {
            return provided->to(prediction.device(), prediction.scalar_type());
        }
        return std::nullopt;
    }
}
#endif //GRADUS_LOSS_HELPER_HPP
