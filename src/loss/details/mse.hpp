#ifndef GRADUS_MSE_HPP
#define GRADUS_MSE_HPP

#include <optional>
#include <vector>

#include <torch/torch.h>

#include "helper.hpp"
#include "reduction.hpp"

namespace Gradus::Loss::Details {

    namespace F = torch::nn::functional;

    struct MSEOptions {
        Reduction reduction{Reduction::Mean};
        std::vector<double> weight{};
    };

    struct MSEDescriptor {
        MSEOptions options{};
    };

    // Integer class targets are one-hot encoded against the prediction width.
    inline torch::Tensor compute(const MSEDescriptor& descriptor,
                                 const torch::Tensor& prediction,
                                 const torch::Tensor& target,
                                 const std::optional<torch::Tensor>& weight = std::nullopt)
    {
        auto dense_target = target;
        if (!target.is_floating_point() && prediction.dim() == 2 && target.dim() == 1) {
            dense_target = F::one_hot(target.to(torch::kLong), prediction.size(1)).to(prediction.scalar_type());
        }

        auto weight_tensor = resolve_weight(descriptor.options.weight, weight, prediction);
        if (!weight_tensor) {
            return F::mse_loss(
                prediction,
                dense_target,
                F::MSELossFuncOptions().reduction(to_torch_reduction<F::MSELossFuncOptions>(descriptor.options.reduction)));
        }

        auto per_elem = F::mse_loss(prediction, dense_target, F::MSELossFuncOptions().reduction(torch::kNone));
        if (weight_tensor->numel() == per_elem.numel()) {
            *weight_tensor = weight_tensor->reshape(per_elem.sizes());
        }
        return apply_reduction_weighted(per_elem, *weight_tensor, descriptor.options.reduction);
    }
}

#endif // GRADUS_MSE_HPP
