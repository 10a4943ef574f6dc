#ifndef GRADUS_OPTIMIZER_REGISTRY_HPP
#define GRADUS_OPTIMIZER_REGISTRY_HPP

#include <memory>
#include <vector>

#include <torch/torch.h>

#include "details/adam.hpp"
#include "details/sgd.hpp"

namespace Gradus::Optimizer::Details {
    template <class Descriptor>
    std::unique_ptr<torch::optim::Optimizer> build_optimizer(std::vector<torch::Tensor>, const Descriptor&) {
        static_assert(sizeof(Descriptor) == 0, "Unsupported optimizer descriptor provided to build_optimizer.");
        return nullptr;
    }

    inline std::unique_ptr<torch::optim::Optimizer> build_optimizer(std::vector<torch::Tensor> parameters, const SGDDescriptor& descriptor) {
        auto options = to_torch_options(descriptor.options);
        return std::make_unique<torch::optim::SGD>(std::move(parameters), options);
    }

    inline std::unique_ptr<torch::optim::Optimizer> build_optimizer(std::vector<torch::Tensor> parameters, const AdamDescriptor& descriptor) {
        auto options = to_torch_options(descriptor.options);
        return std::make_unique<torch::optim::Adam>(std::move(parameters), options);
    }
}

#endif // GRADUS_OPTIMIZER_REGISTRY_HPP
