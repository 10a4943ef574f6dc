#ifndef GRADUS_ADAM_HPP
#define GRADUS_ADAM_HPP

#include <stdexcept>
#include <tuple>

#include <torch/torch.h>

namespace Gradus::Optimizer::Details {

    struct AdamOptions {
        double learning_rate{1e-3};
        double beta1{0.9};
        double beta2{0.999};
        double eps{1e-8};
        double weight_decay{0.0};
        bool amsgrad{false};
    };

    struct AdamDescriptor {
        AdamOptions options{};
    };

    inline torch::optim::AdamOptions to_torch_options(const AdamOptions& options) {
        if (options.learning_rate <= 0.0) {
            throw std::invalid_argument("Adam learning rate must be positive.");
        }
        if (options.beta1 < 0.0 || options.beta1 >= 1.0 || options.beta2 < 0.0 || options.beta2 >= 1.0) {
            throw std::invalid_argument("Adam betas must lie in [0, 1).");
        }

        torch::optim::AdamOptions torch_options(options.learning_rate);
        torch_options = torch_options.betas(std::make_tuple(options.beta1, options.beta2));
        torch_options = torch_options.eps(options.eps);
        torch_options = torch_options.weight_decay(options.weight_decay);
        torch_options = torch_options.amsgrad(options.amsgrad);
        return torch_options;
    }

}

#endif // GRADUS_ADAM_HPP
