#ifndef GRADUS_UTILS_MODE_GUARD_HPP
#define GRADUS_UTILS_MODE_GUARD_HPP

#include <torch/torch.h>

namespace Gradus::Utils {
    // Switches a module to eval mode and restores its previous mode on scope exit, also when unwinding.
    class EvalModeGuard {
    public:
        explicit EvalModeGuard(torch::nn::Module& module) : module_(module), was_training_(module.is_training()) {
            module_.train(false);
        }

        ~EvalModeGuard() { module_.train(was_training_); }

        EvalModeGuard(const EvalModeGuard&) = delete;
        EvalModeGuard& operator=(const EvalModeGuard&) = delete;

    private:
        torch::nn::Module& module_;
        bool was_training_;
    };
}

#endif //GRADUS_UTILS_MODE_GUARD_HPP
