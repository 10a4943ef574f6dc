#ifndef GRADUS_LOSS_HPP
#define GRADUS_LOSS_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include <variant>

#include "details/reduction.hpp"
#include "details/ce.hpp"
#include "details/mse.hpp"
#include "details/nll.hpp"

namespace Gradus::Loss {
    using Reduction = Details::Reduction;

    using CrossEntropyOptions = Details::CrossEntropyOptions;
    using NegativeLogLikelihoodOptions = Details::NegativeLogLikelihoodOptions;
    using MSEOptions = Details::MSEOptions;

    using Descriptor = std::variant<
        Details::CrossEntropyDescriptor,
        Details::NegativeLogLikelihoodDescriptor,
        Details::MSEDescriptor>;

    [[nodiscard]] inline auto CrossEntropy(const CrossEntropyOptions& options = {}) -> Details::CrossEntropyDescriptor {
        return {options};
    }

    [[nodiscard]] inline auto NegativeLogLikelihood(const NegativeLogLikelihoodOptions& options = {}) -> Details::NegativeLogLikelihoodDescriptor {
        return {options};
    }

    [[nodiscard]] inline auto MSE(const MSEOptions& options = {}) -> Details::MSEDescriptor {
        return {options};
    }
}

#endif //GRADUS_LOSS_HPP
