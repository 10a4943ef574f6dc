#ifndef GRADUS_EVALUATION_HPP
#define GRADUS_EVALUATION_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "details/classification.hpp"

namespace Gradus::Evaluation {
    using ClassificationOptions = Details::Classification::Options;
    using ClassificationDescriptor = Details::Classification::Descriptor;
    inline constexpr ClassificationDescriptor Classification{};

    using ClassificationReport = Details::Classification::Report;
    using Options = ClassificationOptions;

    template <class Model>
    [[nodiscard]] inline auto Evaluate(Model& model,
                                       torch::Tensor inputs,
                                       torch::Tensor targets,
                                       ClassificationDescriptor,
                                       std::vector<Metric::Classification::Descriptor> metrics,
                                       const ClassificationOptions& options = ClassificationOptions{}) -> ClassificationReport {
        return Details::Classification::Evaluate(model, std::move(inputs), std::move(targets), metrics, options);
    }

    [[nodiscard]] inline auto Evaluate(const torch::Tensor& logits,
                                       const torch::Tensor& targets,
                                       ClassificationDescriptor,
                                       std::vector<Metric::Classification::Descriptor> metrics,
                                       const ClassificationOptions& options = ClassificationOptions{}) -> ClassificationReport {
        return Details::Classification::FromLogits(logits, targets, metrics, options);
    }
}

#endif //GRADUS_EVALUATION_HPP
