#ifndef GRADUS_MANIPULATION_HPP
#define GRADUS_MANIPULATION_HPP
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <optional>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

namespace Gradus::Data::Manipulation {
    namespace Details {
        inline void ensure_paired(const torch::Tensor& inputs, const torch::Tensor& targets, const char* context) {
            if (!inputs.defined() || !targets.defined()) {
                throw std::invalid_argument(std::string(context) + " expects both input and target tensors to be defined.");
            }
            if (inputs.dim() == 0 || targets.dim() == 0) {
                throw std::invalid_argument(std::string(context) + " expects tensors with at least one dimension.");
            }
            if (inputs.size(0) != targets.size(0)) {
                throw std::invalid_argument(std::string(context) + ": inputs and targets must contain the same number of samples.");
            }
        }
    }

    // (x - mean) / std, element-wise. mean 0.5 / std 0.5 maps [0, 1] pixels into [-1, 1].
    [[nodiscard]] inline torch::Tensor Normalize(const torch::Tensor& inputs, double mean, double std) {
        if (!inputs.defined()) {
            throw std::invalid_argument("Normalize expects a defined tensor.");
        }
        if (!(std > 0.0) || !std::isfinite(std)) {
            throw std::invalid_argument("Normalize requires a strictly positive, finite standard deviation.");
        }
        auto values = inputs.is_floating_point() ? inputs : inputs.to(torch::kFloat32);
        return (values - mean) / std;
    }

    // Inverse of Normalize, used to bring inputs back to [0, 1] before display.
    [[nodiscard]] inline torch::Tensor Denormalize(const torch::Tensor& inputs, double mean, double std) {
        if (!(std > 0.0) || !std::isfinite(std)) {
            throw std::invalid_argument("Denormalize requires a strictly positive, finite standard deviation.");
        }
        return inputs * std + mean;
    }

    inline std::pair<torch::Tensor, torch::Tensor> Shuffle(const torch::Tensor& inputs,
                                                           const torch::Tensor& targets,
                                                           const std::optional<std::uint64_t>& seed = std::nullopt) {
        Details::ensure_paired(inputs, targets, "Shuffle");
        if (inputs.size(0) == 0) {
            return {inputs.clone(), targets.clone()};
        }

        if (seed.has_value()) {
            torch::manual_seed(*seed);
        }

        auto permutation = torch::randperm(inputs.size(0), torch::TensorOptions().dtype(torch::kLong));
        auto shuffled_inputs = inputs.index_select(0, permutation.to(inputs.device()));
        auto shuffled_targets = targets.index_select(0, permutation.to(targets.device()));
        return {shuffled_inputs, shuffled_targets};
    }

    // Keeps the leading round(N * fraction) samples; fraction is clamped into [0, 1].
    inline std::pair<torch::Tensor, torch::Tensor> Fraction(const torch::Tensor& inputs, const torch::Tensor& targets, float fraction) {
        Details::ensure_paired(inputs, targets, "Fraction");

        const auto total_samples = inputs.size(0);
        const auto clamped_fraction = std::clamp(fraction, 0.0f, 1.0f);
        auto desired = static_cast<int64_t>(std::round(static_cast<double>(total_samples) * static_cast<double>(clamped_fraction)));
        desired = std::clamp<int64_t>(desired, 0, total_samples);

        if (desired == total_samples) {
            return {inputs.clone(), targets.clone()};
        }
        return {inputs.narrow(0, 0, desired).clone(), targets.narrow(0, 0, desired).clone()};
    }
}

namespace Gradus::Data::Check {
    inline std::vector<int64_t> Size(const torch::Tensor& x, const std::string& title = "Tensor Shape", std::ostream* stream = &std::cout) {
        std::vector<int64_t> sizes(x.sizes().begin(), x.sizes().end());
        if (stream != nullptr) {
            std::ostringstream line;
            line << title << ": (";
            for (std::size_t i = 0; i < sizes.size(); ++i) {
                line << sizes[i];
                if (i + 1 < sizes.size()) line << ", ";
            }
            line << ")";
            *stream << line.str() << std::endl;
        }
        return sizes;
    }

    // Per-class sample count for integer labels in [0, num_classes).
    inline std::vector<int64_t> Distribution(const torch::Tensor& targets, int64_t num_classes) {
        if (num_classes <= 0) {
            throw std::invalid_argument("Distribution requires a positive class count.");
        }
        auto labels = targets.reshape({-1}).to(torch::kCPU).to(torch::kLong);
        if (labels.numel() > 0) {
            const auto low = labels.min().item<int64_t>();
            const auto high = labels.max().item<int64_t>();
            if (low < 0 || high >= num_classes) {
                throw std::out_of_range("Distribution found a label outside [0, " + std::to_string(num_classes) + ").");
            }
        }
        auto counts = torch::bincount(labels, {}, num_classes);
        std::vector<int64_t> result(static_cast<std::size_t>(num_classes), 0);
        auto accessor = counts.accessor<int64_t, 1>();
        for (int64_t c = 0; c < num_classes; ++c) {
            result[static_cast<std::size_t>(c)] = accessor[c];
        }
        return result;
    }
}

#endif //GRADUS_MANIPULATION_HPP
