#ifndef GRADUS_NETWORK_HPP
#define GRADUS_NETWORK_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "core.hpp"
#include "data/load/types.hpp"

namespace Gradus::Network {
    struct MNISTOptions {
        std::vector<std::int64_t> hidden{128, 64};
        Activation::Descriptor activation{Activation::ReLU};
        Activation::Descriptor output{Activation::Identity}; // Identity -> logits for CrossEntropy
        Initialization::Descriptor initialization{Initialization::Default};
        double dropout{0.0};
    };

    // Flatten -> FC(784, h1) -> ... -> FC(hn, 10). Hidden layers use `activation`, the last one `output`.
    inline Model& MNIST(Model& model, const MNISTOptions& options = {}) {
        if (options.hidden.empty()) {
            throw std::invalid_argument("MNIST network requires at least one hidden layer.");
        }
        if (model.layer_count() != 0) {
            throw std::logic_error("MNIST network must be built on an empty model.");
        }

        model.add(Layer::Flatten(), "flatten");

        std::int64_t in_features = Data::Type::MNIST::kPixels;
        for (std::size_t i = 0; i < options.hidden.size(); ++i) {
            const auto out_features = options.hidden[i];
            model.add(Layer::FC({in_features, out_features, true}, options.activation, options.initialization),
                      "hidden_" + std::to_string(i + 1));
            if (options.dropout > 0.0) {
                model.add(Layer::Dropout({options.dropout}), "dropout_" + std::to_string(i + 1));
            }
            in_features = out_features;
        }

        model.add(Layer::FC({in_features, Data::Type::MNIST::kClasses, true}, options.output, options.initialization),
                  "output");
        return model;
    }
}

#endif //GRADUS_NETWORK_HPP
