#ifndef GRADUS_CONFIG_HPP
#define GRADUS_CONFIG_HPP

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

namespace Gradus::Config {
    using PropertyTree = boost::property_tree::ptree;

    struct LessonConfig {
        std::string dataset_root{"data"};
        float train_fraction{1.0f};
        float test_fraction{1.0f};
        std::vector<std::int64_t> hidden{128, 64};
        std::size_t epochs{5};
        std::size_t batch_size{64};
        double learning_rate{0.003};
        double momentum{0.0};
        std::string optimizer{"sgd"};  // sgd | adam
        std::string loss{"nll"};       // nll (LogSoftmax output) | cross_entropy (raw logits)
        double normalize_mean{0.5};
        double normalize_std{0.5};
        std::optional<std::uint64_t> seed{};
        bool use_cuda{false};
        std::string panel_path{"classify.png"};
        std::string checkpoint_dir{};  // empty: no checkpoint
        bool color{true};
    };

    namespace Details {
        inline constexpr std::array<std::string_view, 17> kKeys{
            "dataset_root", "train_fraction", "test_fraction", "hidden", "epochs", "batch_size",
            "learning_rate", "momentum", "optimizer", "loss", "normalize_mean", "normalize_std",
            "seed", "use_cuda", "panel_path", "checkpoint_dir", "color"
        };

        inline bool is_known_key(std::string_view key) {
            return std::find(kKeys.begin(), kKeys.end(), key) != kKeys.end();
        }

        template <class T>
        void read_value(const PropertyTree& tree, const std::string& key, T& target) {
            const auto node = tree.get_child_optional(key);
            if (!node) {
                return;
            }
            const auto value = node->get_value_optional<T>();
            if (!value) {
                throw std::invalid_argument("Configuration key '" + key + "' has an invalid value '" + node->data() + "'.");
            }
            target = *value;
        }

        // Counts are parsed signed so that "-1" is rejected instead of wrapping.
        inline void read_count(const PropertyTree& tree, const std::string& key, std::size_t& target) {
            if (!tree.get_child_optional(key)) {
                return;
            }
            std::int64_t value = 0;
            read_value(tree, key, value);
            if (value <= 0) {
                throw std::invalid_argument("Configuration '" + key + "' must be positive.");
            }
            target = static_cast<std::size_t>(value);
        }

        inline std::vector<std::int64_t> parse_hidden(const PropertyTree& node) {
            std::vector<std::int64_t> sizes;
            auto push = [&](const std::string& token) {
                std::size_t consumed = 0;
                long long value = 0;
                try {
                    value = std::stoll(token, &consumed);
                } catch (const std::exception&) {
                    throw std::invalid_argument("Configuration key 'hidden' has an invalid entry '" + token + "'.");
                }
                if (consumed != token.size()) {
                    throw std::invalid_argument("Configuration key 'hidden' has an invalid entry '" + token + "'.");
                }
                sizes.push_back(static_cast<std::int64_t>(value));
            };

            if (!node.empty()) {
                for (const auto& child : node) {
                    push(child.second.data());
                }
                return sizes;
            }

            std::stringstream stream(node.data());
            std::string token;
            while (std::getline(stream, token, ',')) {
                token.erase(std::remove_if(token.begin(), token.end(), [](unsigned char c) { return std::isspace(c); }), token.end());
                if (!token.empty()) {
                    push(token);
                }
            }
            return sizes;
        }

        inline void apply_tree(const PropertyTree& tree, LessonConfig& config) {
            for (const auto& entry : tree) {
                if (!is_known_key(entry.first)) {
                    throw std::invalid_argument("Unknown configuration key '" + entry.first + "'.");
                }
            }
            read_value(tree, "dataset_root", config.dataset_root);
            read_value(tree, "train_fraction", config.train_fraction);
            read_value(tree, "test_fraction", config.test_fraction);
            if (const auto hidden = tree.get_child_optional("hidden")) {
                config.hidden = parse_hidden(*hidden);
            }
            read_count(tree, "epochs", config.epochs);
            read_count(tree, "batch_size", config.batch_size);
            read_value(tree, "learning_rate", config.learning_rate);
            read_value(tree, "momentum", config.momentum);
            read_value(tree, "optimizer", config.optimizer);
            read_value(tree, "loss", config.loss);
            read_value(tree, "normalize_mean", config.normalize_mean);
            read_value(tree, "normalize_std", config.normalize_std);
            if (tree.get_child_optional("seed")) {
                std::int64_t seed = 0;
                read_value(tree, "seed", seed);
                if (seed < 0) {
                    throw std::invalid_argument("Configuration 'seed' must be non-negative.");
                }
                config.seed = static_cast<std::uint64_t>(seed);
            }
            read_value(tree, "use_cuda", config.use_cuda);
            read_value(tree, "panel_path", config.panel_path);
            read_value(tree, "checkpoint_dir", config.checkpoint_dir);
            read_value(tree, "color", config.color);
        }
    }

    inline void Validate(const LessonConfig& config) {
        if (config.epochs == 0) {
            throw std::invalid_argument("Configuration 'epochs' must be positive.");
        }
        if (config.batch_size == 0) {
            throw std::invalid_argument("Configuration 'batch_size' must be positive.");
        }
        if (!(config.learning_rate > 0.0)) {
            throw std::invalid_argument("Configuration 'learning_rate' must be positive.");
        }
        if (config.momentum < 0.0) {
            throw std::invalid_argument("Configuration 'momentum' must be non-negative.");
        }
        if (config.hidden.empty()) {
            throw std::invalid_argument("Configuration 'hidden' must list at least one layer size.");
        }
        if (std::any_of(config.hidden.begin(), config.hidden.end(), [](std::int64_t size) { return size <= 0; })) {
            throw std::invalid_argument("Configuration 'hidden' sizes must be positive.");
        }
        if (config.optimizer != "sgd" && config.optimizer != "adam") {
            throw std::invalid_argument("Configuration 'optimizer' must be 'sgd' or 'adam', got '" + config.optimizer + "'.");
        }
        if (config.loss != "nll" && config.loss != "cross_entropy") {
            throw std::invalid_argument("Configuration 'loss' must be 'nll' or 'cross_entropy', got '" + config.loss + "'.");
        }
        if (config.train_fraction <= 0.0f || config.train_fraction > 1.0f
            || config.test_fraction <= 0.0f || config.test_fraction > 1.0f) {
            throw std::invalid_argument("Configuration fractions must lie in (0, 1].");
        }
        if (!(config.normalize_std > 0.0)) {
            throw std::invalid_argument("Configuration 'normalize_std' must be positive.");
        }
    }

    // Absent keys keep their defaults.
    [[nodiscard]] inline LessonConfig Load(const std::filesystem::path& path) {
        PropertyTree tree;
        try {
            boost::property_tree::read_json(path.string(), tree);
        } catch (const boost::property_tree::json_parser_error& error) {
            throw std::runtime_error("Failed to read configuration '" + path.string() + "': " + error.what());
        }
        LessonConfig config{};
        Details::apply_tree(tree, config);
        Validate(config);
        return config;
    }

    // key=value tokens, e.g. "epochs=3" or "hidden=256,128".
    inline void ApplyOverrides(LessonConfig& config, const std::vector<std::string>& arguments) {
        PropertyTree tree;
        for (const auto& argument : arguments) {
            const auto separator = argument.find('=');
            if (separator == std::string::npos || separator == 0) {
                throw std::invalid_argument("Override '" + argument + "' must have the form key=value.");
            }
            tree.put_child(PropertyTree::path_type(argument.substr(0, separator), '\0'),
                           PropertyTree(argument.substr(separator + 1)));
        }
        Details::apply_tree(tree, config);
        Validate(config);
    }

    inline void Print(const LessonConfig& config, std::ostream* stream = &std::cout) {
        if (stream == nullptr) {
            return;
        }
        std::ostringstream hidden;
        for (std::size_t i = 0; i < config.hidden.size(); ++i) {
            hidden << config.hidden[i] << (i + 1 < config.hidden.size() ? "," : "");
        }
        auto& out = *stream;
        out << "[Gradus] configuration\n"
            << "  dataset_root   " << config.dataset_root << '\n'
            << "  fractions      train " << config.train_fraction << ", test " << config.test_fraction << '\n'
            << "  hidden         " << hidden.str() << '\n'
            << "  epochs         " << config.epochs << ", batch " << config.batch_size << '\n'
            << "  optimizer      " << config.optimizer << " (lr " << config.learning_rate
            << ", momentum " << config.momentum << ")\n"
            << "  loss           " << config.loss << '\n'
            << "  normalize      mean " << config.normalize_mean << ", std " << config.normalize_std << '\n'
            << "  seed           " << (config.seed ? std::to_string(*config.seed) : std::string("random")) << '\n'
            << "  device         " << (config.use_cuda ? "cuda (if available)" : "cpu") << '\n';
    }
}

#endif // GRADUS_CONFIG_HPP
