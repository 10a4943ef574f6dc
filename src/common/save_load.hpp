#ifndef GRADUS_COMMON_SAVE_LOAD_HPP
#define GRADUS_COMMON_SAVE_LOAD_HPP
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include "../activation/activation.hpp"
#include "../activation/apply.hpp"
#include "../initialization/apply.hpp"
#include "../initialization/initialization.hpp"
#include "../layer/layer.hpp"

namespace Gradus::Common::SaveLoad {
    using PropertyTree = boost::property_tree::ptree;
    using ModuleDescriptor = Layer::Descriptor;

    struct NamedModuleDescriptor {
        ModuleDescriptor descriptor{};
        std::string name{};

        NamedModuleDescriptor() = default;
        NamedModuleDescriptor(ModuleDescriptor layer, std::string layer_name = {})
            : descriptor(std::move(layer)), name(std::move(layer_name)) {}
    };

    namespace Detail {
        inline std::string to_lower(std::string value)
        {
            for (auto& character : value) {
                character = static_cast<char>(std::tolower(static_cast<unsigned char>(character)));
            }
            return value;
        }

        // Typed field lookup; a missing or unparsable field is a corrupt checkpoint.
        template <class T>
        T required(const PropertyTree& tree, const std::string& key, const std::string& context)
        {
            if (const auto value = tree.get_optional<T>(key)) {
                return *value;
            }
            throw std::runtime_error("Checkpoint field '" + key + "' is missing or malformed in " + context);
        }

        inline std::string get_string(const PropertyTree& tree, const std::string& key, const std::string& context)
        {
            return required<std::string>(tree, key, context);
        }

        inline const PropertyTree& get_child(const PropertyTree& tree, const std::string& key, const std::string& context)
        {
            const auto child = tree.get_child_optional(key);
            if (!child) {
                throw std::runtime_error("Missing section '" + key + "' in " + context);
            }
            return *child;
        }

        inline PropertyTree serialize_activation_descriptor(const Activation::Descriptor& descriptor)
        {
            PropertyTree tree;
            tree.put("type", std::string(Activation::Details::to_string(descriptor.type)));
            return tree;
        }

        inline Activation::Descriptor deserialize_activation_descriptor(const PropertyTree& tree, const std::string& context)
        {
            const auto name = to_lower(get_string(tree, "type", context));
            try {
                return Activation::Descriptor{Activation::Details::from_string(name)};
            } catch (const std::invalid_argument& error) {
                throw std::runtime_error(std::string(error.what()) + " (" + context + ")");
            }
        }

        inline PropertyTree serialize_initialization_descriptor(const Initialization::Descriptor& descriptor)
        {
            PropertyTree tree;
            tree.put("type", std::string(Initialization::Details::to_string(descriptor.type)));
            return tree;
        }

        inline Initialization::Descriptor deserialize_initialization_descriptor(const PropertyTree& tree, const std::string& context)
        {
            const auto name = to_lower(get_string(tree, "type", context));
            try {
                return Initialization::Descriptor{Initialization::Details::from_string(name)};
            } catch (const std::invalid_argument& error) {
                throw std::runtime_error(std::string(error.what()) + " (" + context + ")");
            }
        }
    }

    inline PropertyTree serialize_layer_descriptor(const Layer::Descriptor& descriptor)
    {
        PropertyTree tree;
        std::visit(
            [&](const auto& concrete) {
                using DescriptorType = std::decay_t<decltype(concrete)>;
                if constexpr (std::is_same_v<DescriptorType, Layer::FCDescriptor>) {
                    tree.put("type", "fc");
                    tree.put("options.in_features", concrete.options.in_features);
                    tree.put("options.out_features", concrete.options.out_features);
                    tree.put("options.bias", concrete.options.bias);
                    tree.add_child("activation", Detail::serialize_activation_descriptor(concrete.activation));
                    tree.add_child("initialization", Detail::serialize_initialization_descriptor(concrete.initialization));
                } else if constexpr (std::is_same_v<DescriptorType, Layer::FlattenDescriptor>) {
                    tree.put("type", "flatten");
                    tree.put("options.start_dim", concrete.options.start_dim);
                    tree.put("options.end_dim", concrete.options.end_dim);
                    tree.add_child("activation", Detail::serialize_activation_descriptor(concrete.activation));
                } else if constexpr (std::is_same_v<DescriptorType, Layer::DropoutDescriptor>) {
                    tree.put("type", "dropout");
                    tree.put("options.probability", concrete.options.probability);
                    tree.add_child("activation", Detail::serialize_activation_descriptor(concrete.activation));
                } else {
                    static_assert(sizeof(DescriptorType) == 0, "Unsupported layer descriptor supplied.");
                }
            },
            descriptor);
        return tree;
    }

    inline Layer::Descriptor deserialize_layer_descriptor(const PropertyTree& tree, const std::string& context)
    {
        const auto type = Detail::to_lower(Detail::get_string(tree, "type", context));
        if (type == "fc") {
            Layer::FCDescriptor descriptor;
            descriptor.options.in_features = Detail::required<std::int64_t>(tree, "options.in_features", context);
            descriptor.options.out_features = Detail::required<std::int64_t>(tree, "options.out_features", context);
            descriptor.options.bias = Detail::required<bool>(tree, "options.bias", context);
            descriptor.activation = Detail::deserialize_activation_descriptor(Detail::get_child(tree, "activation", context), context);
            descriptor.initialization = Detail::deserialize_initialization_descriptor(Detail::get_child(tree, "initialization", context), context);
            return Layer::Descriptor{descriptor};
        }
        if (type == "flatten") {
            Layer::FlattenDescriptor descriptor;
            descriptor.options.start_dim = Detail::required<std::int64_t>(tree, "options.start_dim", context);
            descriptor.options.end_dim = Detail::required<std::int64_t>(tree, "options.end_dim", context);
            descriptor.activation = Detail::deserialize_activation_descriptor(Detail::get_child(tree, "activation", context), context);
            return Layer::Descriptor{descriptor};
        }
        if (type == "dropout") {
            Layer::DropoutDescriptor descriptor;
            descriptor.options.probability = Detail::required<double>(tree, "options.probability", context);
            descriptor.activation = Detail::deserialize_activation_descriptor(Detail::get_child(tree, "activation", context), context);
            return Layer::Descriptor{descriptor};
        }
        throw std::runtime_error("Unsupported layer descriptor '" + type + "' in " + context);
    }

    inline PropertyTree serialize_module_descriptor(const NamedModuleDescriptor& descriptor)
    {
        PropertyTree tree;
        tree.put("kind", "layer");
        tree.add_child("descriptor", serialize_layer_descriptor(descriptor.descriptor));
        if (!descriptor.name.empty()) {
            tree.put("name", descriptor.name);
        }
        return tree;
    }

    inline NamedModuleDescriptor deserialize_named_module_descriptor(const PropertyTree& tree, const std::string& context)
    {
        const auto kind = Detail::to_lower(Detail::get_string(tree, "kind", context));
        if (kind != "layer") {
            throw std::runtime_error("Unknown module kind '" + kind + "' in " + context);
        }
        NamedModuleDescriptor descriptor{};
        descriptor.descriptor = deserialize_layer_descriptor(Detail::get_child(tree, "descriptor", context), context + " layer");
        if (const auto name_value = tree.get_optional<std::string>("name")) {
            descriptor.name = *name_value;
        }
        return descriptor;
    }

    inline PropertyTree serialize_module_list(const std::vector<NamedModuleDescriptor>& descriptors)
    {
        PropertyTree list;
        for (const auto& entry : descriptors) {
            list.push_back(PropertyTree::value_type(std::string{}, serialize_module_descriptor(entry)));
        }
        return list;
    }

    inline std::vector<NamedModuleDescriptor> deserialize_module_list(const PropertyTree& list, const std::string& context)
    {
        std::vector<NamedModuleDescriptor> entries;
        for (const auto& [key, node] : list) {
            (void)key;
            entries.push_back(deserialize_named_module_descriptor(node, context + " #" + std::to_string(entries.size())));
        }
        return entries;
    }

    inline void write_json_file(const std::filesystem::path& path, const PropertyTree& tree)
    {
        std::ofstream file(path, std::ios::trunc);
        if (!file) {
            throw std::runtime_error("Cannot open '" + path.string() + "' for writing.");
        }
        boost::property_tree::write_json(file, tree, /*pretty=*/true);
    }

    inline PropertyTree read_json_file(const std::filesystem::path& path)
    {
        PropertyTree tree;
        try {
            boost::property_tree::read_json(path.string(), tree);
        } catch (const boost::property_tree::json_parser_error& error) {
            throw std::runtime_error("Failed to parse JSON '" + path.string() + "': " + error.what());
        }
        return tree;
    }
}
#endif // GRADUS_COMMON_SAVE_LOAD_HPP
