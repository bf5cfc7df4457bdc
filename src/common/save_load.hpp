#ifndef NABLA_COMMON_SAVE_LOAD_HPP
#define NABLA_COMMON_SAVE_LOAD_HPP
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include "../activation/activation.hpp"
#include "../initialization/initialization.hpp"
#include "../layer/layer.hpp"

namespace Nabla::Common::SaveLoad {
    using PropertyTree = boost::property_tree::ptree;

    struct NamedLayerDescriptor {
        Layer::Descriptor descriptor{};
        std::string name{};
        bool trainable{true};
    };

    namespace Detail {
        inline std::string to_lower(std::string value)
        {
            std::transform(value.begin(), value.end(), value.begin(), [](unsigned char character) {
                return static_cast<char>(std::tolower(character));
            });
            return value;
        }

        template <class Numeric>
        Numeric get_numeric(const PropertyTree& tree, const std::string& key, const std::string& context)
        {
            static_assert(std::is_arithmetic_v<Numeric>, "Numeric type required for property tree extraction.");
            const auto value = tree.get_optional<Numeric>(key);
            if (!value) {
                std::ostringstream message;
                message << "Missing numeric field '" << key << "' in " << context;
                throw std::runtime_error(message.str());
            }
            return *value;
        }

        inline bool get_boolean(const PropertyTree& tree, const std::string& key, const std::string& context)
        {
            const auto value = tree.get_optional<bool>(key);
            if (!value) {
                std::ostringstream message;
                message << "Missing boolean field '" << key << "' in " << context;
                throw std::runtime_error(message.str());
            }
            return *value;
        }

        inline std::string get_string(const PropertyTree& tree, const std::string& key, const std::string& context)
        {
            const auto value = tree.get_optional<std::string>(key);
            if (!value) {
                std::ostringstream message;
                message << "Missing string field '" << key << "' in " << context;
                throw std::runtime_error(message.str());
            }
            return *value;
        }

        inline const PropertyTree& get_child(const PropertyTree& tree, const std::string& key, const std::string& context)
        {
            const auto child = tree.get_child_optional(key);
            if (!child) {
                std::ostringstream message;
                message << "Missing entry '" << key << "' in " << context;
                throw std::runtime_error(message.str());
            }
            return *child;
        }

        template <class T>
        std::vector<T> read_array(const PropertyTree& tree, const std::string& context)
        {
            std::vector<T> values;
            values.reserve(tree.size());
            for (const auto& child : tree) {
                try {
                    values.push_back(child.second.get_value<T>());
                } catch (const boost::property_tree::ptree_bad_data&) {
                    std::ostringstream message;
                    message << "Invalid array element in " << context;
                    throw std::runtime_error(message.str());
                }
            }
            return values;
        }

        template <class T>
        PropertyTree write_array(const std::vector<T>& values)
        {
            PropertyTree array;
            for (const auto& value : values) {
                PropertyTree element;
                element.put("", value);
                array.push_back({"", element});
            }
            return array;
        }

        inline std::string activation_type_to_string(Activation::Type type)
        {
            switch (type) {
                case Activation::Type::Identity: return "identity";
                case Activation::Type::ReLU: return "relu";
                case Activation::Type::LeakyReLU: return "leaky_relu";
                case Activation::Type::Sigmoid: return "sigmoid";
                case Activation::Type::Tanh: return "tanh";
                case Activation::Type::Softmax: return "softmax";
            }
            throw std::runtime_error("Unsupported activation type during serialisation.");
        }

        inline Activation::Type activation_type_from_string(const std::string& value)
        {
            const auto lowered = to_lower(value);
            if (lowered == "identity") return Activation::Type::Identity;
            if (lowered == "relu") return Activation::Type::ReLU;
            if (lowered == "leaky_relu") return Activation::Type::LeakyReLU;
            if (lowered == "sigmoid") return Activation::Type::Sigmoid;
            if (lowered == "tanh") return Activation::Type::Tanh;
            if (lowered == "softmax") return Activation::Type::Softmax;
            std::ostringstream message;
            message << "Unknown activation type '" << value << "'.";
            throw std::runtime_error(message.str());
        }

        inline std::string initialization_type_to_string(Initialization::Type type)
        {
            switch (type) {
                case Initialization::Type::Default: return "default";
                case Initialization::Type::XavierNormal: return "xavier_normal";
                case Initialization::Type::XavierUniform: return "xavier_uniform";
                case Initialization::Type::HeNormal: return "he_normal";
                case Initialization::Type::HeUniform: return "he_uniform";
                case Initialization::Type::Zeros: return "zeros";
            }
            throw std::runtime_error("Unsupported initialisation type during serialisation.");
        }

        inline Initialization::Type initialization_type_from_string(const std::string& value)
        {
            const auto lowered = to_lower(value);
            if (lowered == "default") return Initialization::Type::Default;
            if (lowered == "xavier_normal") return Initialization::Type::XavierNormal;
            if (lowered == "xavier_uniform") return Initialization::Type::XavierUniform;
            if (lowered == "he_normal") return Initialization::Type::HeNormal;
            if (lowered == "he_uniform") return Initialization::Type::HeUniform;
            if (lowered == "zeros") return Initialization::Type::Zeros;
            std::ostringstream message;
            message << "Unknown initialisation type '" << value << "'.";
            throw std::runtime_error(message.str());
        }

        inline PropertyTree serialize_activation_descriptor(const Activation::Descriptor& descriptor)
        {
            PropertyTree tree;
            tree.put("type", activation_type_to_string(descriptor.type));
            return tree;
        }

        inline Activation::Descriptor deserialize_activation_descriptor(const PropertyTree& tree, const std::string& context)
        {
            Activation::Descriptor descriptor;
            descriptor.type = activation_type_from_string(get_string(tree, "type", context));
            return descriptor;
        }

        inline PropertyTree serialize_initialization_descriptor(const Initialization::Descriptor& descriptor)
        {
            PropertyTree tree;
            tree.put("type", initialization_type_to_string(descriptor.type));
            return tree;
        }

        inline Initialization::Descriptor deserialize_initialization_descriptor(const PropertyTree& tree,
                                                                                const std::string& context)
        {
            Initialization::Descriptor descriptor;
            descriptor.type = initialization_type_from_string(get_string(tree, "type", context));
            return descriptor;
        }
    }

    inline PropertyTree serialize_layer_descriptor(const Layer::Descriptor& descriptor)
    {
        PropertyTree tree;
        std::visit(
            [&](const auto& concrete) {
                using DescriptorType = std::decay_t<decltype(concrete)>;
                if constexpr (std::is_same_v<DescriptorType, Layer::InputDescriptor>) {
                    tree.put("type", "input");
                    tree.add_child("options.shape", Detail::write_array(concrete.options.shape));
                } else if constexpr (std::is_same_v<DescriptorType, Layer::FCDescriptor>) {
                    tree.put("type", "fc");
                    tree.put("options.in_features", concrete.options.in_features);
                    tree.put("options.out_features", concrete.options.out_features);
                    tree.put("options.bias", concrete.options.bias);
                    tree.add_child("activation", Detail::serialize_activation_descriptor(concrete.activation));
                    tree.add_child("initialization", Detail::serialize_initialization_descriptor(concrete.initialization));
                } else if constexpr (std::is_same_v<DescriptorType, Layer::Conv2dDescriptor>) {
                    tree.put("type", "conv2d");
                    tree.put("options.in_channels", concrete.options.in_channels);
                    tree.put("options.out_channels", concrete.options.out_channels);
                    tree.add_child("options.kernel_size", Detail::write_array(concrete.options.kernel_size));
                    tree.add_child("options.stride", Detail::write_array(concrete.options.stride));
                    tree.add_child("options.padding", Detail::write_array(concrete.options.padding));
                    tree.add_child("options.dilation", Detail::write_array(concrete.options.dilation));
                    tree.put("options.groups", concrete.options.groups);
                    tree.put("options.bias", concrete.options.bias);
                    tree.add_child("activation", Detail::serialize_activation_descriptor(concrete.activation));
                    tree.add_child("initialization", Detail::serialize_initialization_descriptor(concrete.initialization));
                } else if constexpr (std::is_same_v<DescriptorType, Layer::FlattenDescriptor>) {
                    tree.put("type", "flatten");
                } else if constexpr (std::is_same_v<DescriptorType, Layer::DropoutDescriptor>) {
                    tree.put("type", "dropout");
                    tree.put("options.probability", concrete.options.probability);
                } else {
                    static_assert(sizeof(DescriptorType) == 0, "Unsupported layer descriptor during serialisation.");
                }
            },
            descriptor);
        return tree;
    }

    inline Layer::Descriptor deserialize_layer_descriptor(const PropertyTree& tree, const std::string& context)
    {
        const auto type = Detail::to_lower(Detail::get_string(tree, "type", context));
        if (type == "input") {
            Layer::InputDescriptor descriptor;
            const auto shape_node = tree.get_child_optional("options.shape");
            if (shape_node) {
                descriptor.options.shape = Detail::read_array<std::int64_t>(*shape_node, context);
            }
            return Layer::Descriptor{descriptor};
        }
        if (type == "fc") {
            Layer::FCDescriptor descriptor;
            descriptor.options.in_features = Detail::get_numeric<std::int64_t>(tree, "options.in_features", context);
            descriptor.options.out_features = Detail::get_numeric<std::int64_t>(tree, "options.out_features", context);
            descriptor.options.bias = Detail::get_boolean(tree, "options.bias", context);
            descriptor.activation = Detail::deserialize_activation_descriptor(Detail::get_child(tree, "activation", context), context);
            descriptor.initialization = Detail::deserialize_initialization_descriptor(Detail::get_child(tree, "initialization", context), context);
            return Layer::Descriptor{descriptor};
        }
        if (type == "conv2d") {
            Layer::Conv2dDescriptor descriptor;
            auto& options = descriptor.options;
            options.in_channels = Detail::get_numeric<std::int64_t>(tree, "options.in_channels", context);
            options.out_channels = Detail::get_numeric<std::int64_t>(tree, "options.out_channels", context);
            options.kernel_size = Detail::read_array<std::int64_t>(Detail::get_child(tree, "options.kernel_size", context), context);
            options.stride = Detail::read_array<std::int64_t>(Detail::get_child(tree, "options.stride", context), context);
            options.padding = Detail::read_array<std::int64_t>(Detail::get_child(tree, "options.padding", context), context);
            options.dilation = Detail::read_array<std::int64_t>(Detail::get_child(tree, "options.dilation", context), context);
            options.groups = Detail::get_numeric<std::int64_t>(tree, "options.groups", context);
            options.bias = Detail::get_boolean(tree, "options.bias", context);
            descriptor.activation = Detail::deserialize_activation_descriptor(Detail::get_child(tree, "activation", context), context);
            descriptor.initialization = Detail::deserialize_initialization_descriptor(Detail::get_child(tree, "initialization", context), context);
            return Layer::Descriptor{descriptor};
        }
        if (type == "flatten") {
            return Layer::Descriptor{Layer::FlattenDescriptor{}};
        }
        if (type == "dropout") {
            Layer::DropoutDescriptor descriptor;
            descriptor.options.probability = Detail::get_numeric<double>(tree, "options.probability", context);
            return Layer::Descriptor{descriptor};
        }
        std::ostringstream message;
        message << "Unsupported layer descriptor '" << type << "' in " << context;
        throw std::runtime_error(message.str());
    }

    inline PropertyTree serialize_layer_list(const std::vector<NamedLayerDescriptor>& layers)
    {
        PropertyTree list;
        for (const auto& layer : layers) {
            PropertyTree node;
            node.put("name", layer.name);
            node.put("trainable", layer.trainable);
            node.add_child("descriptor", serialize_layer_descriptor(layer.descriptor));
            list.push_back({"", node});
        }
        return list;
    }

    inline std::vector<NamedLayerDescriptor> deserialize_layer_list(const PropertyTree& tree, const std::string& context)
    {
        std::vector<NamedLayerDescriptor> layers;
        layers.reserve(tree.size());
        std::size_t index = 0;
        for (const auto& node : tree) {
            const auto entry_context = context + " #" + std::to_string(index++);
            NamedLayerDescriptor layer;
            layer.name = Detail::get_string(node.second, "name", entry_context);
            layer.trainable = node.second.get<bool>("trainable", true);
            layer.descriptor = deserialize_layer_descriptor(Detail::get_child(node.second, "descriptor", entry_context),
                                                            entry_context);
            layers.push_back(std::move(layer));
        }
        return layers;
    }

    inline void write_json_file(const std::filesystem::path& path, const PropertyTree& tree)
    {
        std::ofstream stream(path);
        if (!stream) {
            std::ostringstream message;
            message << "Failed to open '" << path.string() << "' for writing.";
            throw std::runtime_error(message.str());
        }
        boost::property_tree::write_json(stream, tree, true);
    }

    inline PropertyTree read_json_file(const std::filesystem::path& path)
    {
        PropertyTree tree;
        try {
            boost::property_tree::read_json(path.string(), tree);
        } catch (const boost::property_tree::json_parser_error& error) {
            throw std::runtime_error(std::string("Failed to parse '") + path.string() + "': " + error.what());
        }
        return tree;
    }
}
#endif // NABLA_COMMON_SAVE_LOAD_HPP
