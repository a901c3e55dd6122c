#ifndef INPAINT_COMMON_SAVE_LOAD_HPP
#define INPAINT_COMMON_SAVE_LOAD_HPP
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include "../activation/activation.hpp"
#include "../initialization/apply.hpp"
#include "../initialization/initialization.hpp"
#include "../layer/layer.hpp"
#include "../network/options.hpp"

namespace Inpaint::Common::SaveLoad {
    using PropertyTree = boost::property_tree::ptree;

    namespace Detail {
        inline std::string to_lower(std::string value)
        {
            std::transform(value.begin(), value.end(), value.begin(), [](unsigned char character) {
                return static_cast<char>(std::tolower(character));
            });
            return value;
        }

        inline PropertyTree serialize_activation(const Activation::Descriptor& descriptor)
        {
            PropertyTree tree;
            tree.put("type", std::string{Activation::to_string(descriptor.type)});
            if (descriptor.type == Activation::Type::LeakyReLU) {
                tree.put("negative_slope", descriptor.negative_slope);
            }
            return tree;
        }

        inline PropertyTree serialize_convolution(const Layer::Conv2dOptions& options)
        {
            PropertyTree tree;
            tree.put("in_channels", options.in_channels);
            tree.put("out_channels", options.out_channels);
            tree.put("kernel_size", options.kernel_size);
            tree.put("stride", options.stride);
            tree.put("padding", options.padding);
            tree.put("bias", options.bias);
            return tree;
        }

        inline PropertyTree serialize_convolution(const Layer::ConvTranspose2dOptions& options)
        {
            PropertyTree tree;
            tree.put("in_channels", options.in_channels);
            tree.put("out_channels", options.out_channels);
            tree.put("kernel_size", options.kernel_size);
            tree.put("stride", options.stride);
            tree.put("padding", options.padding);
            tree.put("output_padding", options.output_padding);
            tree.put("bias", options.bias);
            return tree;
        }

        inline PropertyTree serialize_batchnorm(const Layer::BatchNorm2dOptions& options)
        {
            PropertyTree tree;
            tree.put("num_features", options.num_features);
            tree.put("eps", options.eps);
            tree.put("momentum", options.momentum);
            tree.put("affine", options.affine);
            tree.put("track_running_stats", options.track_running_stats);
            return tree;
        }
    }

    inline Initialization::Type initialization_from_string(const std::string& value, const std::string& context)
    {
        const auto lowered = Detail::to_lower(value);
        if (lowered == "default") return Initialization::Type::Default;
        if (lowered == "dcgan") return Initialization::Type::DCGAN;
        if (lowered == "xavier_normal") return Initialization::Type::XavierNormal;
        if (lowered == "kaiming_normal") return Initialization::Type::KaimingNormal;
        if (lowered == "zero_bias") return Initialization::Type::ZeroBias;
        std::ostringstream message;
        message << "Unknown initialization '" << value << "' in " << context;
        throw std::runtime_error(message.str());
    }

    inline PropertyTree serialize_layer_descriptor(const Layer::Descriptor& descriptor)
    {
        return std::visit(
            [](const auto& concrete) {
                using DescriptorType = std::decay_t<decltype(concrete)>;
                PropertyTree tree;
                if constexpr (std::is_same_v<DescriptorType, Layer::Conv2dDescriptor>) {
                    tree.put("type", std::string{"conv2d"});
                    tree.add_child("options", Detail::serialize_convolution(concrete.options));
                } else if constexpr (std::is_same_v<DescriptorType, Layer::ConvTranspose2dDescriptor>) {
                    tree.put("type", std::string{"conv_transpose2d"});
                    tree.add_child("options", Detail::serialize_convolution(concrete.options));
                } else if constexpr (std::is_same_v<DescriptorType, Layer::BatchNorm2dDescriptor>) {
                    tree.put("type", std::string{"batchnorm2d"});
                    tree.add_child("options", Detail::serialize_batchnorm(concrete.options));
                } else {
                    static_assert(sizeof(DescriptorType) == 0, "Unsupported layer descriptor provided to serialize_layer_descriptor.");
                }
                tree.add_child("activation", Detail::serialize_activation(concrete.activation));
                tree.put("initialization", std::string{Initialization::Details::to_string(concrete.initialization.type)});
                return tree;
            },
            descriptor);
    }

    inline PropertyTree serialize_layer_list(const std::vector<Layer::Descriptor>& descriptors)
    {
        PropertyTree tree;
        for (const auto& descriptor : descriptors) {
            tree.push_back({"", serialize_layer_descriptor(descriptor)});
        }
        return tree;
    }

    inline PropertyTree serialize_options(const Network::GeneratorOptions& options)
    {
        PropertyTree tree;
        tree.put("latent_vector_size", options.latent_vector_size);
        tree.put("feature_map", options.feature_map);
        tree.put("channels", options.channels);
        tree.put("conditional", options.conditional);
        if (options.conditional) {
            tree.put("bottleneck_channels", options.bottleneck_channels);
        }
        return tree;
    }

    inline PropertyTree serialize_options(const Network::DiscriminatorOptions& options)
    {
        PropertyTree tree;
        tree.put("latent_vector_size", options.latent_vector_size);
        tree.put("feature_map", options.feature_map);
        tree.put("channels", options.channels);
        tree.put("conditional", options.conditional);
        return tree;
    }

    // { "name", "options", "input_shape", "layers": [...] }
    template <class Model>
    PropertyTree serialize_architecture(Model& network)
    {
        PropertyTree tree;
        tree.put("name", network->label());
        tree.add_child("options", serialize_options(network->options()));

        PropertyTree input_shape;
        for (const auto extent : network->input_shape()) {
            PropertyTree element;
            element.put("", extent);
            input_shape.push_back({"", element});
        }
        tree.add_child("input_shape", input_shape);
        tree.add_child("layers", serialize_layer_list(network->main()->descriptors()));
        return tree;
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
            throw std::runtime_error("Failed to read JSON from '" + path.string() + "': " + error.what());
        }
        return tree;
    }

    template <class Model>
    void save_architecture(Model& network, const std::filesystem::path& path)
    {
        if (path.empty()) {
            throw std::invalid_argument("save_architecture requires a non-empty file path.");
        }
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }
        write_json_file(path, serialize_architecture(network));
    }
}
#endif // INPAINT_COMMON_SAVE_LOAD_HPP
