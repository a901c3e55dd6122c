#ifndef INPAINT_COMMON_CONFIG_HPP
#define INPAINT_COMMON_CONFIG_HPP
/*
 * JSON configuration of a generator / discriminator pair.
 * ---------------------------------------------------------------------------
 * {
 *   "name": "dcgan",
 *   "model": { "latent_vector_size": 100, "channels": 3, "conditional": false,
 *              "bottleneck_channels": 4000, "initialization": "dcgan" },
 *   "generator": { "feature_map": 64 },
 *   "discriminator": { "feature_map": 64 },
 *   "optimizer": { "learning_rate": 0.0002, "beta1": 0.5 }
 * }
 * Every key is optional; absent keys keep the defaults below.
 */
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>

#include <boost/property_tree/ptree.hpp>

#include "../initialization/apply.hpp"
#include "../initialization/initialization.hpp"
#include "../network/options.hpp"
#include "../optimizer/optimizer.hpp"
#include "save_load.hpp"

namespace Inpaint::Common::Config {
    using PropertyTree = SaveLoad::PropertyTree;

    struct GanConfig {
        std::string name{"dcgan"};
        std::int64_t latent_vector_size{100};
        std::int64_t channels{3};
        bool conditional{false};
        std::int64_t bottleneck_channels{Network::kDefaultBottleneckChannels};
        Initialization::Descriptor initialization{Initialization::DCGAN};
        std::int64_t generator_feature_map{64};
        std::int64_t discriminator_feature_map{64};
        double learning_rate{2e-4};
        double beta1{0.5};
    };

    namespace Detail {
        // Missing keys keep `fallback`; present keys of the wrong type are an error.
        template <class Value>
        Value read_field(const PropertyTree& tree, const std::string& key, const Value& fallback, const std::string& context)
        {
            const auto child = tree.get_child_optional(key);
            if (!child) {
                return fallback;
            }
            const auto value = child->get_value_optional<Value>();
            if (!value) {
                std::ostringstream message;
                message << "Invalid value '" << child->data() << "' for field '" << key << "' in " << context;
                throw std::runtime_error(message.str());
            }
            return *value;
        }
    }

    inline GanConfig from_tree(const PropertyTree& tree, const std::string& context = "configuration")
    {
        GanConfig config{};
        config.name = Detail::read_field<std::string>(tree, "name", config.name, context);

        if (const auto model = tree.get_child_optional("model")) {
            const auto scope = context + " model";
            config.latent_vector_size = Detail::read_field(*model, "latent_vector_size", config.latent_vector_size, scope);
            config.channels = Detail::read_field(*model, "channels", config.channels, scope);
            config.conditional = Detail::read_field(*model, "conditional", config.conditional, scope);
            config.bottleneck_channels = Detail::read_field(*model, "bottleneck_channels", config.bottleneck_channels, scope);
            if (const auto initialization = model->get_optional<std::string>("initialization")) {
                config.initialization = {SaveLoad::initialization_from_string(*initialization, scope)};
            }
        }
        if (const auto generator = tree.get_child_optional("generator")) {
            config.generator_feature_map = Detail::read_field(*generator, "feature_map", config.generator_feature_map,
                                                              context + " generator");
        }
        if (const auto discriminator = tree.get_child_optional("discriminator")) {
            config.discriminator_feature_map = Detail::read_field(*discriminator, "feature_map", config.discriminator_feature_map,
                                                                  context + " discriminator");
        }
        if (const auto optimizer = tree.get_child_optional("optimizer")) {
            const auto scope = context + " optimizer";
            config.learning_rate = Detail::read_field(*optimizer, "learning_rate", config.learning_rate, scope);
            config.beta1 = Detail::read_field(*optimizer, "beta1", config.beta1, scope);
        }
        return config;
    }

    inline PropertyTree to_tree(const GanConfig& config)
    {
        PropertyTree tree;
        tree.put("name", config.name);
        tree.put("model.latent_vector_size", config.latent_vector_size);
        tree.put("model.channels", config.channels);
        tree.put("model.conditional", config.conditional);
        tree.put("model.bottleneck_channels", config.bottleneck_channels);
        tree.put("model.initialization", std::string{Initialization::Details::to_string(config.initialization.type)});
        tree.put("generator.feature_map", config.generator_feature_map);
        tree.put("discriminator.feature_map", config.discriminator_feature_map);
        tree.put("optimizer.learning_rate", config.learning_rate);
        tree.put("optimizer.beta1", config.beta1);
        return tree;
    }

    inline GanConfig read(const std::filesystem::path& path)
    {
        if (!std::filesystem::exists(path)) {
            throw std::runtime_error("Configuration file not found at '" + path.string() + "'.");
        }
        return from_tree(SaveLoad::read_json_file(path), path.string());
    }

    inline void write(const std::filesystem::path& path, const GanConfig& config)
    {
        SaveLoad::write_json_file(path, to_tree(config));
    }

    [[nodiscard]] inline Network::GeneratorOptions generator_options(const GanConfig& config,
                                                                     bool monitor = false,
                                                                     std::ostream* stream = &std::cout)
    {
        Network::GeneratorOptions options{};
        options.latent_vector_size = config.latent_vector_size;
        options.feature_map = config.generator_feature_map;
        options.channels = config.channels;
        options.conditional = config.conditional;
        options.bottleneck_channels = config.bottleneck_channels;
        options.initialization = config.initialization;
        options.monitor = monitor;
        options.stream = stream;
        return options;
    }

    [[nodiscard]] inline Network::DiscriminatorOptions discriminator_options(const GanConfig& config,
                                                                             bool monitor = false,
                                                                             std::ostream* stream = &std::cout)
    {
        Network::DiscriminatorOptions options{};
        options.latent_vector_size = config.latent_vector_size;
        options.feature_map = config.discriminator_feature_map;
        options.channels = config.channels;
        options.conditional = config.conditional;
        options.initialization = config.initialization;
        options.monitor = monitor;
        options.stream = stream;
        return options;
    }

    [[nodiscard]] inline Optimizer::AdamDescriptor optimizer(const GanConfig& config)
    {
        return Optimizer::Adam({.learning_rate = config.learning_rate, .beta1 = config.beta1, .beta2 = 0.999});
    }
}

#endif // INPAINT_COMMON_CONFIG_HPP
