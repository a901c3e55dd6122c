#ifndef INPAINT_NETWORK_OPTIONS_HPP
#define INPAINT_NETWORK_OPTIONS_HPP

#include <cstdint>
#include <iostream>
#include <ostream>
#include <stdexcept>
#include <string>

#include "../initialization/initialization.hpp"

namespace Inpaint::Network {
    // Square image extents the fixed topologies are laid out for.
    inline constexpr std::int64_t kImageExtent = 64;
    inline constexpr std::int64_t kContextExtent = 128;
    inline constexpr std::int64_t kDefaultBottleneckChannels = 4000;

    struct GeneratorOptions {
        std::int64_t latent_vector_size{100};
        std::int64_t feature_map{64};
        std::int64_t channels{3};
        bool conditional{false};                                      // context encoder instead of the DCGAN decoder
        std::int64_t bottleneck_channels{kDefaultBottleneckChannels}; // context encoder only
        ::Inpaint::Initialization::Descriptor initialization{::Inpaint::Initialization::Default};
        bool monitor{false};
        std::ostream* stream{&std::cout};
    };

    struct DiscriminatorOptions {
        std::int64_t latent_vector_size{100}; // unused by the topology, kept for symmetry with the generator
        std::int64_t feature_map{64};
        std::int64_t channels{3};
        bool conditional{false};              // biased convolutions
        ::Inpaint::Initialization::Descriptor initialization{::Inpaint::Initialization::Default};
        bool monitor{false};
        std::ostream* stream{&std::cout};
    };

    namespace Details {
        inline void require_positive(std::int64_t value, const char* field, const char* network)
        {
            if (value <= 0) {
                throw std::invalid_argument(std::string(network) + " option '" + field
                                            + "' must be positive (received " + std::to_string(value) + ").");
            }
        }

        inline void validate(const GeneratorOptions& options)
        {
            require_positive(options.latent_vector_size, "latent_vector_size", "Generator");
            require_positive(options.feature_map, "feature_map", "Generator");
            require_positive(options.channels, "channels", "Generator");
            if (options.conditional) {
                require_positive(options.bottleneck_channels, "bottleneck_channels", "Generator");
            }
        }

        inline void validate(const DiscriminatorOptions& options)
        {
            require_positive(options.latent_vector_size, "latent_vector_size", "Discriminator");
            require_positive(options.feature_map, "feature_map", "Discriminator");
            require_positive(options.channels, "channels", "Discriminator");
        }
    }
}

#endif // INPAINT_NETWORK_OPTIONS_HPP
