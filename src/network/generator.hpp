#ifndef INPAINT_NETWORK_GENERATOR_HPP
#define INPAINT_NETWORK_GENERATOR_HPP

#include <cstdint>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "details/stacked.hpp"
#include "options.hpp"
#include "topology.hpp"

namespace Inpaint::Network {

    // Generator part of the DCGAN model. `conditional` swaps the latent decoder
    // for the context encoder used for in-painting.
    class GeneratorImpl : public Details::StackedNetworkImpl {
    public:
        explicit GeneratorImpl(GeneratorOptions options)
            : Details::StackedNetworkImpl("Generator", options.monitor, options.stream), options_(std::move(options))
        {
            Details::validate(options_);
        }

        GeneratorImpl(std::int64_t latent_vector_size, std::int64_t feature_map, std::int64_t num_channels, bool conditional = false)
            : GeneratorImpl(GeneratorOptions{.latent_vector_size = latent_vector_size,
                                             .feature_map = feature_map,
                                             .channels = num_channels,
                                             .conditional = conditional})
        {}

        void build()
        {
            assemble(Topology::generator(options_), options_.conditional ? "context encoder" : "DCGAN decoder");
        }

        [[nodiscard]] std::vector<std::int64_t> input_shape() const override { return Topology::input_shape(options_); }

        [[nodiscard]] const GeneratorOptions& options() const noexcept { return options_; }
        [[nodiscard]] std::int64_t latent_vector_size() const noexcept { return options_.latent_vector_size; }
        [[nodiscard]] std::int64_t feature_map() const noexcept { return options_.feature_map; }
        [[nodiscard]] std::int64_t channels() const noexcept { return options_.channels; }
        [[nodiscard]] bool conditional() const noexcept { return options_.conditional; }

    private:
        GeneratorOptions options_{};
    };

    TORCH_MODULE(Generator);

}

#endif // INPAINT_NETWORK_GENERATOR_HPP
