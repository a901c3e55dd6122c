#ifndef INPAINT_NETWORK_DISCRIMINATOR_HPP
#define INPAINT_NETWORK_DISCRIMINATOR_HPP

#include <cstdint>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "details/stacked.hpp"
#include "options.hpp"
#include "topology.hpp"

namespace Inpaint::Network {

    // Discriminator part of the DCGAN model: 64 x 64 image -> real/fake probability.
    class DiscriminatorImpl : public Details::StackedNetworkImpl {
    public:
        explicit DiscriminatorImpl(DiscriminatorOptions options)
            : Details::StackedNetworkImpl("Discriminator", options.monitor, options.stream), options_(std::move(options))
        {
            Details::validate(options_);
        }

        DiscriminatorImpl(std::int64_t latent_vector_size, std::int64_t feature_map, std::int64_t num_channels, bool conditional = false)
            : DiscriminatorImpl(DiscriminatorOptions{.latent_vector_size = latent_vector_size,
                                                     .feature_map = feature_map,
                                                     .channels = num_channels,
                                                     .conditional = conditional})
        {}

        void build()
        {
            assemble(Topology::discriminator(options_), options_.conditional ? "biased classifier" : "classifier");
        }

        [[nodiscard]] std::vector<std::int64_t> input_shape() const override { return Topology::input_shape(options_); }

        [[nodiscard]] const DiscriminatorOptions& options() const noexcept { return options_; }
        [[nodiscard]] std::int64_t latent_vector_size() const noexcept { return options_.latent_vector_size; }
        [[nodiscard]] std::int64_t feature_map() const noexcept { return options_.feature_map; }
        [[nodiscard]] std::int64_t channels() const noexcept { return options_.channels; }
        [[nodiscard]] bool conditional() const noexcept { return options_.conditional; }

    private:
        DiscriminatorOptions options_{};
    };

    TORCH_MODULE(Discriminator);

}

#endif // INPAINT_NETWORK_DISCRIMINATOR_HPP
