#ifndef INPAINT_NETWORK_TOPOLOGY_HPP
#define INPAINT_NETWORK_TOPOLOGY_HPP
/*
 * Hard-coded layer stacks of the two networks.
 * ---------------------------------------------------------------------------
 *  - DCGAN generator: latent (N x z x 1 x 1) -> image (N x c x 64 x 64).
 *  - Context encoder: context (N x c x 128 x 128) -> bottleneck (N x b x 1 x 1)
 *    -> patch (N x c x 64 x 64).
 *  - Discriminator: image (N x c x 64 x 64) -> probability (N x 1 x 1 x 1).
 * Every stride-2 stage halves (encoder) or doubles (decoder) the extent with
 * k4 / s2 / p1 kernels.
 */

#include <cstdint>
#include <vector>

#include "../activation/activation.hpp"
#include "../layer/layer.hpp"
#include "options.hpp"

namespace Inpaint::Network::Topology {
    namespace Details {
        inline constexpr std::int64_t kKernel = 4;

        [[nodiscard]] inline auto down(std::int64_t in, std::int64_t out, bool bias,
                                       ::Inpaint::Initialization::Descriptor initialization) -> ::Inpaint::Layer::Descriptor {
            return ::Inpaint::Layer::Conv2d({in, out, kKernel, 2, 1, bias}, ::Inpaint::Activation::Identity, initialization);
        }

        [[nodiscard]] inline auto up(std::int64_t in, std::int64_t out, bool bias,
                                     ::Inpaint::Initialization::Descriptor initialization) -> ::Inpaint::Layer::Descriptor {
            return ::Inpaint::Layer::ConvTranspose2d({in, out, kKernel, 2, 1, 0, bias}, ::Inpaint::Activation::Identity, initialization);
        }

        [[nodiscard]] inline auto norm(std::int64_t features, ::Inpaint::Activation::Descriptor activation,
                                       ::Inpaint::Initialization::Descriptor initialization) -> ::Inpaint::Layer::Descriptor {
            return ::Inpaint::Layer::BatchNorm2d({features}, activation, initialization);
        }

    }

    [[nodiscard]] inline std::vector<::Inpaint::Layer::Descriptor> dcgan_generator(const GeneratorOptions& options)
    {
        using namespace Details;
        namespace Layer = ::Inpaint::Layer;
        namespace Activation = ::Inpaint::Activation;
        const auto fm = options.feature_map;
        const auto init = options.initialization;

        return {
            // latent -> (fm*8) x 4 x 4
            Layer::ConvTranspose2d({options.latent_vector_size, fm * 8, kKernel, 1, 0, 0, false}, Activation::Identity, init),
            norm(fm * 8, Activation::ReLU, init),
            // (fm*4) x 8 x 8
            up(fm * 8, fm * 4, false, init),
            norm(fm * 4, Activation::ReLU, init),
            // (fm*2) x 16 x 16
            up(fm * 4, fm * 2, false, init),
            norm(fm * 2, Activation::ReLU, init),
            // fm x 32 x 32
            up(fm * 2, fm, false, init),
            norm(fm, Activation::ReLU, init),
            // channels x 64 x 64
            Layer::ConvTranspose2d({fm, options.channels, kKernel, 2, 1, 0, false}, Activation::Tanh, init),
        };
    }

    [[nodiscard]] inline std::vector<::Inpaint::Layer::Descriptor> context_encoder(const GeneratorOptions& options)
    {
        using namespace Details;
        namespace Layer = ::Inpaint::Layer;
        namespace Activation = ::Inpaint::Activation;
        const auto fm = options.feature_map;
        const auto bottleneck = options.bottleneck_channels;
        const auto init = options.initialization;

        return {
            // Encoder: channels x 128 x 128 -> fm x 64 x 64
            Layer::Conv2d({options.channels, fm, kKernel, 2, 1, true}, Activation::LeakyReLU, init),
            // fm x 32 x 32
            down(fm, fm, true, init),
            norm(fm, Activation::LeakyReLU, init),
            // (fm*2) x 16 x 16
            down(fm, fm * 2, true, init),
            norm(fm * 2, Activation::LeakyReLU, init),
            // (fm*4) x 8 x 8
            down(fm * 2, fm * 4, true, init),
            norm(fm * 4, Activation::LeakyReLU, init),
            // (fm*8) x 4 x 4
            down(fm * 4, fm * 8, true, init),
            norm(fm * 8, Activation::LeakyReLU, init),

            // Bottleneck: b x 1 x 1
            Layer::Conv2d({fm * 8, bottleneck, kKernel, 1, 0, true}, Activation::Identity, init),
            norm(bottleneck, Activation::ReLU, init),

            // Decoder: (fm*8) x 4 x 4
            Layer::ConvTranspose2d({bottleneck, fm * 8, kKernel, 1, 0, 0, true}, Activation::Identity, init),
            norm(fm * 8, Activation::ReLU, init),
            // (fm*4) x 8 x 8
            up(fm * 8, fm * 4, true, init),
            norm(fm * 4, Activation::ReLU, init),
            // (fm*2) x 16 x 16
            up(fm * 4, fm * 2, true, init),
            norm(fm * 2, Activation::ReLU, init),
            // fm x 32 x 32
            up(fm * 2, fm, true, init),
            norm(fm, Activation::ReLU, init),
            // channels x 64 x 64
            Layer::ConvTranspose2d({fm, options.channels, kKernel, 2, 1, 0, true}, Activation::Tanh, init),
        };
    }

    [[nodiscard]] inline std::vector<::Inpaint::Layer::Descriptor> generator(const GeneratorOptions& options)
    {
        return options.conditional ? context_encoder(options) : dcgan_generator(options);
    }

    [[nodiscard]] inline std::vector<::Inpaint::Layer::Descriptor> discriminator(const DiscriminatorOptions& options)
    {
        using namespace Details;
        namespace Layer = ::Inpaint::Layer;
        namespace Activation = ::Inpaint::Activation;
        const auto fm = options.feature_map;
        const bool bias = options.conditional;
        const auto init = options.initialization;

        return {
            // channels x 64 x 64 -> fm x 32 x 32
            Layer::Conv2d({options.channels, fm, kKernel, 2, 1, bias}, Activation::LeakyReLU, init),
            // (fm*2) x 16 x 16
            down(fm, fm * 2, bias, init),
            norm(fm * 2, Activation::LeakyReLU, init),
            // (fm*4) x 8 x 8
            down(fm * 2, fm * 4, bias, init),
            norm(fm * 4, Activation::LeakyReLU, init),
            // (fm*8) x 4 x 4
            down(fm * 4, fm * 8, bias, init),
            norm(fm * 8, Activation::LeakyReLU, init),
            // 1 x 1 x 1
            Layer::Conv2d({fm * 8, 1, kKernel, 1, 0, bias}, Activation::Sigmoid, init),
        };
    }

    // Shape of one input sample (without the batch dimension).
    [[nodiscard]] inline std::vector<std::int64_t> input_shape(const GeneratorOptions& options)
    {
        if (options.conditional) {
            return {options.channels, kContextExtent, kContextExtent};
        }
        return {options.latent_vector_size, 1, 1};
    }

    [[nodiscard]] inline std::vector<std::int64_t> input_shape(const DiscriminatorOptions& options)
    {
        return {options.channels, kImageExtent, kImageExtent};
    }
}

#endif // INPAINT_NETWORK_TOPOLOGY_HPP
