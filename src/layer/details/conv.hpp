#ifndef INPAINT_CONV_HPP
#define INPAINT_CONV_HPP
#include <cstdint>
#include <stdexcept>
#include <string>

#include <torch/torch.h>

#include "../../activation/activation.hpp"
#include "../../initialization/initialization.hpp"
#include "../../initialization/apply.hpp"
#include "../registry.hpp"

namespace Inpaint::Layer::Details {

    // Square kernels only: every DCGAN stage uses k x k filters with a shared stride/padding.
    struct Conv2dOptions {
        std::int64_t in_channels{};
        std::int64_t out_channels{};
        std::int64_t kernel_size{4};
        std::int64_t stride{1};
        std::int64_t padding{0};
        bool bias{true};
    };

    struct Conv2dDescriptor {
        Conv2dOptions options{};
        ::Inpaint::Activation::Descriptor activation{::Inpaint::Activation::Identity};
        ::Inpaint::Initialization::Descriptor initialization{::Inpaint::Initialization::Default};
    };

    struct ConvTranspose2dOptions {
        std::int64_t in_channels{};
        std::int64_t out_channels{};
        std::int64_t kernel_size{4};
        std::int64_t stride{1};
        std::int64_t padding{0};
        std::int64_t output_padding{0};
        bool bias{true};
    };

    struct ConvTranspose2dDescriptor {
        ConvTranspose2dOptions options{};
        ::Inpaint::Activation::Descriptor activation{::Inpaint::Activation::Identity};
        ::Inpaint::Initialization::Descriptor initialization{::Inpaint::Initialization::Default};
    };

    namespace detail {
        template <class Options>
        inline void validate_convolution(const Options& options, const char* layer)
        {
            if (options.in_channels <= 0 || options.out_channels <= 0) {
                throw std::invalid_argument(std::string(layer) + " layers require positive channel counts.");
            }
            if (options.kernel_size <= 0) {
                throw std::invalid_argument(std::string(layer) + " layers require a positive kernel size.");
            }
            if (options.stride <= 0) {
                throw std::invalid_argument(std::string(layer) + " layers require a positive stride.");
            }
            if (options.padding < 0) {
                throw std::invalid_argument(std::string(layer) + " layers require a non-negative padding.");
            }
        }
    }

    template <class Owner>
    RegisteredLayer build_registered_layer(Owner& owner, const Conv2dDescriptor& descriptor, std::size_t index)
    {
        detail::validate_convolution(descriptor.options, "Conv2d");

        auto options = torch::nn::Conv2dOptions(descriptor.options.in_channels,
                                                descriptor.options.out_channels,
                                                descriptor.options.kernel_size)
                           .stride(descriptor.options.stride)
                           .padding(descriptor.options.padding)
                           .bias(descriptor.options.bias);

        auto module = owner.register_module("conv2d_" + std::to_string(index), torch::nn::Conv2d(options));
        ::Inpaint::Initialization::Details::apply_module_initialization(module, descriptor);

        RegisteredLayer registered_layer{};
        registered_layer.activation = descriptor.activation;
        registered_layer.module = to_shared_module_ptr(module);
        registered_layer.name = "conv2d_" + std::to_string(index);
        registered_layer.bind_module_forward(module.get());
        return registered_layer;
    }

    template <class Owner>
    RegisteredLayer build_registered_layer(Owner& owner, const ConvTranspose2dDescriptor& descriptor, std::size_t index)
    {
        detail::validate_convolution(descriptor.options, "ConvTranspose2d");
        if (descriptor.options.output_padding < 0 || descriptor.options.output_padding >= descriptor.options.stride) {
            throw std::invalid_argument("ConvTranspose2d output padding must be smaller than the stride.");
        }

        auto options = torch::nn::ConvTranspose2dOptions(descriptor.options.in_channels,
                                                         descriptor.options.out_channels,
                                                         descriptor.options.kernel_size)
                           .stride(descriptor.options.stride)
                           .padding(descriptor.options.padding)
                           .output_padding(descriptor.options.output_padding)
                           .bias(descriptor.options.bias);

        auto module = owner.register_module("conv_transpose2d_" + std::to_string(index), torch::nn::ConvTranspose2d(options));
        ::Inpaint::Initialization::Details::apply_module_initialization(module, descriptor);

        RegisteredLayer registered_layer{};
        registered_layer.activation = descriptor.activation;
        registered_layer.module = to_shared_module_ptr(module);
        registered_layer.name = "conv_transpose2d_" + std::to_string(index);
        registered_layer.bind_module_forward(module.get());
        return registered_layer;
    }

}

#endif //INPAINT_CONV_HPP
