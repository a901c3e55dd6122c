#ifndef INPAINT_LAYER_HPP
#define INPAINT_LAYER_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include <variant>

#include "details/batchnorm.hpp"
#include "details/conv.hpp"

#include "registry.hpp"

namespace Inpaint::Layer {
    using Conv2dOptions = Details::Conv2dOptions;
    using Conv2dDescriptor = Details::Conv2dDescriptor;

    using ConvTranspose2dOptions = Details::ConvTranspose2dOptions;
    using ConvTranspose2dDescriptor = Details::ConvTranspose2dDescriptor;

    using BatchNorm2dOptions = Details::BatchNorm2dOptions;
    using BatchNorm2dDescriptor = Details::BatchNorm2dDescriptor;

    using Descriptor = std::variant<Conv2dDescriptor,
                                    ConvTranspose2dDescriptor,
                                    BatchNorm2dDescriptor>;

    [[nodiscard]] inline auto Conv2d(const Conv2dOptions& options,
                                     ::Inpaint::Activation::Descriptor activation = ::Inpaint::Activation::Identity,
                                     ::Inpaint::Initialization::Descriptor initialization = ::Inpaint::Initialization::Default) -> Conv2dDescriptor {
        return {options, activation, initialization};
    }

    [[nodiscard]] inline auto ConvTranspose2d(const ConvTranspose2dOptions& options,
                                              ::Inpaint::Activation::Descriptor activation = ::Inpaint::Activation::Identity,
                                              ::Inpaint::Initialization::Descriptor initialization = ::Inpaint::Initialization::Default) -> ConvTranspose2dDescriptor {
        return {options, activation, initialization};
    }

    [[nodiscard]] inline auto BatchNorm2d(const BatchNorm2dOptions& options,
                                          ::Inpaint::Activation::Descriptor activation = ::Inpaint::Activation::Identity,
                                          ::Inpaint::Initialization::Descriptor initialization = ::Inpaint::Initialization::Default) -> BatchNorm2dDescriptor {
        return {options, activation, initialization};
    }
}

#endif //INPAINT_LAYER_HPP
