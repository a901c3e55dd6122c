#ifndef INPAINT_ACTIVATION_APPLY_HPP
#define INPAINT_ACTIVATION_APPLY_HPP

#include <torch/torch.h>

#include <utility>

#include "activation.hpp"
#include "details/leaky_relu.hpp"
#include "details/relu.hpp"
#include "details/sigmoid.hpp"
#include "details/tanh.hpp"

namespace Inpaint::Activation::Details {
    inline torch::Tensor apply(const ::Inpaint::Activation::Descriptor& descriptor, torch::Tensor input) {
        switch (descriptor.type) {
            case ::Inpaint::Activation::Type::ReLU:
                return ReLU{}(std::move(input));
            case ::Inpaint::Activation::Type::LeakyReLU:
                return LeakyReLU{descriptor.negative_slope}(std::move(input));
            case ::Inpaint::Activation::Type::Tanh:
                return Tanh{}(std::move(input));
            case ::Inpaint::Activation::Type::Sigmoid:
                return Sigmoid{}(std::move(input));
            case ::Inpaint::Activation::Type::Identity:
            default:
                return input;
        }
    }
}
#endif // INPAINT_ACTIVATION_APPLY_HPP
