#ifndef INPAINT_OPTIMIZER_REGISTRY_HPP
#define INPAINT_OPTIMIZER_REGISTRY_HPP

#include <memory>
#include <stdexcept>
#include <variant>

#include <torch/torch.h>

#include "details/adam.hpp"
#include "details/sgd.hpp"

namespace Inpaint::Optimizer::Details {
    template <class Owner, class Descriptor>
    std::unique_ptr<torch::optim::Optimizer> build_optimizer(Owner&, const Descriptor&) {
        static_assert(sizeof(Descriptor) == 0, "Unsupported optimizer descriptor provided to build_optimizer.");
        return nullptr;
    }

    namespace detail {
        inline void validate_learning_rate(double learning_rate) {
            if (!(learning_rate > 0.0)) {
                throw std::invalid_argument("Optimizer learning rate must be positive.");
            }
        }

        inline void validate_betas(double beta1, double beta2) {
            if (beta1 < 0.0 || beta1 >= 1.0 || beta2 < 0.0 || beta2 >= 1.0) {
                throw std::invalid_argument("Adam betas must lie in [0, 1).");
            }
        }
    }

    template <class Owner>
    std::unique_ptr<torch::optim::Optimizer> build_optimizer(Owner& owner, const SGDDescriptor& descriptor) {
        detail::validate_learning_rate(descriptor.options.learning_rate);
        auto options = to_torch_options(descriptor.options);
        return std::make_unique<torch::optim::SGD>(owner.parameters(), options);
    }

    template <class Owner>
    std::unique_ptr<torch::optim::Optimizer> build_optimizer(Owner& owner, const AdamDescriptor& descriptor) {
        detail::validate_learning_rate(descriptor.options.learning_rate);
        detail::validate_betas(descriptor.options.beta1, descriptor.options.beta2);
        auto options = to_torch_options(descriptor.options);
        return std::make_unique<torch::optim::Adam>(owner.parameters(), options);
    }

    template <class Owner>
    std::unique_ptr<torch::optim::Optimizer> build_optimizer(Owner& owner, const AdamWDescriptor& descriptor) {
        detail::validate_learning_rate(descriptor.options.learning_rate);
        detail::validate_betas(descriptor.options.beta1, descriptor.options.beta2);
        auto options = to_torch_options(descriptor.options);
        return std::make_unique<torch::optim::AdamW>(owner.parameters(), options);
    }

    template <class Owner, class... DescriptorTypes>
    std::unique_ptr<torch::optim::Optimizer> build_optimizer(Owner& owner, const std::variant<DescriptorTypes...>& descriptor) {
        return std::visit(
            [&](const auto& concrete_descriptor) {
                return build_optimizer(owner, concrete_descriptor);
            },
            descriptor);
    }
}

#endif // INPAINT_OPTIMIZER_REGISTRY_HPP
