#ifndef INPAINT_INITIALIZATION_APPLY_HPP
#define INPAINT_INITIALIZATION_APPLY_HPP
#include <string>

#include <torch/torch.h>

#include "initialization.hpp"

namespace Inpaint::Initialization::Details {
    namespace detail {
        template <class Module>
        inline void zero_bias_if_present(const Module& module) {
            if constexpr (requires { module->bias; }) {
                if (module->bias.defined()) {
                    torch::nn::init::zeros_(module->bias);
                }
            }
        }

        inline torch::Tensor* find_parameter(torch::OrderedDict<std::string, torch::Tensor>& parameters,
                                             const std::string& key) {
            auto* parameter = parameters.find(key);
            if (parameter == nullptr || !parameter->defined()) {
                return nullptr;
            }
            return parameter;
        }
    }  // namespace detail

    // Class-name keyed DCGAN policy. Meant for torch::nn::Module::apply, so every
    // submodule of a network gets visited once.
    inline void apply_by_class_name(torch::nn::Module& module) {
        const auto& class_name = module.name();
        auto parameters = module.named_parameters(/*recurse=*/false);
        torch::NoGradGuard no_grad;

        if (class_name.find("Conv") != std::string::npos) {
            if (auto* weight = detail::find_parameter(parameters, "weight")) {
                torch::nn::init::normal_(*weight, kDcganMean, kDcganStd);
            }
        } else if (class_name.find("BatchNorm") != std::string::npos) {
            if (auto* weight = detail::find_parameter(parameters, "weight")) {
                torch::nn::init::normal_(*weight, kDcganScaleMean, kDcganStd);
            }
            if (auto* bias = detail::find_parameter(parameters, "bias")) {
                torch::nn::init::constant_(*bias, 0.0);
            }
        }
    }

    template <class Module, class Descriptor>
    inline void apply_module_initialization(const Module& module, const Descriptor& descriptor) {
        const auto type = descriptor.initialization.type;

        switch (type) {
            case ::Inpaint::Initialization::Type::DCGAN:
                apply_by_class_name(*module.ptr());
                break;
            case ::Inpaint::Initialization::Type::XavierNormal:
                if (module->weight.defined() && module->weight.dim() >= 2) {
                    torch::nn::init::xavier_normal_(module->weight);
                }
                detail::zero_bias_if_present(module);
                break;
            case ::Inpaint::Initialization::Type::KaimingNormal:
                if (module->weight.defined() && module->weight.dim() >= 2) {
                    torch::nn::init::kaiming_normal_(module->weight,
                                                     /*a=*/0.0,
                                                     torch::kFanIn,
                                                     torch::kReLU);
                }
                detail::zero_bias_if_present(module);
                break;
            case ::Inpaint::Initialization::Type::ZeroBias:
                detail::zero_bias_if_present(module);
                break;
            case ::Inpaint::Initialization::Type::Default:
            default:
                break;
        }
    }

    [[nodiscard]] constexpr const char* to_string(::Inpaint::Initialization::Type type) noexcept {
        switch (type) {
            case ::Inpaint::Initialization::Type::DCGAN: return "dcgan";
            case ::Inpaint::Initialization::Type::XavierNormal: return "xavier_normal";
            case ::Inpaint::Initialization::Type::KaimingNormal: return "kaiming_normal";
            case ::Inpaint::Initialization::Type::ZeroBias: return "zero_bias";
            case ::Inpaint::Initialization::Type::Default:
            default: return "default";
        }
    }
}
#endif // INPAINT_INITIALIZATION_APPLY_HPP
