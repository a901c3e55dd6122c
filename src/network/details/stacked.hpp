#ifndef INPAINT_NETWORK_DETAILS_STACKED_HPP
#define INPAINT_NETWORK_DETAILS_STACKED_HPP

#include <cstdint>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../../block/block.hpp"
#include "../../initialization/apply.hpp"
#include "../../layer/layer.hpp"
#include "../../optimizer/optimizer.hpp"
#include "../../utils/summary.hpp"
#include "../../utils/terminal.hpp"

namespace Inpaint::Network::Details {

    // Shared body of the generator and the discriminator: one lazily built `main`
    // stack plus the optimizer bound to its parameters.
    class StackedNetworkImpl : public torch::nn::Module {
    public:
        [[nodiscard]] torch::Tensor forward(torch::Tensor input)
        {
            return require_main("forward")->forward(std::move(input));
        }

        // Adam with betas (beta1, 0.999).
        void define_optim(double learning_rate, double beta1)
        {
            define_optim(::Inpaint::Optimizer::Adam({.learning_rate = learning_rate, .beta1 = beta1, .beta2 = 0.999}));
        }

        void define_optim(const ::Inpaint::Optimizer::Descriptor& descriptor)
        {
            auto& main = require_main("define_optim");
            optimizer_ = ::Inpaint::Optimizer::Details::build_optimizer(*main, descriptor);
            if (monitor_ && stream_ != nullptr) {
                ::Inpaint::Utils::Terminal::Info(*stream_, label_ + ": optimizer bound to "
                                                 + std::to_string(main->parameters().size()) + " parameter tensors");
            }
        }

        // N(0, 0.02) for every *Conv* module weight, N(1, 0.02) / 0 for *BatchNorm* scale / shift.
        static void init_weights(torch::nn::Module& layers)
        {
            ::Inpaint::Initialization::Details::apply_by_class_name(layers);
        }

        void initialize_weights()
        {
            require_main("initialize_weights");
            apply(init_weights);
        }

        [[nodiscard]] bool is_built() const noexcept { return !main_.is_empty(); }
        [[nodiscard]] bool has_optimizer() const noexcept { return optimizer_ != nullptr; }

        [[nodiscard]] torch::optim::Optimizer& optimizer()
        {
            if (!optimizer_) {
                throw std::logic_error(label_ + ": define_optim() must be called before accessing the optimizer.");
            }
            return *optimizer_;
        }

        [[nodiscard]] ::Inpaint::Block::SequentialModule& main() { return require_main("main"); }

        [[nodiscard]] const std::string& label() const noexcept { return label_; }

        // Runs a zero sample of `input_shape()` through the stack in eval mode.
        [[nodiscard]] std::vector<::Inpaint::Block::LayerTrace> trace(std::int64_t batch_size = 1)
        {
            auto& main = require_main("trace");
            if (batch_size <= 0) {
                throw std::invalid_argument(label_ + ": trace batch size must be positive.");
            }

            std::vector<std::int64_t> shape{batch_size};
            const auto sample_shape = input_shape();
            shape.insert(shape.end(), sample_shape.begin(), sample_shape.end());

            auto options = torch::TensorOptions().dtype(torch::kFloat32);
            const auto parameters = main->parameters();
            if (!parameters.empty()) {
                options = parameters.front().options().requires_grad(false);
            }

            struct ModeGuard {
                torch::nn::Module& module;
                bool training;
                ~ModeGuard() { module.train(training); }
            } mode_guard{*this, is_training()};

            torch::NoGradGuard no_grad;
            eval();
            return main->trace(torch::zeros(shape, options));
        }

        void summary(std::ostream& stream)
        {
            ::Inpaint::Utils::Summary::print(stream, label_, input_shape(), trace());
        }

        [[nodiscard]] virtual std::vector<std::int64_t> input_shape() const = 0;

    protected:
        StackedNetworkImpl(std::string label, bool monitor, std::ostream* stream)
            : label_(std::move(label)), monitor_(monitor), stream_(stream)
        {}

        // Replaces `main` and drops any optimizer bound to the previous parameters.
        void assemble(std::vector<::Inpaint::Layer::Descriptor> layers, const std::string& topology)
        {
            ::Inpaint::Block::SequentialModule stack(::Inpaint::Block::Sequential(std::move(layers)));
            if (main_.is_empty()) {
                main_ = register_module("main", stack);
            } else {
                main_ = replace_module("main", stack);
            }
            optimizer_.reset();

            if (monitor_ && stream_ != nullptr) {
                std::int64_t parameter_count = 0;
                for (const auto& parameter : main_->parameters()) {
                    parameter_count += parameter.numel();
                }
                ::Inpaint::Utils::Terminal::Success(*stream_, label_ + ": built " + topology + " ("
                                                    + std::to_string(main_->size()) + " layers, "
                                                    + std::to_string(parameter_count) + " parameters)");
            }
        }

        ::Inpaint::Block::SequentialModule& require_main(const char* operation)
        {
            if (main_.is_empty()) {
                throw std::logic_error(label_ + ": build() must be called before " + operation + "().");
            }
            return main_;
        }

    private:
        ::Inpaint::Block::SequentialModule main_{nullptr};
        std::unique_ptr<torch::optim::Optimizer> optimizer_{};
        std::string label_{};
        bool monitor_{false};
        std::ostream* stream_{nullptr};
    };

}

#endif // INPAINT_NETWORK_DETAILS_STACKED_HPP
