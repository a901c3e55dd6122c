#include <cmath>
#include <memory>
#include <string>

#include <torch/torch.h>

#include "../include/Inpaint.h"
#include "expect.hpp"

namespace {
    struct Statistics {
        int convolutions{0};
        int batch_norms{0};
        bool conv_std_ok{true};
        bool conv_mean_ok{true};
        bool scale_ok{true};
        bool shift_zero{true};
    };

    Statistics inspect(const Inpaint::Block::SequentialModule& stack)
    {
        Statistics statistics;
        for (const auto& layer : stack->layers()) {
            if (std::dynamic_pointer_cast<torch::nn::ConvTranspose2dImpl>(layer.module)
                || std::dynamic_pointer_cast<torch::nn::Conv2dImpl>(layer.module)) {
                const auto weight = layer.module->named_parameters(false)["weight"];
                ++statistics.convolutions;
                statistics.conv_std_ok = statistics.conv_std_ok && std::abs(weight.std().item<double>() - 0.02) < 0.004;
                statistics.conv_mean_ok = statistics.conv_mean_ok && std::abs(weight.mean().item<double>()) < 0.004;
            } else if (auto norm = std::dynamic_pointer_cast<torch::nn::BatchNorm2dImpl>(layer.module)) {
                ++statistics.batch_norms;
                statistics.scale_ok = statistics.scale_ok && std::abs(norm->weight.mean().item<double>() - 1.0) < 0.02;
                statistics.shift_zero = statistics.shift_zero && norm->bias.abs().max().item<double>() == 0.0;
            }
        }
        return statistics;
    }
}

int main()
{
    torch::manual_seed(3);
    Inpaint::Test::Expect expect("initialization");

    expect.that(torch::nn::Conv2d(torch::nn::Conv2dOptions(1, 1, 3))->name().find("Conv") != std::string::npos,
                "convolution class name contains Conv");
    expect.that(torch::nn::BatchNorm2d(4)->name().find("BatchNorm") != std::string::npos,
                "batch norm class name contains BatchNorm");

    // init_weights through Module::apply.
    {
        Inpaint::Network::Generator generator(100, 32, 3);
        generator->build();
        generator->apply(Inpaint::Network::GeneratorImpl::init_weights);

        const auto statistics = inspect(generator->main());
        expect.that(statistics.convolutions == 5 && statistics.batch_norms == 4, "all layers inspected");
        expect.that(statistics.conv_std_ok, "convolution weights have std 0.02");
        expect.that(statistics.conv_mean_ok, "convolution weights have mean 0");
        expect.that(statistics.scale_ok, "batch norm scales have mean 1");
        expect.that(statistics.shift_zero, "batch norm shifts are zero");
    }

    {
        Inpaint::Network::Discriminator discriminator(100, 32, 3);
        discriminator->build();
        discriminator->initialize_weights();
        const auto statistics = inspect(discriminator->main());
        expect.that(statistics.conv_std_ok && statistics.shift_zero, "initialize_weights applies the DCGAN policy");
    }

    // DCGAN initialization requested per layer at build time.
    {
        Inpaint::Network::Discriminator discriminator(Inpaint::Network::DiscriminatorOptions{
            .feature_map = 32, .initialization = Inpaint::Initialization::DCGAN});
        discriminator->build();
        const auto statistics = inspect(discriminator->main());
        expect.that(statistics.conv_std_ok && statistics.scale_ok && statistics.shift_zero,
                    "build-time DCGAN initialization matches init_weights");
    }

    // Modules outside the policy are left untouched.
    {
        torch::nn::Linear linear(8, 8);
        const auto before = linear->weight.clone();
        linear->apply(Inpaint::Network::DiscriminatorImpl::init_weights);
        expect.that(torch::equal(before, linear->weight), "linear weights are untouched");
    }

    // Xavier / Kaiming skip one-dimensional batch norm scales.
    {
        Inpaint::Block::SequentialModule stack(Inpaint::Block::Sequential({
            Inpaint::Layer::Conv2d({3, 4, 3, 1, 1, true}, Inpaint::Activation::ReLU, Inpaint::Initialization::KaimingNormal),
            Inpaint::Layer::BatchNorm2d({4}, Inpaint::Activation::Identity, Inpaint::Initialization::XavierNormal),
        }));
        const auto conv = std::dynamic_pointer_cast<torch::nn::Conv2dImpl>(stack->layers().front().module);
        expect.that(conv && conv->bias.abs().max().item<double>() == 0.0, "Kaiming zeroes the bias");
        const auto norm = std::dynamic_pointer_cast<torch::nn::BatchNorm2dImpl>(stack->layers().back().module);
        expect.that(norm && torch::equal(norm->weight, torch::ones({4})), "Xavier leaves 1-D scales alone");
        expect.that(norm && norm->bias.abs().max().item<double>() == 0.0, "Xavier zeroes the batch norm shift");
    }

    // DCGAN requested on single layers of a block.
    {
        Inpaint::Block::SequentialModule stack(Inpaint::Block::Sequential({
            Inpaint::Layer::Conv2d({16, 64, 4, 2, 1, true}, Inpaint::Activation::LeakyReLU, Inpaint::Initialization::DCGAN),
            Inpaint::Layer::BatchNorm2d({64}, Inpaint::Activation::LeakyReLU, Inpaint::Initialization::DCGAN),
        }));
        const auto statistics = inspect(stack);
        expect.that(statistics.convolutions == 1 && statistics.batch_norms == 1, "both DCGAN layers are built");
        expect.that(statistics.conv_std_ok && statistics.conv_mean_ok, "DCGAN convolution weights follow N(0, 0.02)");
        expect.that(statistics.scale_ok && statistics.shift_zero, "DCGAN batch norm follows N(1, 0.02) / 0");
        expect.shape(stack->forward(torch::randn({2, 16, 8, 8})), {2, 64, 4, 4}, "DCGAN-initialised block runs");
    }

    // ZeroBias keeps the libtorch weight and clears the bias.
    {
        torch::manual_seed(21);
        torch::nn::Conv2d reference(torch::nn::Conv2dOptions(3, 8, 4));
        torch::manual_seed(21);
        Inpaint::Block::SequentialModule stack(Inpaint::Block::Sequential({
            Inpaint::Layer::Conv2d({3, 8, 4, 1, 0, true}, Inpaint::Activation::Identity, Inpaint::Initialization::ZeroBias),
        }));
        const auto conv = std::dynamic_pointer_cast<torch::nn::Conv2dImpl>(stack->layers().front().module);
        expect.that(conv != nullptr, "ZeroBias layer is a convolution");
        if (conv) {
            expect.that(torch::equal(conv->weight, reference->weight), "ZeroBias keeps the default weight");
            expect.that(reference->bias.abs().max().item<double>() > 0.0, "default bias is not zero");
            expect.that(conv->bias.abs().max().item<double>() == 0.0, "ZeroBias clears the bias");
        }
    }

    return expect.report();
}
