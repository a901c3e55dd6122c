#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

#include <torch/torch.h>

#include "../include/Inpaint.h"
#include "expect.hpp"

namespace {
    bool convolutions_have_bias(Inpaint::Network::Generator& generator)
    {
        bool all_biased = true;
        for (const auto& layer : generator->main()->layers()) {
            if (auto conv = std::dynamic_pointer_cast<torch::nn::ConvTranspose2dImpl>(layer.module)) {
                all_biased = all_biased && conv->bias.defined();
            } else if (auto conv2d = std::dynamic_pointer_cast<torch::nn::Conv2dImpl>(layer.module)) {
                all_biased = all_biased && conv2d->bias.defined();
            }
        }
        return all_biased;
    }

    bool no_convolution_has_bias(Inpaint::Network::Generator& generator)
    {
        for (const auto& layer : generator->main()->layers()) {
            if (auto conv = std::dynamic_pointer_cast<torch::nn::ConvTranspose2dImpl>(layer.module)) {
                if (conv->bias.defined()) {
                    return false;
                }
            }
        }
        return true;
    }
}

int main()
{
    torch::manual_seed(7);
    Inpaint::Test::Expect expect("generator");

    // DCGAN decoder: latent vector -> 64 x 64 image.
    {
        Inpaint::Network::Generator generator(100, 8, 3);
        expect.that(!generator->is_built(), "generator starts unbuilt");
        generator->build();
        expect.that(generator->is_built(), "build() creates main");
        expect.that(generator->main()->size() == 9, "DCGAN decoder has 5 transpose convolutions and 4 batch norms");
        expect.that(no_convolution_has_bias(generator), "DCGAN transpose convolutions carry no bias");

        const auto images = generator->forward(torch::randn({2, 100, 1, 1}));
        expect.shape(images, {2, 3, 64, 64}, "DCGAN output shape");
        expect.that(images.min().item<float>() >= -1.0F && images.max().item<float>() <= 1.0F,
                    "tanh output lies in [-1, 1]");

        expect.that(generator->input_shape() == std::vector<std::int64_t>{100, 1, 1}, "DCGAN input shape");
        expect.throws_kind<c10::Error>([&] { (void)generator->forward(torch::randn({2, 3, 64, 64})); },
                                  "image-shaped input is rejected by the DCGAN decoder");
    }

    // Context encoder: 128 x 128 context -> 64 x 64 patch.
    {
        Inpaint::Network::Generator generator(Inpaint::Network::GeneratorOptions{
            .latent_vector_size = 100,
            .feature_map = 4,
            .channels = 3,
            .conditional = true,
            .bottleneck_channels = 16});
        generator->build();
        expect.that(generator->main()->size() == 20, "context encoder has 20 layers");
        expect.that(convolutions_have_bias(generator), "context encoder convolutions carry a bias");
        expect.that(generator->input_shape() == std::vector<std::int64_t>{3, 128, 128}, "context encoder input shape");

        const auto patch = generator->forward(torch::rand({2, 3, 128, 128}) * 2.0 - 1.0);
        expect.shape(patch, {2, 3, 64, 64}, "context encoder output shape");

        const auto traces = generator->trace(1);
        expect.that(traces.size() == generator->main()->size(), "trace covers every layer");
        if (traces.size() == 20) {
            expect.that(traces[10].output_shape == std::vector<std::int64_t>{1, 16, 1, 1}, "bottleneck is 1 x 1");
            expect.that(traces[12].output_shape == std::vector<std::int64_t>{1, 32, 4, 4}, "decoder restarts at 4 x 4");
        }
        expect.that(generator->is_training(), "trace restores training mode");
    }

    // Misuse ordering.
    {
        Inpaint::Network::Generator generator(100, 8, 3);
        expect.throws<std::logic_error>([&] { (void)generator->forward(torch::randn({1, 100, 1, 1})); },
                                        "forward before build throws");
        expect.throws<std::logic_error>([&] { generator->define_optim(2e-4, 0.5); },
                                        "define_optim before build throws");
        expect.throws<std::invalid_argument>([] { Inpaint::Network::Generator invalid(0, 64, 3); },
                                             "zero latent size is rejected");
        expect.throws<std::invalid_argument>([] {
            Inpaint::Network::Generator invalid(Inpaint::Network::GeneratorOptions{.conditional = true, .bottleneck_channels = 0});
        }, "zero bottleneck is rejected for the context encoder");
    }

    // Rebuilding replaces the stack and drops the optimizer.
    {
        Inpaint::Network::Generator generator(100, 8, 3);
        generator->build();
        const auto first_weight = generator->main()->parameters().front();
        generator->define_optim(2e-4, 0.5);
        expect.that(generator->has_optimizer(), "optimizer defined");

        generator->build();
        expect.that(!generator->has_optimizer(), "rebuild drops the optimizer");
        const auto second_weight = generator->main()->parameters().front();
        expect.that(!first_weight.is_same(second_weight), "rebuild creates fresh parameters");
        expect.that(generator->parameters().size() == generator->main()->parameters().size(),
                    "old stack is no longer registered");
    }

    // Monitoring and summary output.
    {
        std::ostringstream log;
        Inpaint::Network::Generator generator(Inpaint::Network::GeneratorOptions{
            .feature_map = 8, .monitor = true, .stream = &log});
        generator->build();
        generator->define_optim(2e-4, 0.5);
        expect.that(log.str().find("DCGAN decoder") != std::string::npos, "build is logged when monitoring");
        expect.that(log.str().find("optimizer bound") != std::string::npos, "optimizer binding is logged");

        std::ostringstream summary;
        generator->summary(summary);
        expect.that(summary.str().find("Total parameters") != std::string::npos, "summary reports parameter count");
        expect.that(summary.str().find("(1 x 3 x 64 x 64)") != std::string::npos, "summary lists the output shape");
    }

    return expect.report();
}
