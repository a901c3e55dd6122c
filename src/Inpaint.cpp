// Demo: builds a generator / discriminator pair from an optional JSON config,
// prints both summaries and writes a grid of untrained samples.
//
//   inpaint_demo [config.json] [output_dir]

#include <cstdint>
#include <exception>
#include <filesystem>
#include <iostream>
#include <string>

#include <torch/torch.h>

#include "../include/Inpaint.h"

int main(int argc, char** argv)
{
    namespace Config = Inpaint::Common::Config;
    namespace Terminal = Inpaint::Utils::Terminal;

    const std::filesystem::path output_dir = argc > 2 ? argv[2] : "inpaint_output";

    try {
        if (argc < 2) {
            Terminal::Warning(std::cout, "No configuration file given; using defaults.");
        }
        const auto config = argc > 1 ? Config::read(argv[1]) : Config::GanConfig{};
        Terminal::Info(std::cout, "Configuration '" + config.name + "'"
                                  + (config.conditional ? " (context encoder)" : " (DCGAN)"));

        Inpaint::Network::Generator generator(Config::generator_options(config, true));
        Inpaint::Network::Discriminator discriminator(Config::discriminator_options(config, true));
        generator->build();
        discriminator->build();

        generator->summary(std::cout);
        discriminator->summary(std::cout);

        generator->define_optim(Config::optimizer(config));
        discriminator->define_optim(config.learning_rate, config.beta1);

        std::filesystem::create_directories(output_dir);
        Inpaint::Common::SaveLoad::save_architecture(generator, output_dir / "generator.json");
        Inpaint::Common::SaveLoad::save_architecture(discriminator, output_dir / "discriminator.json");
        Config::write(output_dir / "config.json", config);

        torch::NoGradGuard no_grad;
        generator->eval();
        discriminator->eval();

        constexpr std::int64_t kSamples = 16;
        torch::Tensor images;
        if (config.conditional) {
            const auto context = torch::rand({kSamples, config.channels,
                                              Inpaint::Network::kContextExtent,
                                              Inpaint::Network::kContextExtent}) * 2.0 - 1.0;
            images = generator->forward(context);
            Inpaint::Preview::write_grid(output_dir / "inpainted.png",
                                         Inpaint::Preview::compose_inpainting(context, images), 4);
        } else {
            images = generator->forward(torch::randn({kSamples, config.latent_vector_size, 1, 1}));
        }
        Inpaint::Preview::write_grid(output_dir / "samples.png", images, 4);

        const auto scores = discriminator->forward(images);
        Terminal::Info(std::cout, "Mean discriminator score on samples: "
                                  + std::to_string(scores.mean().item<double>()));
        Terminal::Success(std::cout, "Wrote samples to '" + output_dir.string() + "'");
    } catch (const std::exception& error) {
        Terminal::Failure(std::cerr, error.what());
        return 1;
    }
    return 0;
}
