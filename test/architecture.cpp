#include <cmath>
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>

#include <torch/torch.h>

#include "../include/Inpaint.h"
#include "expect.hpp"

namespace SaveLoad = Inpaint::Common::SaveLoad;

int main()
{
    Inpaint::Test::Expect expect("architecture");
    const auto directory = std::filesystem::temp_directory_path() / "inpaint_architecture_test";

    Inpaint::Network::Generator generator(Inpaint::Network::GeneratorOptions{
        .feature_map = 4, .conditional = true, .bottleneck_channels = 8});
    expect.throws<std::logic_error>([&] { (void)SaveLoad::serialize_architecture(generator); },
                                    "export before build throws");
    generator->build();

    {
        const auto tree = SaveLoad::serialize_architecture(generator);
        expect.that(tree.get<std::string>("name") == "Generator", "network name is exported");
        expect.that(tree.get<bool>("options.conditional"), "options are exported");
        expect.that(tree.get<std::int64_t>("options.bottleneck_channels") == 8, "bottleneck width is exported");
        expect.that(tree.get_child("input_shape").size() == 3, "input shape has three extents");
        expect.that(tree.get_child("layers").size() == generator->main()->size(), "one entry per layer");

        const auto& first = tree.get_child("layers").front().second;
        expect.that(first.get<std::string>("type") == "conv2d", "first layer is a convolution");
        expect.that(first.get<std::string>("activation.type") == "LeakyReLU", "first activation is LeakyReLU");
        expect.that(std::abs(first.get<double>("activation.negative_slope") - 0.2) < 1e-9, "slope is exported");
        expect.that(first.get<bool>("options.bias"), "context encoder bias is exported");

        const auto& last = tree.get_child("layers").back().second;
        expect.that(last.get<std::string>("type") == "conv_transpose2d", "last layer is a transpose convolution");
    }

    {
        Inpaint::Network::Discriminator discriminator(100, 4, 3);
        discriminator->build();
        const auto path = directory / "nested" / "discriminator.json";
        SaveLoad::save_architecture(discriminator, path);
        expect.that(std::filesystem::exists(path), "architecture file is written");

        const auto tree = SaveLoad::read_json_file(path);
        expect.that(tree.get<std::string>("name") == "Discriminator", "file holds the discriminator");
        expect.that(!tree.get<bool>("options.conditional"), "unconditional flag survives the file");
        expect.that(!tree.get_child_optional("options.bottleneck_channels"), "discriminator has no bottleneck");
        expect.that(tree.get_child("layers").size() == 8, "file lists every layer");
        expect.that(tree.get_child("layers").front().second.get<std::string>("initialization") == "default",
                    "initialization is recorded per layer");
    }

    expect.throws<std::invalid_argument>([&] { SaveLoad::save_architecture(generator, std::filesystem::path{}); },
                                         "empty path is rejected");

    std::filesystem::remove_all(directory);
    return expect.report();
}
