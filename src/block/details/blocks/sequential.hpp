#ifndef INPAINT_BLOCK_DETAILS_SEQUENTIAL_HPP
#define INPAINT_BLOCK_DETAILS_SEQUENTIAL_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../../../activation/apply.hpp"
#include "../../../layer/layer.hpp"

namespace Inpaint::Block::Details {

    struct SequentialDescriptor {
        std::vector<::Inpaint::Layer::Descriptor> layers{};
    };

    // Output of one layer (activation included) while tracing a sample through the block.
    struct LayerTrace {
        std::string name{};
        std::string module{};
        std::string activation{};
        std::vector<std::int64_t> output_shape{};
        std::int64_t parameters{0};
    };

    class SequentialBlockModuleImpl : public torch::nn::Module {
    public:
        explicit SequentialBlockModuleImpl(SequentialDescriptor descriptor)
            : descriptors_(std::move(descriptor.layers))
        {
            std::size_t index{0};
            block_layers_.reserve(descriptors_.size());
            for (const auto& layer : descriptors_) {
                auto registered_layer = ::Inpaint::Layer::Details::build_registered_layer(*this, layer, index++);
                block_layers_.push_back(std::move(registered_layer));
            }
        }

        torch::Tensor forward(torch::Tensor input)
        {
            auto output = std::move(input);
            for (auto& layer : block_layers_) {
                output = layer.forward(std::move(output));
                output = ::Inpaint::Activation::Details::apply(layer.activation, std::move(output));
            }
            return output;
        }

        [[nodiscard]] std::vector<LayerTrace> trace(torch::Tensor input)
        {
            std::vector<LayerTrace> traces;
            traces.reserve(block_layers_.size());

            auto output = std::move(input);
            for (auto& layer : block_layers_) {
                output = layer.forward(std::move(output));
                output = ::Inpaint::Activation::Details::apply(layer.activation, std::move(output));

                LayerTrace entry{};
                entry.name = layer.name;
                entry.module = layer.module->name();
                entry.activation = ::Inpaint::Activation::to_string(layer.activation.type);
                entry.output_shape = output.sizes().vec();
                for (const auto& parameter : layer.module->parameters()) {
                    entry.parameters += parameter.numel();
                }
                traces.push_back(std::move(entry));
            }
            return traces;
        }

        [[nodiscard]] std::size_t size() const noexcept { return block_layers_.size(); }
        [[nodiscard]] const std::vector<::Inpaint::Layer::Descriptor>& descriptors() const noexcept { return descriptors_; }
        [[nodiscard]] const std::vector<::Inpaint::Layer::Details::RegisteredLayer>& layers() const noexcept { return block_layers_; }

    private:
        std::vector<::Inpaint::Layer::Descriptor> descriptors_{};
        std::vector<::Inpaint::Layer::Details::RegisteredLayer> block_layers_{};
    };

    TORCH_MODULE(SequentialBlockModule);

}

#endif // INPAINT_BLOCK_DETAILS_SEQUENTIAL_HPP
