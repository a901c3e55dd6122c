#ifndef INPAINT_BLOCK_HPP
#define INPAINT_BLOCK_HPP
// This file is an factory, must exempt it from any logical-code. For functions look into "/details"
#include <initializer_list>
#include <utility>
#include <vector>

#include "details/blocks/sequential.hpp"

namespace Inpaint::Block {
    using SequentialDescriptor = Details::SequentialDescriptor;
    using SequentialModule = Details::SequentialBlockModule;
    using LayerTrace = Details::LayerTrace;

    [[nodiscard]] inline auto Sequential(std::initializer_list<::Inpaint::Layer::Descriptor> layers) -> SequentialDescriptor {
        SequentialDescriptor descriptor{};
        descriptor.layers.assign(layers.begin(), layers.end());
        return descriptor;
    }

    [[nodiscard]] inline auto Sequential(std::vector<::Inpaint::Layer::Descriptor> layers) -> SequentialDescriptor {
        SequentialDescriptor descriptor{};
        descriptor.layers = std::move(layers);
        return descriptor;
    }
}

#endif //INPAINT_BLOCK_HPP
