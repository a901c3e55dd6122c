#ifndef INPAINT_RELU_HPP
#define INPAINT_RELU_HPP

#include <torch/torch.h>

#include <utility>

namespace Inpaint::Activation::Details {

    struct ReLU {
        [[nodiscard]] torch::Tensor operator()(torch::Tensor input) const {
            return torch::relu(std::move(input));
        }
    };

}

#endif //INPAINT_RELU_HPP
