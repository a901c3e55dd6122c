#ifndef INPAINT_LEAKY_RELU_HPP
#define INPAINT_LEAKY_RELU_HPP

#include <torch/torch.h>

#include <utility>

namespace Inpaint::Activation::Details {

    struct LeakyReLU {
        double negative_slope{0.2};

        [[nodiscard]] torch::Tensor operator()(torch::Tensor input) const {
            return torch::leaky_relu(std::move(input), negative_slope);
        }
    };

}

#endif //INPAINT_LEAKY_RELU_HPP
