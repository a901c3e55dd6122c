#ifndef INPAINT_SIGMOID_HPP
#define INPAINT_SIGMOID_HPP

#include <torch/torch.h>

#include <utility>

namespace Inpaint::Activation::Details {

    struct Sigmoid {
        [[nodiscard]] torch::Tensor operator()(torch::Tensor input) const {
            return torch::sigmoid(std::move(input));
        }
    };

}

#endif //INPAINT_SIGMOID_HPP
