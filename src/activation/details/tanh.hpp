#ifndef INPAINT_TANH_HPP
#define INPAINT_TANH_HPP

#include <torch/torch.h>

#include <utility>

namespace Inpaint::Activation::Details {

    struct Tanh {
        [[nodiscard]] torch::Tensor operator()(torch::Tensor input) const {
            return torch::tanh(std::move(input));
        }
    };

}

#endif //INPAINT_TANH_HPP
