#ifndef INPAINT_ACTIVATION_HPP
#define INPAINT_ACTIVATION_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"

namespace Inpaint::Activation {
    enum class Type {
        Identity,
        ReLU,
        LeakyReLU,
        Tanh,
        Sigmoid,
    };

    struct Descriptor {
        Type type{Type::Identity};
        double negative_slope{0.01}; // LeakyReLU only
    };

    inline constexpr Descriptor Identity{Type::Identity};
    inline constexpr Descriptor ReLU{Type::ReLU};
    inline constexpr Descriptor LeakyReLU{Type::LeakyReLU, 0.2}; // DCGAN slope
    inline constexpr Descriptor Tanh{Type::Tanh};
    inline constexpr Descriptor Sigmoid{Type::Sigmoid};

    [[nodiscard]] constexpr const char* to_string(Type type) noexcept {
        switch (type) {
            case Type::ReLU: return "ReLU";
            case Type::LeakyReLU: return "LeakyReLU";
            case Type::Tanh: return "Tanh";
            case Type::Sigmoid: return "Sigmoid";
            case Type::Identity:
            default: return "Identity";
        }
    }
}

#endif //INPAINT_ACTIVATION_HPP
