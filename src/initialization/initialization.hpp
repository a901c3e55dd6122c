#ifndef INPAINT_INITIALIZATION_HPP
#define INPAINT_INITIALIZATION_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "apply.hpp"

namespace Inpaint::Initialization {
    enum class Type {
        Default,
        DCGAN, // https://arxiv.org/pdf/1511.06434
        XavierNormal,
        KaimingNormal,
        ZeroBias,
    };

    struct Descriptor {
        Type type{Type::Default};
    };

    inline constexpr Descriptor Default{Type::Default};
    inline constexpr Descriptor DCGAN{Type::DCGAN};
    inline constexpr Descriptor XavierNormal{Type::XavierNormal};
    inline constexpr Descriptor KaimingNormal{Type::KaimingNormal};
    inline constexpr Descriptor ZeroBias{Type::ZeroBias};

    // N(0, 0.02) for convolutions, N(1, 0.02) for normalisation scales.
    inline constexpr double kDcganMean = 0.0;
    inline constexpr double kDcganScaleMean = 1.0;
    inline constexpr double kDcganStd = 0.02;
}

#endif //INPAINT_INITIALIZATION_HPP
