#ifndef LATTICE_INITIALIZATION_HPP
#define LATTICE_INITIALIZATION_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "apply.hpp"

namespace Lattice::Initialization {
    enum class Type {
        Zeros,
        Ones,
        GlorotUniform,
        GlorotNormal,
        HeUniform,
        HeNormal,
        Orthogonal,
    };

    struct Descriptor {
        Type type{Type::GlorotUniform};
    };

    inline constexpr Descriptor Zeros{Type::Zeros};
    inline constexpr Descriptor Ones{Type::Ones};
    inline constexpr Descriptor GlorotUniform{Type::GlorotUniform};
    inline constexpr Descriptor GlorotNormal{Type::GlorotNormal};
    inline constexpr Descriptor HeUniform{Type::HeUniform};
    inline constexpr Descriptor HeNormal{Type::HeNormal};
    inline constexpr Descriptor Orthogonal{Type::Orthogonal};
}

#endif // LATTICE_INITIALIZATION_HPP
