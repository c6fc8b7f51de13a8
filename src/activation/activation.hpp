#ifndef LATTICE_ACTIVATION_HPP
#define LATTICE_ACTIVATION_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "apply.hpp"
#include <functional>
#include <string>
#include <utility>

#include <torch/torch.h>

namespace Lattice::Activation {
    enum class Type {
        Identity,
        ReLU,
        Sigmoid,
        Tanh,
        LeakyReLU,
        Softmax,
        SiLU,
        GeLU,
        Custom,
    };

    using Function = std::function<torch::Tensor(torch::Tensor)>;

    struct Descriptor {
        Type type{Type::Identity};
        std::string name{};  // Custom only
        Function function{}; // Custom only
    };

    inline const Descriptor Identity{Type::Identity};
    inline const Descriptor ReLU{Type::ReLU};
    inline const Descriptor Sigmoid{Type::Sigmoid};
    inline const Descriptor Tanh{Type::Tanh};
    inline const Descriptor LeakyReLU{Type::LeakyReLU};
    inline const Descriptor Softmax{Type::Softmax};
    inline const Descriptor SiLU{Type::SiLU};
    inline const Descriptor GeLU{Type::GeLU};

    inline Descriptor Custom(std::string name, Function function)
    {
        return Descriptor{Type::Custom, std::move(name), std::move(function)};
    }
}

#endif // LATTICE_ACTIVATION_HPP
