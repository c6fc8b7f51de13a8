#ifndef LATTICE_ACTIVATION_APPLY_HPP
#define LATTICE_ACTIVATION_APPLY_HPP

#include <map>
#include <string>
#include <utility>

#include <torch/torch.h>

#include "../common/error.hpp"
#include "activation.hpp"

namespace Lattice::Activation {
    inline std::string to_string(const Descriptor& descriptor)
    {
        switch (descriptor.type) {
            case Type::Identity: return "linear";
            case Type::ReLU: return "relu";
            case Type::Sigmoid: return "sigmoid";
            case Type::Tanh: return "tanh";
            case Type::LeakyReLU: return "leaky_relu";
            case Type::Softmax: return "softmax";
            case Type::SiLU: return "silu";
            case Type::GeLU: return "gelu";
            case Type::Custom: return descriptor.name;
        }
        return "linear";
    }

    // Built-in names first, then the caller's custom functions.
    inline Descriptor from_string(const std::string& name, const std::map<std::string, Function>& custom = {})
    {
        if (name == "linear" || name.empty()) return Identity;
        if (name == "relu") return ReLU;
        if (name == "sigmoid") return Sigmoid;
        if (name == "tanh") return Tanh;
        if (name == "leaky_relu") return LeakyReLU;
        if (name == "softmax") return Softmax;
        if (name == "silu") return SiLU;
        if (name == "gelu") return GeLU;
        if (const auto it = custom.find(name); it != custom.end()) {
            return Custom(name, it->second);
        }
        throw ValidationError("Unknown activation function: " + name);
    }
}

namespace Lattice::Activation::Details {
    inline torch::Tensor apply(const Descriptor& descriptor, torch::Tensor input)
    {
        switch (descriptor.type) {
            case Type::ReLU:
                return torch::relu(std::move(input));
            case Type::Sigmoid:
                return torch::sigmoid(std::move(input));
            case Type::Tanh:
                return torch::tanh(std::move(input));
            case Type::LeakyReLU:
                return torch::leaky_relu(std::move(input), 0.01);
            case Type::Softmax:
                if (input.dim() == 0) {
                    return input;
                }
                return torch::softmax(input, input.dim() - 1);
            case Type::SiLU:
                return torch::silu(std::move(input));
            case Type::GeLU:
                return torch::gelu(std::move(input));
            case Type::Custom:
                if (!descriptor.function) {
                    throw ConfigError("Custom activation '" + descriptor.name + "' has no function bound.");
                }
                return descriptor.function(std::move(input));
            case Type::Identity:
            default:
                return input;
        }
    }
}

#endif // LATTICE_ACTIVATION_APPLY_HPP
