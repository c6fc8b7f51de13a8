#ifndef LATTICE_INITIALIZATION_APPLY_HPP
#define LATTICE_INITIALIZATION_APPLY_HPP

#include <string>

#include <torch/torch.h>

#include "../common/error.hpp"
#include "initialization.hpp"

namespace Lattice::Initialization {
    inline std::string to_string(Descriptor descriptor)
    {
        switch (descriptor.type) {
            case Type::Zeros: return "zeros";
            case Type::Ones: return "ones";
            case Type::GlorotUniform: return "glorot_uniform";
            case Type::GlorotNormal: return "glorot_normal";
            case Type::HeUniform: return "he_uniform";
            case Type::HeNormal: return "he_normal";
            case Type::Orthogonal: return "orthogonal";
        }
        return "glorot_uniform";
    }

    inline Descriptor from_string(const std::string& name)
    {
        if (name == "zeros") return Zeros;
        if (name == "ones") return Ones;
        if (name == "glorot_uniform") return GlorotUniform;
        if (name == "glorot_normal") return GlorotNormal;
        if (name == "he_uniform") return HeUniform;
        if (name == "he_normal") return HeNormal;
        if (name == "orthogonal") return Orthogonal;
        throw ValidationError("Unknown initializer: " + name);
    }
}

namespace Lattice::Initialization::Details {
    // Fills `tensor` in place. Fan-based schemes fall back to zeros on rank-1 tensors.
    inline void apply(Descriptor descriptor, torch::Tensor& tensor)
    {
        torch::NoGradGuard no_grad{};
        const bool fan_defined = tensor.dim() >= 2;

        switch (descriptor.type) {
            case Type::Zeros:
                torch::nn::init::zeros_(tensor);
                break;
            case Type::Ones:
                torch::nn::init::ones_(tensor);
                break;
            case Type::GlorotUniform:
                fan_defined ? (void)torch::nn::init::xavier_uniform_(tensor) : (void)torch::nn::init::zeros_(tensor);
                break;
            case Type::GlorotNormal:
                fan_defined ? (void)torch::nn::init::xavier_normal_(tensor) : (void)torch::nn::init::zeros_(tensor);
                break;
            case Type::HeUniform:
                if (fan_defined) {
                    torch::nn::init::kaiming_uniform_(tensor, /*a=*/0.0, torch::kFanIn, torch::kReLU);
                } else {
                    torch::nn::init::zeros_(tensor);
                }
                break;
            case Type::HeNormal:
                if (fan_defined) {
                    torch::nn::init::kaiming_normal_(tensor, /*a=*/0.0, torch::kFanIn, torch::kReLU);
                } else {
                    torch::nn::init::zeros_(tensor);
                }
                break;
            case Type::Orthogonal:
                if (fan_defined) {
                    torch::nn::init::orthogonal_(tensor);
                } else {
                    torch::nn::init::zeros_(tensor);
                }
                break;
        }
    }
}

#endif // LATTICE_INITIALIZATION_APPLY_HPP
