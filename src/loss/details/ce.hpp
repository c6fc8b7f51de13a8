#ifndef LATTICE_LOSS_CE_HPP
#define LATTICE_LOSS_CE_HPP

#include <torch/torch.h>

#include "helper.hpp"

namespace Lattice::Loss::Details {
    // One-hot targets against softmax probabilities; reduces the class axis.
    inline torch::Tensor categorical_crossentropy(const torch::Tensor& prediction, const torch::Tensor& target)
    {
        const auto normalized = prediction / prediction.sum(-1, /*keepdim=*/true);
        const auto clipped = normalized.clamp(kEpsilon, 1.0 - kEpsilon);
        return -(target.to(prediction.scalar_type()) * clipped.log()).sum(-1);
    }

    // Integer class targets of shape (batch,) or (batch, 1).
    inline torch::Tensor sparse_categorical_crossentropy(const torch::Tensor& prediction, const torch::Tensor& target)
    {
        auto indices = target.to(torch::kLong);
        if (indices.dim() == prediction.dim()) {
            indices = indices.squeeze(-1);
        }
        const auto clipped = prediction.clamp(kEpsilon, 1.0 - kEpsilon);
        return -clipped.log().gather(-1, indices.unsqueeze(-1)).squeeze(-1);
    }
}

#endif // LATTICE_LOSS_CE_HPP
