#ifndef LATTICE_LOSS_BCE_HPP
#define LATTICE_LOSS_BCE_HPP

#include <torch/torch.h>

#include "helper.hpp"

namespace Lattice::Loss::Details {
    namespace F = torch::nn::functional;

    // Expects probabilities (sigmoid outputs), not logits.
    inline torch::Tensor binary_crossentropy(const torch::Tensor& prediction, const torch::Tensor& target)
    {
        const auto clipped = prediction.clamp(kEpsilon, 1.0 - kEpsilon);
        auto per_elem = F::binary_cross_entropy(clipped, target.to(prediction.scalar_type()),
                                                F::BinaryCrossEntropyFuncOptions().reduction(torch::kNone));
        return reduce_last_axis(per_elem);
    }
}

#endif // LATTICE_LOSS_BCE_HPP
