#ifndef LATTICE_LOSS_HELPER_HPP
#define LATTICE_LOSS_HELPER_HPP

#include <optional>

#include <torch/torch.h>

#include "../../common/error.hpp"

namespace Lattice::Loss::Details {
    inline constexpr double kEpsilon = 1e-7;

    // Per-sample losses average over the last axis only, leaving (batch) or (batch, time).
    inline torch::Tensor reduce_last_axis(const torch::Tensor& per_elem)
    {
        if (per_elem.dim() <= 1) {
            return per_elem;
        }
        return per_elem.mean(-1);
    }

    // Weighted mean of a per-sample score array; zero weights drop samples from the denominator.
    inline torch::Tensor weighted_mean(const torch::Tensor& score, const std::optional<torch::Tensor>& weights)
    {
        if (!weights || !weights->defined()) {
            return score.mean();
        }
        auto weight = weights->to(score.scalar_type());
        if (weight.dim() > score.dim()) {
            throw ShapeError("Sample weights have more dimensions than the loss they weight.");
        }
        while (weight.dim() < score.dim()) {
            weight = weight.unsqueeze(-1);
        }
        auto weighted = score * weight;
        const auto nonzero = (weight != 0).to(score.scalar_type()).mean();
        weighted = weighted / nonzero.clamp_min(kEpsilon);
        return weighted.mean();
    }
}

#endif // LATTICE_LOSS_HELPER_HPP
