#ifndef LATTICE_LOSS_MAE_HPP
#define LATTICE_LOSS_MAE_HPP

#include <torch/torch.h>

#include "helper.hpp"

namespace Lattice::Loss::Details {
    namespace F = torch::nn::functional;

    inline torch::Tensor mean_absolute_error(const torch::Tensor& prediction, const torch::Tensor& target)
    {
        auto per_elem = F::l1_loss(prediction, target.to(prediction.scalar_type()), F::L1LossFuncOptions().reduction(torch::kNone));
        return reduce_last_axis(per_elem);
    }
}

#endif // LATTICE_LOSS_MAE_HPP
