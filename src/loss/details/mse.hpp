#ifndef LATTICE_LOSS_MSE_HPP
#define LATTICE_LOSS_MSE_HPP

#include <torch/torch.h>

#include "helper.hpp"

namespace Lattice::Loss::Details {
    namespace F = torch::nn::functional;

    inline torch::Tensor mean_squared_error(const torch::Tensor& prediction, const torch::Tensor& target)
    {
        auto per_elem = F::mse_loss(prediction, target.to(prediction.scalar_type()), F::MSELossFuncOptions().reduction(torch::kNone));
        return reduce_last_axis(per_elem);
    }
}

#endif // LATTICE_LOSS_MSE_HPP
