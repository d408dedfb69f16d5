#ifndef FATHOM_LOSS_MSE_HPP
#define FATHOM_LOSS_MSE_HPP

#include <torch/torch.h>

namespace Fathom::Loss::Details {

    namespace F = torch::nn::functional;

    // Squared error averaged over features, kept per importance sample:
    // prediction (K, batch, D), target (batch, D) -> (K, batch).
    inline torch::Tensor per_sample_mse(const torch::Tensor& prediction, const torch::Tensor& target)
    {
        auto expanded = target.unsqueeze(0).expand_as(prediction);
        auto per_elem = F::mse_loss(prediction, expanded, F::MSELossFuncOptions().reduction(torch::kNone));
        return per_elem.mean(-1);
    }

    // Per-example reconstruction error, averaged over the K axis -> (batch).
    inline torch::Tensor reconstruction_error(const torch::Tensor& prediction, const torch::Tensor& target)
    {
        return per_sample_mse(prediction, target).mean(0);
    }
}

#endif // FATHOM_LOSS_MSE_HPP
