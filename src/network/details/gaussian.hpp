#ifndef FATHOM_NETWORK_GAUSSIAN_HPP
#define FATHOM_NETWORK_GAUSSIAN_HPP

#include <cmath>
#include <cstdint>
#include <utility>

#include <torch/torch.h>

namespace Fathom::Network::Details {
    // Lower bound added to the softplus std of the approximate posterior.
    inline constexpr double kStdFloor = 1e-5;

    // Diagonal Gaussian over the last axis. mean/std are (batch, dims) for a
    // posterior or (1, dims) for the prior; both broadcast against samples
    // shaped (K, batch, dims).
    struct DiagonalGaussian {
        torch::Tensor mean;
        torch::Tensor std;

        [[nodiscard]] int64_t dims() const { return mean.size(-1); }

        // Reparameterised draw z = mean + std * eps, shape (samples, batch, dims).
        [[nodiscard]] torch::Tensor rsample(int64_t samples) const {
            TORCH_CHECK(samples > 0, "DiagonalGaussian::rsample requires at least one sample.");
            TORCH_CHECK(mean.dim() == 2 && std.sizes() == mean.sizes(),
                        "DiagonalGaussian expects (batch, dims) mean and std of equal shape.");
            auto eps = torch::randn({samples, mean.size(0), mean.size(1)}, mean.options());
            return mean.unsqueeze(0) + std.unsqueeze(0) * eps;
        }

        [[nodiscard]] torch::Tensor rsample(int64_t samples, int64_t batch) const {
            if (mean.size(0) == batch) {
                return rsample(samples);
            }
            TORCH_CHECK(mean.size(0) == 1, "Cannot broadcast a distribution of batch ", mean.size(0), " to ", batch, ".");
            return DiagonalGaussian{mean.expand({batch, dims()}), std.expand({batch, dims()})}.rsample(samples);
        }

        // Summed over the last axis: (K, batch, dims) -> (K, batch).
        [[nodiscard]] torch::Tensor log_prob(const torch::Tensor& value) const {
            constexpr double kLogTwoPi = 1.8378770664093453;
            auto standardized = (value - mean) / std;
            auto per_dim = -0.5 * standardized.pow(2) - torch::log(std) - 0.5 * kLogTwoPi;
            return per_dim.sum(-1);
        }
    };

    [[nodiscard]] inline DiagonalGaussian standard_normal(int64_t dims, const torch::TensorOptions& options = {}) {
        return DiagonalGaussian{torch::zeros({1, dims}, options), torch::ones({1, dims}, options)};
    }

    // Closed form KL(q || p) for diagonal Gaussians, summed over the last axis.
    [[nodiscard]] inline torch::Tensor kl_divergence(const DiagonalGaussian& q, const DiagonalGaussian& p) {
        auto variance_ratio = (q.std / p.std).pow(2);
        auto mean_term = ((q.mean - p.mean) / p.std).pow(2);
        auto per_dim = 0.5 * (variance_ratio + mean_term - 1.0 - torch::log(variance_ratio));
        return per_dim.sum(-1);
    }
}

#endif // FATHOM_NETWORK_GAUSSIAN_HPP
