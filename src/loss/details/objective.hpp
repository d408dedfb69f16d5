#ifndef FATHOM_LOSS_OBJECTIVE_HPP
#define FATHOM_LOSS_OBJECTIVE_HPP

#include <cmath>
#include <cstdint>
#include <utility>

#include <torch/torch.h>

#include "kl.hpp"
#include "mse.hpp"
#include "reduction.hpp"

namespace Fathom::Loss::Details {

    enum class Estimator {
        // mean_k(mse_k) + beta * KL / n_latent, KL in closed form.
        SampleAverage,
        // -log mean_k exp(-(mse_k + beta * (log q(z_k) - log p(z_k)) / n_latent)).
        ImportanceWeighted,
    };

    struct ObjectiveOptions {
        Estimator estimator{Estimator::SampleAverage};
        Reduction reduction{Reduction::None};
    };

    struct ObjectiveDescriptor {
        ObjectiveOptions options{};
    };

    // total/reconstruction/kl are per example (batch) unless a reduction is requested.
    struct ObjectiveResult {
        torch::Tensor total;
        torch::Tensor reconstruction;
        torch::Tensor kl;
        torch::Tensor prediction;
        torch::Tensor latents;
        ::Fathom::Network::Details::DiagonalGaussian posterior;
    };

    // per_sample_loss is (K, batch); returns -log mean_k exp(-loss_k), which is never
    // larger than the plain average over k.
    inline torch::Tensor log_mean_exp_objective(const torch::Tensor& per_sample_loss)
    {
        const auto samples = static_cast<double>(per_sample_loss.size(0));
        return -(torch::logsumexp(-per_sample_loss, /*dim=*/0) - std::log(samples));
    }

    template <class Model>
    ObjectiveResult compute(const ObjectiveDescriptor& descriptor,
                            Model& model,
                            const torch::Tensor& targets,
                            const torch::Tensor& conditioning,
                            double beta)
    {
        auto forward = model.forward(targets, conditioning);
        const auto latent_dims = static_cast<double>(forward.latents.size(-1));

        auto reconstruction = reconstruction_error(forward.reconstruction, targets);
        auto kl = forward.kl;

        torch::Tensor total;
        switch (descriptor.options.estimator) {
            case Estimator::ImportanceWeighted: {
                auto per_sample = per_sample_mse(forward.reconstruction, targets)
                                + beta * sampled_kl(forward.latents, forward.posterior, model.prior()) / latent_dims;
                total = log_mean_exp_objective(per_sample);
                break;
            }
            case Estimator::SampleAverage:
            default:
                total = reconstruction + beta * kl / latent_dims;
                break;
        }

        const auto reduction = descriptor.options.reduction;
        return ObjectiveResult{apply_reduction(std::move(total), reduction),
                               apply_reduction(std::move(reconstruction), reduction),
                               apply_reduction(std::move(kl), reduction),
                               std::move(forward.reconstruction),
                               std::move(forward.latents),
                               std::move(forward.posterior)};
    }
}

#endif // FATHOM_LOSS_OBJECTIVE_HPP
