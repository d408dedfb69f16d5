#ifndef FATHOM_LOSS_KL_HPP
#define FATHOM_LOSS_KL_HPP

#include <torch/torch.h>

#include "../../network/details/gaussian.hpp"

namespace Fathom::Loss::Details {
    // Analytic KL(q || p) per example -> (batch).
    inline torch::Tensor analytic_kl(const ::Fathom::Network::Details::DiagonalGaussian& posterior,
                                     const ::Fathom::Network::Details::DiagonalGaussian& prior)
    {
        return ::Fathom::Network::Details::kl_divergence(posterior, prior);
    }

    // Single-sample estimate log q(z|x) - log p(z) for each draw -> (K, batch).
    inline torch::Tensor sampled_kl(const torch::Tensor& latents,
                                    const ::Fathom::Network::Details::DiagonalGaussian& posterior,
                                    const ::Fathom::Network::Details::DiagonalGaussian& prior)
    {
        return posterior.log_prob(latents) - prior.log_prob(latents);
    }
}
#endif //FATHOM_LOSS_KL_HPP
