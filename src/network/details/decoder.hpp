#ifndef FATHOM_NETWORK_DECODER_HPP
#define FATHOM_NETWORK_DECODER_HPP

#include <cstdint>
#include <utility>

#include <torch/torch.h>

#include "../../activation/activation.hpp"
#include "../../initialization/apply.hpp"
#include "../../initialization/initialization.hpp"
#include "feedforward.hpp"

namespace Fathom::Network::Details {
    struct DecoderOptions {
        int64_t n_latent{};
        int64_t n_conditioning{};
        int64_t output_dims{};
        int64_t width{64};
        int64_t layers{2};
        ::Fathom::Activation::Descriptor activation{::Fathom::Activation::ReLU};
        double dropout{0.2};
        ::Fathom::Initialization::Descriptor initialization{::Fathom::Initialization::Default};
    };

    // p(x | z, w). Latents are (K, batch, n_latent); conditioning (batch, n_conditioning)
    // is repeated along K before concatenation. Output (K, batch, output_dims).
    class DecoderImpl : public torch::nn::Module {
    public:
        explicit DecoderImpl(DecoderOptions options)
            : options_(std::move(options))
        {
            body_ = register_module("body", FeedForward(FeedForwardOptions{
                .in_features = options_.n_latent + options_.n_conditioning,
                .width = options_.width,
                .layers = options_.layers,
                .activation = options_.activation,
                .dropout = options_.dropout,
                .initialization = options_.initialization,
                .placement = DropoutPlacement::BetweenLayers}));
            head_ = register_module("head", torch::nn::Linear(options_.width, options_.output_dims));
            ::Fathom::Initialization::Details::apply_linear_initialization(head_, options_.initialization);
        }

        torch::Tensor forward(const torch::Tensor& latents, const torch::Tensor& conditioning)
        {
            TORCH_CHECK(latents.dim() == 3, "Decoder expects latents shaped (K, batch, n_latent).");
            const auto samples = latents.size(0);
            auto broadcast = conditioning.unsqueeze(0).expand({samples, conditioning.size(0), conditioning.size(1)});
            auto hidden = body_->forward(torch::cat({latents, broadcast}, /*dim=*/-1));
            return head_->forward(hidden);
        }

        [[nodiscard]] const DecoderOptions& options() const noexcept { return options_; }

    private:
        DecoderOptions options_{};
        FeedForward body_{nullptr};
        torch::nn::Linear head_{nullptr};
    };

    TORCH_MODULE(Decoder);
}

#endif // FATHOM_NETWORK_DECODER_HPP
