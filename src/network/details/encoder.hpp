#ifndef FATHOM_NETWORK_ENCODER_HPP
#define FATHOM_NETWORK_ENCODER_HPP

#include <cstdint>
#include <utility>

#include <torch/torch.h>

#include "../../activation/activation.hpp"
#include "../../initialization/apply.hpp"
#include "../../initialization/initialization.hpp"
#include "feedforward.hpp"
#include "gaussian.hpp"

namespace Fathom::Network::Details {
    struct EncoderOptions {
        int64_t input_dims{};
        int64_t n_conditioning{};
        int64_t n_latent{};
        int64_t width{64};
        int64_t layers{2};
        ::Fathom::Activation::Descriptor activation{::Fathom::Activation::ReLU};
        double dropout{0.2};
        bool use_conditioning{true};
        ::Fathom::Initialization::Descriptor initialization{::Fathom::Initialization::Default};
    };

    // q(z | x, w): shared hidden stack, then independent mean and std heads.
    class EncoderImpl : public torch::nn::Module {
    public:
        explicit EncoderImpl(EncoderOptions options)
            : options_(std::move(options))
        {
            const auto in_features = options_.input_dims + (options_.use_conditioning ? options_.n_conditioning : 0);
            body_ = register_module("body", FeedForward(FeedForwardOptions{
                .in_features = in_features,
                .width = options_.width,
                .layers = options_.layers,
                .activation = options_.activation,
                .dropout = options_.dropout,
                .initialization = options_.initialization}));
            mean_head_ = register_module("mean", torch::nn::Linear(options_.width, options_.n_latent));
            std_head_ = register_module("std", torch::nn::Linear(options_.width, options_.n_latent));
            ::Fathom::Initialization::Details::apply_linear_initialization(mean_head_, options_.initialization);
            ::Fathom::Initialization::Details::apply_linear_initialization(std_head_, options_.initialization);
        }

        DiagonalGaussian forward(const torch::Tensor& targets, const torch::Tensor& conditioning)
        {
            auto input = options_.use_conditioning ? torch::cat({targets, conditioning}, /*dim=*/-1) : targets;
            auto hidden = body_->forward(std::move(input));
            auto mean = mean_head_->forward(hidden);
            auto scale = torch::softplus(std_head_->forward(hidden)) + kStdFloor;
            return DiagonalGaussian{std::move(mean), std::move(scale)};
        }

        [[nodiscard]] const EncoderOptions& options() const noexcept { return options_; }

    private:
        EncoderOptions options_{};
        FeedForward body_{nullptr};
        torch::nn::Linear mean_head_{nullptr};
        torch::nn::Linear std_head_{nullptr};
    };

    TORCH_MODULE(Encoder);
}

#endif // FATHOM_NETWORK_ENCODER_HPP
