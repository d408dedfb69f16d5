#include <gtest/gtest.h>

#include <cstdint>
#include <tuple>
#include <vector>

#include <torch/torch.h>

#include "../../include/Fathom.h"

namespace {
    using Fathom::Network::DiagonalGaussian;

    Fathom::Network::EncoderOptions encoder_options(bool use_conditioning, int64_t layers)
    {
        return Fathom::Network::EncoderOptions{
            .input_dims = 10,
            .n_conditioning = 3,
            .n_latent = 4,
            .width = 16,
            .layers = layers,
            .use_conditioning = use_conditioning};
    }
}

TEST(Encoder, ShapesMatchLatentSizeAndStdIsPositive)
{
    torch::manual_seed(0);
    for (const bool use_conditioning : {true, false}) {
        for (const int64_t layers : {1, 2, 3}) {
            Fathom::Network::Encoder encoder(encoder_options(use_conditioning, layers));
            encoder->train();

            const auto targets = torch::randn({7, 10}) * 1e3;
            const auto conditioning = torch::randn({7, 3}) * 1e3;
            const auto posterior = encoder->forward(targets, conditioning);

            EXPECT_EQ(posterior.mean.sizes(), (std::vector<int64_t>{7, 4}));
            EXPECT_EQ(posterior.std.sizes(), (std::vector<int64_t>{7, 4}));
            EXPECT_TRUE(torch::all(posterior.std > 0).item<bool>());
            EXPECT_TRUE(torch::all(posterior.std >= Fathom::Network::kStdFloor).item<bool>());
        }
    }
}

TEST(Encoder, IgnoresConditioningWhenDisabled)
{
    torch::manual_seed(1);
    Fathom::Network::Encoder encoder(encoder_options(false, 2));
    encoder->eval();

    const auto targets = torch::randn({5, 10});
    const auto first = encoder->forward(targets, torch::randn({5, 3}));
    const auto second = encoder->forward(targets, torch::randn({5, 3}));
    EXPECT_TRUE(torch::equal(first.mean, second.mean));
    EXPECT_TRUE(torch::equal(first.std, second.std));
}

TEST(Decoder, OutputShapeForAnySampleCount)
{
    torch::manual_seed(2);
    Fathom::Network::Decoder decoder(Fathom::Network::DecoderOptions{
        .n_latent = 2, .n_conditioning = 3, .output_dims = 10, .width = 8, .layers = 2});

    for (const auto& [samples, batch] : std::vector<std::tuple<int64_t, int64_t>>{{1, 1}, {1, 6}, {3, 1}, {40, 5}}) {
        const auto output = decoder->forward(torch::randn({samples, batch, 2}), torch::randn({batch, 3}));
        EXPECT_EQ(output.sizes(), (std::vector<int64_t>{samples, batch, 10}));
    }
}

TEST(Decoder, EvalModeIsDeterministic)
{
    torch::manual_seed(3);
    Fathom::Network::Decoder decoder(Fathom::Network::DecoderOptions{
        .n_latent = 2, .n_conditioning = 3, .output_dims = 10, .width = 32, .layers = 3});
    decoder->eval();

    const auto latents = torch::randn({4, 6, 2});
    const auto conditioning = torch::randn({6, 3});
    EXPECT_TRUE(torch::equal(decoder->forward(latents, conditioning), decoder->forward(latents, conditioning)));
}

TEST(Gaussian, KlIsNonNegativeAndZeroOnlyAtStandardNormal)
{
    torch::manual_seed(4);
    const auto prior = Fathom::Network::standard_normal(6);

    const DiagonalGaussian random{torch::randn({32, 6}) * 3.0, torch::rand({32, 6}) * 4.0 + 1e-3};
    const auto kl = Fathom::Network::kl_divergence(random, prior);
    EXPECT_EQ(kl.sizes(), (std::vector<int64_t>{32}));
    EXPECT_TRUE(torch::all(kl >= -1e-6).item<bool>());
    EXPECT_TRUE(torch::all(kl > 0).item<bool>());

    const DiagonalGaussian matching{torch::zeros({3, 6}), torch::ones({3, 6})};
    EXPECT_TRUE(torch::equal(Fathom::Network::kl_divergence(matching, prior), torch::zeros({3})));
}

TEST(Gaussian, ReparameterisedDrawsMatchMoments)
{
    torch::manual_seed(5);
    const auto mean = torch::tensor({{0.5f, -2.0f}});
    const auto scale = torch::tensor({{0.3f, 1.5f}});
    const DiagonalGaussian posterior{mean, scale};

    const auto samples = posterior.rsample(50000);
    ASSERT_EQ(samples.sizes(), (std::vector<int64_t>{50000, 1, 2}));

    const auto empirical_mean = samples.mean(0);
    const auto empirical_var = samples.var({0}, /*unbiased=*/true);
    EXPECT_TRUE(torch::allclose(empirical_mean, mean, /*rtol=*/0.0, /*atol=*/0.03));
    EXPECT_TRUE(torch::allclose(empirical_var, scale.pow(2), /*rtol=*/0.05, /*atol=*/0.0));
}

TEST(Gaussian, GradientsFlowThroughSamples)
{
    const auto mean = torch::zeros({4, 3}, torch::requires_grad());
    const auto scale = torch::ones({4, 3}, torch::requires_grad());
    DiagonalGaussian posterior{mean, scale};

    posterior.rsample(8).pow(2).sum().backward();
    ASSERT_TRUE(mean.grad().defined());
    ASSERT_TRUE(scale.grad().defined());
    EXPECT_GT(scale.grad().abs().sum().item<double>(), 0.0);
}

TEST(Gaussian, LogProbMatchesClosedForm)
{
    const auto prior = Fathom::Network::standard_normal(2);
    const auto value = torch::zeros({1, 1, 2});
    const double expected = -1.8378770664093453;  // 2 * (-0.5 * log(2 pi))
    EXPECT_NEAR(prior.log_prob(value).item<double>(), expected, 1e-6);
}

TEST(FeedForward, DropoutPlacementFollowsBodyRole)
{
    Fathom::Network::FeedForward encoder_body(Fathom::Network::FeedForwardOptions{
        .in_features = 4, .width = 8, .layers = 3});
    EXPECT_FALSE(encoder_body->dropout_after(0));
    EXPECT_TRUE(encoder_body->dropout_after(1));
    EXPECT_TRUE(encoder_body->dropout_after(2));

    Fathom::Network::FeedForward decoder_body(Fathom::Network::FeedForwardOptions{
        .in_features = 4, .width = 8, .layers = 3, .placement = Fathom::Network::DropoutPlacement::BetweenLayers});
    EXPECT_TRUE(decoder_body->dropout_after(0));
    EXPECT_TRUE(decoder_body->dropout_after(1));
    EXPECT_FALSE(decoder_body->dropout_after(2));
}

TEST(Decoder, SingleHiddenLayerHasNoDropoutInTraining)
{
    torch::manual_seed(6);
    Fathom::Network::Decoder decoder(Fathom::Network::DecoderOptions{
        .n_latent = 2, .n_conditioning = 3, .output_dims = 10, .width = 16, .layers = 1, .dropout = 0.5});
    decoder->train();

    const auto latents = torch::randn({2, 4, 2});
    const auto conditioning = torch::randn({4, 3});
    EXPECT_TRUE(torch::equal(decoder->forward(latents, conditioning), decoder->forward(latents, conditioning)));
}
