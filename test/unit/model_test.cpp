#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>
#include <string>
#include <vector>

#include <torch/torch.h>

#include "../../include/Fathom.h"

namespace {
    Fathom::ModelOptions scenario_options()
    {
        return Fathom::ModelOptions{.n_conditioning = 3, .input_dims = 10, .n_latent = 2, .n_iwae = 5};
    }
}

TEST(Model, ForwardShapesAndFiniteObjective)
{
    torch::manual_seed(10);
    Fathom::Model model(scenario_options());

    const auto targets = torch::randn({4, 10});
    const auto conditioning = torch::randn({4, 3});
    const auto result = model.forward(targets, conditioning);

    EXPECT_EQ(result.reconstruction.sizes(), (std::vector<int64_t>{5, 4, 10}));
    EXPECT_EQ(result.latents.sizes(), (std::vector<int64_t>{5, 4, 2}));
    EXPECT_EQ(result.kl.sizes(), (std::vector<int64_t>{4}));

    const auto objective = Fathom::Loss::compute(Fathom::Loss::ELBO(), model, targets, conditioning, 0.1);
    EXPECT_EQ(objective.total.sizes(), (std::vector<int64_t>{4}));
    EXPECT_TRUE(std::isfinite(objective.total.mean().item<double>()));
}

TEST(Model, DefaultOptions)
{
    const Fathom::ModelOptions options{.n_conditioning = 3, .input_dims = 10, .n_latent = 2};
    EXPECT_EQ(options.layer_width, 64);
    EXPECT_EQ(options.n_layers_enc, 2);
    EXPECT_EQ(options.n_layers_dec, 2);
    EXPECT_EQ(options.n_iwae, 40);
    EXPECT_TRUE(options.enc_use_cond);
    EXPECT_EQ(options.activation.type, Fathom::Activation::Type::ReLU);
}

TEST(Model, DecodeIsIdempotentWithoutDropout)
{
    torch::manual_seed(11);
    Fathom::Model model(scenario_options());
    model.eval();

    const auto latents = torch::randn({3, 4, 2});
    const auto conditioning = torch::randn({4, 3});
    EXPECT_TRUE(torch::equal(model.decode(latents, conditioning), model.decode(latents, conditioning)));
}

TEST(Model, PriorSamplingAndReconstruction)
{
    torch::manual_seed(12);
    Fathom::Model model(scenario_options());
    model.train();

    const auto conditioning = torch::randn({4, 3});
    EXPECT_EQ(model.sample_prior(conditioning, 7).sizes(), (std::vector<int64_t>{7, 4, 10}));
    EXPECT_EQ(model.sample_prior(conditioning, 1).sizes(), (std::vector<int64_t>{1, 4, 10}));
    EXPECT_EQ(model.reconstruct(torch::randn({4, 10}), conditioning).sizes(), (std::vector<int64_t>{5, 4, 10}));
    EXPECT_TRUE(model.is_training());

    EXPECT_THROW((void)model.sample_prior(conditioning, 0), Fathom::ConfigurationError);
}

TEST(Model, PriorIsStandardNormal)
{
    Fathom::Model model(scenario_options());
    const auto prior = model.prior();
    EXPECT_TRUE(torch::equal(prior.mean, torch::zeros({1, 2})));
    EXPECT_TRUE(torch::equal(prior.std, torch::ones({1, 2})));

    for (const auto& parameter : model.parameters()) {
        EXPECT_FALSE(parameter.is_same(prior.mean));
        EXPECT_FALSE(parameter.is_same(prior.std));
    }
}

TEST(Model, RejectsInvalidConfiguration)
{
    auto options = scenario_options();
    options.n_latent = 0;
    EXPECT_THROW(Fathom::Model{options}, Fathom::ConfigurationError);

    options = scenario_options();
    options.layer_width = -4;
    EXPECT_THROW(Fathom::Model{options}, Fathom::ConfigurationError);

    options = scenario_options();
    options.n_layers_dec = 0;
    EXPECT_THROW(Fathom::Model{options}, Fathom::ConfigurationError);

    options = scenario_options();
    options.n_iwae = 0;
    EXPECT_THROW(Fathom::Model{options}, Fathom::ConfigurationError);

    options = scenario_options();
    options.dropout = 1.0;
    EXPECT_THROW(Fathom::Model{options}, Fathom::ConfigurationError);

    options = scenario_options();
    options.initialization = Fathom::Initialization::Scaled(Fathom::Initialization::XavierNormal, 0.0);
    EXPECT_THROW(Fathom::Model{options}, Fathom::ConfigurationError);
}

TEST(Model, ScaledInitializationShrinksWeights)
{
    auto options = scenario_options();
    options.initialization = Fathom::Initialization::Scaled(Fathom::Initialization::XavierUniform, 1e-3);
    Fathom::Model model(options);

    for (const auto& item : model.named_parameters()) {
        if (item.key().find("weight") != std::string::npos) {
            EXPECT_LT(item.value().abs().max().item<double>(), 1e-2) << item.key();
        } else {
            EXPECT_TRUE(torch::equal(item.value(), torch::zeros_like(item.value()))) << item.key();
        }
    }
}

TEST(Model, RejectsMismatchedShapes)
{
    Fathom::Model model(scenario_options());

    EXPECT_THROW((void)model.forward(torch::randn({4, 9}), torch::randn({4, 3})), Fathom::ShapeMismatchError);
    EXPECT_THROW((void)model.forward(torch::randn({4, 10}), torch::randn({4, 2})), Fathom::ShapeMismatchError);
    EXPECT_THROW((void)model.forward(torch::randn({4, 10}), torch::randn({5, 3})), Fathom::ShapeMismatchError);
    EXPECT_THROW((void)model.forward(torch::randn({10}), torch::randn({3})), Fathom::ShapeMismatchError);
    EXPECT_THROW((void)model.encode(torch::randn({4, 11}), torch::randn({4, 3})), Fathom::ShapeMismatchError);
    EXPECT_THROW((void)model.decode(torch::randn({3, 4, 5}), torch::randn({4, 3})), Fathom::ShapeMismatchError);
    EXPECT_THROW((void)model.decode(torch::randn({4, 2}), torch::randn({4, 3})), Fathom::ShapeMismatchError);
    EXPECT_THROW((void)model.decode(torch::randn({3, 4, 2}), torch::randn({2, 3})), Fathom::ShapeMismatchError);
}

TEST(Model, ConfigurationErrorIsInvalidArgument)
{
    auto options = scenario_options();
    options.input_dims = 0;
    EXPECT_THROW(Fathom::Model{options}, std::invalid_argument);
}
