#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <variant>

#include <torch/torch.h>

#include "../../include/Fathom.h"

namespace {
    class ScratchDirectory {
    public:
        explicit ScratchDirectory(const std::string& stem)
            : path_(std::filesystem::temp_directory_path()
                    / (stem + "_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count())))
        {
            std::filesystem::create_directories(path_);
        }

        ~ScratchDirectory()
        {
            std::error_code ignored;
            std::filesystem::remove_all(path_, ignored);
        }

        [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    private:
        std::filesystem::path path_;
    };

    Fathom::ModelOptions small_options()
    {
        return Fathom::ModelOptions{.n_conditioning = 3, .input_dims = 10, .n_latent = 2,
                                    .layer_width = 16, .n_iwae = 4, .dropout = 0.1};
    }
}

TEST(SaveLoad, RestoresParametersAndDecoderOutput)
{
    ScratchDirectory scratch("fathom_save_load");

    torch::manual_seed(30);
    Fathom::Model original(small_options(), "loads");
    original.save(scratch.path());
    EXPECT_TRUE(std::filesystem::exists(scratch.path() / "architecture.json"));
    EXPECT_TRUE(std::filesystem::exists(scratch.path() / "parameters.binary"));

    torch::manual_seed(31);
    Fathom::Model restored(small_options(), "loads");
    restored.load(scratch.path());

    original.eval();
    restored.eval();
    const auto latents = torch::randn({2, 5, 2});
    const auto conditioning = torch::randn({5, 3});
    EXPECT_TRUE(torch::allclose(original.decode(latents, conditioning), restored.decode(latents, conditioning)));

    const auto stored = Fathom::Common::SaveLoad::read_architecture(scratch.path());
    EXPECT_EQ(stored.layer_width, 16);
    EXPECT_DOUBLE_EQ(stored.dropout, 0.1);
}

TEST(SaveLoad, RejectsMismatchedArchitecture)
{
    ScratchDirectory scratch("fathom_mismatch");
    Fathom::Model original(small_options());
    original.save(scratch.path());

    auto different = small_options();
    different.n_latent = 3;
    Fathom::Model other(different);
    EXPECT_THROW(other.load(scratch.path()), Fathom::ConfigurationError);

    EXPECT_THROW(other.load(scratch.path() / "missing"), std::runtime_error);
}

TEST(Config, RoundTripsThroughJson)
{
    ScratchDirectory scratch("fathom_config");
    const auto path = scratch.path() / "config.json";

    auto model = small_options();
    model.activation = Fathom::Activation::Tanh;
    model.enc_use_cond = false;

    Fathom::TrainOptions train{};
    train.epochs = 12;
    train.test_every = 3;
    train.seed = 5;
    train.objective = Fathom::Loss::IWAE();
    train.beta = Fathom::Annealing::Constant(0.3);
    train.optimizer = Fathom::Optimizer::SGD({.learning_rate = 0.05});

    Fathom::Common::SaveLoad::write_config(path, model, train);
    const auto config = Fathom::Common::SaveLoad::read_config(path);

    EXPECT_EQ(config.model.activation.type, Fathom::Activation::Type::Tanh);
    EXPECT_FALSE(config.model.enc_use_cond);
    EXPECT_EQ(config.model.n_iwae, 4);
    EXPECT_EQ(config.train.epochs, 12u);
    EXPECT_EQ(config.train.test_every, 3u);
    ASSERT_TRUE(config.train.seed.has_value());
    EXPECT_EQ(*config.train.seed, 5u);
    EXPECT_EQ(config.train.objective.options.estimator, Fathom::Loss::Estimator::ImportanceWeighted);
    ASSERT_TRUE(std::holds_alternative<Fathom::Annealing::ConstantDescriptor>(config.train.beta));
    EXPECT_DOUBLE_EQ(std::get<Fathom::Annealing::ConstantDescriptor>(config.train.beta).options.beta, 0.3);
    ASSERT_TRUE(std::holds_alternative<Fathom::Optimizer::SGDDescriptor>(config.train.optimizer));
    EXPECT_DOUBLE_EQ(std::get<Fathom::Optimizer::SGDDescriptor>(config.train.optimizer).options.learning_rate, 0.05);
}

TEST(Config, MinimalModelSectionUsesDefaults)
{
    ScratchDirectory scratch("fathom_minimal");
    const auto path = scratch.path() / "config.json";
    {
        std::ofstream file(path);
        file << R"({"model": {"n_conditioning": 3, "input_dims": 64, "n_latent": 4}})";
    }

    const auto config = Fathom::Common::SaveLoad::read_config(path);
    EXPECT_EQ(config.model.input_dims, 64);
    EXPECT_EQ(config.model.layer_width, 64);
    EXPECT_EQ(config.model.n_iwae, 40);
    EXPECT_EQ(config.train.epochs, 400u);
    EXPECT_TRUE(std::holds_alternative<Fathom::Annealing::CyclicDescriptor>(config.train.beta));
}

TEST(Config, RejectsUnknownNamesAndMissingFields)
{
    ScratchDirectory scratch("fathom_invalid");
    const auto write = [&scratch](const std::string& name, const std::string& text) {
        const auto path = scratch.path() / name;
        std::ofstream file(path);
        file << text;
        return path;
    };

    const auto activation = write("activation.json",
        R"({"model": {"n_conditioning": 3, "input_dims": 8, "n_latent": 2, "activation": "swishy"}})");
    EXPECT_THROW((void)Fathom::Common::SaveLoad::read_config(activation), Fathom::ConfigurationError);

    const auto missing = write("missing.json", R"({"model": {"n_conditioning": 3, "input_dims": 8}})");
    EXPECT_THROW((void)Fathom::Common::SaveLoad::read_config(missing), Fathom::ConfigurationError);

    const auto no_model = write("no_model.json", R"({"train": {"epochs": 3}})");
    EXPECT_THROW((void)Fathom::Common::SaveLoad::read_config(no_model), Fathom::ConfigurationError);

    const auto schedule = write("schedule.json",
        R"({"model": {"n_conditioning": 1, "input_dims": 8, "n_latent": 2}, "train": {"beta": {"type": "cosine"}}})");
    EXPECT_THROW((void)Fathom::Common::SaveLoad::read_config(schedule), Fathom::ConfigurationError);

    const auto broken = write("broken.json", "{ not json");
    EXPECT_THROW((void)Fathom::Common::SaveLoad::read_config(broken), std::runtime_error);
}

TEST(Config, NamesAreCaseInsensitive)
{
    ScratchDirectory scratch("fathom_case");
    const auto path = scratch.path() / "config.json";
    {
        std::ofstream file(path);
        file << R"({"model": {"n_conditioning": 3, "input_dims": 8, "n_latent": 2,)"
             << R"( "activation": "TANH", "initialization": "Xavier_Normal"}})";
    }

    const auto config = Fathom::Common::SaveLoad::read_config(path);
    EXPECT_EQ(config.model.activation.type, Fathom::Activation::Type::Tanh);
    EXPECT_EQ(config.model.initialization.type, Fathom::Initialization::Type::XavierNormal);
    EXPECT_EQ(Fathom::Initialization::Details::from_string("HE_UNIFORM").type, Fathom::Initialization::Type::HeUniform);
    EXPECT_THROW((void)Fathom::Initialization::Details::from_string("orthogonal"), Fathom::ConfigurationError);
}

TEST(Config, RejectsNegativeUnsignedFields)
{
    ScratchDirectory scratch("fathom_negative");
    const auto write = [&scratch](const std::string& name, const std::string& train) {
        const auto path = scratch.path() / name;
        std::ofstream file(path);
        file << R"({"model": {"n_conditioning": 3, "input_dims": 8, "n_latent": 2}, "train": )" << train << "}";
        return path;
    };

    EXPECT_THROW((void)Fathom::Common::SaveLoad::read_config(write("epochs.json", R"({"epochs": -1})")),
                 Fathom::ConfigurationError);
    EXPECT_THROW((void)Fathom::Common::SaveLoad::read_config(write("seed.json", R"({"seed": -3})")),
                 Fathom::ConfigurationError);
    EXPECT_THROW((void)Fathom::Common::SaveLoad::read_config(write("period.json", R"({"beta": {"type": "cyclic", "period": -10}})")),
                 Fathom::ConfigurationError);

    const auto config = Fathom::Common::SaveLoad::read_config(write("valid.json", R"({"epochs": 7})"));
    EXPECT_EQ(config.train.epochs, 7u);
}
