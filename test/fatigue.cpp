#include <iostream>
#include <cstddef>
#include <exception>
#include <filesystem>
#include <torch/torch.h>
#include "../include/Fathom.h"

int main(int argc, char** argv) {
    std::cout << "Cuda: " << torch::cuda::is_available() << std::endl;

    Fathom::ModelOptions model_options{.n_conditioning = 3, .input_dims = 64, .n_latent = 2};
    Fathom::TrainOptions train_options{};
    train_options.seed = 42;
    train_options.log_every = 25;
    try {
        if (argc > 1) {
            auto config = Fathom::Common::SaveLoad::read_config(argv[1]);
            model_options = config.model;
            train_options = config.train;
        }

        auto raw = Fathom::Data::Synthetic({.samples = 400, .locations = model_options.input_dims});
        auto dataset = Fathom::Data::Normalize(raw.targets, raw.conditioning);
        auto partition = Fathom::Data::Split(dataset, {.test_fraction = 0.1, .seed = 0});

        Fathom::Model model(model_options, "fatigue_loads");
        model.to_device(torch::cuda::is_available());

        train_options.test = Fathom::HeldOut{partition.test.targets, partition.test.conditioning};
        model.train(partition.train.targets, partition.train.conditioning, train_options);

        // Load envelopes at three inflow conditions, scaled back to physical units.
        auto conditions = torch::tensor({{0.08f, 6.0f, 0.10f},
                                         {0.12f, 12.0f, 0.20f},
                                         {0.20f, 22.0f, 0.35f}});
        auto samples = model.sample_prior(dataset.normalize_conditioning(conditions), 1000);
        auto loads = dataset.unnormalize_target(samples.to(torch::kCPU));

        auto mean = loads.mean(0);
        auto spread = loads.std(/*dim=*/{0}, /*unbiased=*/true);
        for (int64_t row = 0; row < conditions.size(0); ++row) {
            std::cout << "TI " << conditions[row][0].item<float>()
                      << " | U " << conditions[row][1].item<float>()
                      << " | alpha " << conditions[row][2].item<float>()
                      << " -> mean DEL " << mean[row].mean().item<float>()
                      << " (peak " << mean[row].max().item<float>()
                      << ", seed spread " << spread[row].mean().item<float>() << ")" << std::endl;
        }

        const auto output = std::filesystem::temp_directory_path() / "fathom_fatigue";
        model.save(output);
        std::cout << "Saved to " << output.string() << std::endl;
    } catch (const std::exception& error) {
        std::cerr << error.what() << std::endl;
        return 1;
    }
    return 0;
}
