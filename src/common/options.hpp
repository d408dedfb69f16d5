#ifndef FATHOM_COMMON_OPTIONS_HPP
#define FATHOM_COMMON_OPTIONS_HPP

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <optional>
#include <ostream>
#include <string>
#include <utility>

#include <torch/torch.h>

#include "../activation/activation.hpp"
#include "../annealing/annealing.hpp"
#include "../initialization/initialization.hpp"
#include "../loss/loss.hpp"
#include "../optimizer/optimizer.hpp"
#include "error.hpp"

namespace Fathom {
    struct ModelOptions {
        int64_t n_conditioning{};
        int64_t input_dims{};
        int64_t n_latent{};
        int64_t layer_width{64};
        int64_t n_layers_enc{2};
        int64_t n_layers_dec{2};
        Activation::Descriptor activation{Activation::ReLU};
        int64_t n_iwae{40};
        bool enc_use_cond{true};
        double dropout{0.2};
        Initialization::Descriptor initialization{Initialization::Default};
    };

    inline void validate(const ModelOptions& options)
    {
        auto require_positive = [](int64_t value, const char* name) {
            if (value <= 0) {
                throw ConfigurationError(std::string("ModelOptions.") + name + " must be positive, got "
                                         + std::to_string(value) + ".");
            }
        };
        require_positive(options.n_conditioning, "n_conditioning");
        require_positive(options.input_dims, "input_dims");
        require_positive(options.n_latent, "n_latent");
        require_positive(options.layer_width, "layer_width");
        require_positive(options.n_layers_enc, "n_layers_enc");
        require_positive(options.n_layers_dec, "n_layers_dec");
        require_positive(options.n_iwae, "n_iwae");
        if (!(options.dropout >= 0.0 && options.dropout < 1.0)) {
            throw ConfigurationError("ModelOptions.dropout must lie in [0, 1).");
        }
        if (!(options.initialization.gain > 0.0)) {
            throw ConfigurationError("ModelOptions.initialization gain must be positive.");
        }
    }

    // Held-out split evaluated every `test_every` epochs.
    struct HeldOut {
        torch::Tensor targets;
        torch::Tensor conditioning;
    };

    struct TrainOptions {
        std::size_t epochs{400};
        std::size_t test_every{50};
        std::size_t log_every{1};
        std::optional<std::uint64_t> seed{};
        Optimizer::Descriptor optimizer{Optimizer::Adam()};
        Annealing::Descriptor beta{Annealing::Cyclic()};
        Loss::ObjectiveDescriptor objective{Loss::ELBO()};
        bool halt_on_instability{true};
        bool monitor{true};
        std::optional<HeldOut> test{};
        std::ostream* stream{&std::cout};
    };

    inline void validate(const TrainOptions& options)
    {
        if (options.test_every == 0) {
            throw ConfigurationError("TrainOptions.test_every must be greater than zero.");
        }
        if (options.log_every == 0) {
            throw ConfigurationError("TrainOptions.log_every must be greater than zero.");
        }
        Annealing::Details::validate(options.beta);
    }
}

#endif // FATHOM_COMMON_OPTIONS_HPP
