#ifndef FATHOM_ANNEALING_CYCLIC_HPP
#define FATHOM_ANNEALING_CYCLIC_HPP
#include <cstddef>
#include <string>

#include "../../common/error.hpp"

// "Cyclical Annealing Schedule: A Simple Approach to Mitigating KL Vanishing" https://arxiv.org/abs/1903.10145
namespace Fathom::Annealing::Details {
    struct CyclicOptions {
        double beta_0{0.1};
        std::size_t init_beta_epochs{10};
        std::size_t burnin_beta{20};
        double beta_min{0.1};
        double beta_max{1.0};
        std::size_t period{10};
    };

    struct CyclicDescriptor {
        CyclicOptions options{};
    };

    inline void validate(const CyclicOptions& options) {
        if (options.period == 0) {
            throw ::Fathom::ConfigurationError("Cyclic annealing requires a period greater than zero.");
        }
        if (options.init_beta_epochs > options.burnin_beta) {
            throw ::Fathom::ConfigurationError("Cyclic annealing requires init_beta_epochs <= burnin_beta.");
        }
        if (options.beta_0 < 0.0 || options.beta_min < 0.0 || options.beta_max < 0.0) {
            throw ::Fathom::ConfigurationError("Cyclic annealing coefficients must be non-negative.");
        }
        if (options.beta_min > options.beta_max) {
            throw ::Fathom::ConfigurationError("Cyclic annealing requires beta_min <= beta_max.");
        }
    }

    // Constant warm-up, linear ramp, then a decreasing sawtooth.
    // The sawtooth phase counts from init_beta_epochs, not burnin_beta, so the first
    // value after the ramp equals beta_max only when (burnin_beta - init_beta_epochs)
    // is a multiple of the period.
    [[nodiscard]] inline double beta_cyclic_anneal(std::size_t epoch, const CyclicOptions& options) {
        validate(options);
        if (epoch < options.init_beta_epochs) {
            return options.beta_0;
        }
        if (epoch < options.burnin_beta) {
            const auto progress = static_cast<double>(epoch - options.init_beta_epochs)
                                / static_cast<double>(options.burnin_beta - options.init_beta_epochs);
            return options.beta_0 + progress * (options.beta_max - options.beta_0);
        }
        const auto phase = (epoch - options.init_beta_epochs) % options.period;
        const auto decrement = (options.beta_max - options.beta_min) / static_cast<double>(options.period);
        return options.beta_max - static_cast<double>(phase) * decrement;
    }
}

#endif //FATHOM_ANNEALING_CYCLIC_HPP
