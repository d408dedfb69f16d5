#ifndef FATHOM_OPTIMIZER_ADAM_HPP
#define FATHOM_OPTIMIZER_ADAM_HPP

#include <string>
#include <tuple>

#include <torch/torch.h>

#include "../../common/error.hpp"

namespace Fathom::Optimizer::Details {

    struct AdamOptions {
        double learning_rate{1e-3};
        double beta1{0.9};
        double beta2{0.999};
        double eps{1e-7};
        double weight_decay{0.0};
        bool amsgrad{false};
    };

    struct AdamDescriptor {
        AdamOptions options{};
    };

    struct AdamWOptions {
        double learning_rate{1e-3};
        double beta1{0.9};
        double beta2{0.999};
        double eps{1e-8};
        double weight_decay{1e-2};
        bool amsgrad{false};
    };

    struct AdamWDescriptor {
        AdamWOptions options{};
    };

    template <class Options>
    inline void validate_moments(const Options& options, const char* name) {
        if (!(options.learning_rate > 0.0)) {
            throw ::Fathom::ConfigurationError(std::string(name) + " requires a positive learning rate.");
        }
        if (options.beta1 < 0.0 || options.beta1 >= 1.0 || options.beta2 < 0.0 || options.beta2 >= 1.0) {
            throw ::Fathom::ConfigurationError(std::string(name) + " betas must lie in [0, 1).");
        }
        if (options.eps <= 0.0 || options.weight_decay < 0.0) {
            throw ::Fathom::ConfigurationError(std::string(name) + " requires eps > 0 and weight_decay >= 0.");
        }
    }

    inline torch::optim::AdamOptions to_torch_options(const AdamOptions& options) {
        validate_moments(options, "Adam");
        torch::optim::AdamOptions torch_options(options.learning_rate);
        torch_options = torch_options.betas(std::make_tuple(options.beta1, options.beta2));
        torch_options = torch_options.eps(options.eps);
        torch_options = torch_options.weight_decay(options.weight_decay);
        torch_options = torch_options.amsgrad(options.amsgrad);
        return torch_options;
    }

    inline torch::optim::AdamWOptions to_torch_options(const AdamWOptions& options) {
        validate_moments(options, "AdamW");
        torch::optim::AdamWOptions torch_options(options.learning_rate);
        torch_options = torch_options.betas(std::make_tuple(options.beta1, options.beta2));
        torch_options = torch_options.eps(options.eps);
        torch_options = torch_options.weight_decay(options.weight_decay);
        torch_options = torch_options.amsgrad(options.amsgrad);
        return torch_options;
    }
}

#endif // FATHOM_OPTIMIZER_ADAM_HPP
