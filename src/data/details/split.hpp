#ifndef FATHOM_DATA_SPLIT_HPP
#define FATHOM_DATA_SPLIT_HPP

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <optional>

#include <ATen/CPUGeneratorImpl.h>
#include <torch/torch.h>

#include "../../common/error.hpp"
#include "normalization.hpp"

namespace Fathom::Data::Details {
    struct SplitOptions {
        double test_fraction{0.1};
        std::uint64_t seed{0};
    };

    struct Partition {
        Dataset train;
        Dataset test;
        torch::Tensor train_indices;
        torch::Tensor test_indices;
    };

    // Random partition driven by a private generator, so the same seed always gives
    // the same split and the global torch seed is left untouched. At least one
    // example stays in the training set.
    inline Partition Split(const Dataset& dataset, const SplitOptions& options = {})
    {
        if (!(options.test_fraction >= 0.0 && options.test_fraction < 1.0)) {
            throw ::Fathom::ConfigurationError("Split test_fraction must lie in [0, 1).");
        }
        const auto total = dataset.size();
        if (total == 0) {
            throw ::Fathom::ShapeMismatchError("Cannot split an empty dataset.");
        }

        auto n_test = static_cast<int64_t>(std::round(static_cast<double>(total) * options.test_fraction));
        n_test = std::clamp<int64_t>(n_test, 0, total - 1);

        auto generator = at::make_generator<at::CPUGeneratorImpl>(options.seed);
        auto permutation = torch::randperm(total, generator, torch::TensorOptions().dtype(torch::kLong));
        permutation = permutation.to(dataset.targets.device());

        auto test_indices = permutation.narrow(0, 0, n_test);
        auto train_indices = permutation.narrow(0, n_test, total - n_test);
        return Partition{dataset.subset(train_indices), dataset.subset(test_indices), train_indices, test_indices};
    }
}

#endif // FATHOM_DATA_SPLIT_HPP
