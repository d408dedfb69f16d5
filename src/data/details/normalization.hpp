#ifndef FATHOM_DATA_NORMALIZATION_HPP
#define FATHOM_DATA_NORMALIZATION_HPP

#include <cstdint>
#include <utility>

#include <torch/torch.h>

#include "../../common/error.hpp"

namespace Fathom::Data::Details {
    struct NormalizeOptions {
        double eps{1e-12};
    };

    // Column moments of a (rows, features) matrix; std is the population std
    // clamped to eps so constant columns map to zero.
    struct Statistics {
        torch::Tensor mean;
        torch::Tensor std;

        [[nodiscard]] static Statistics fit(const torch::Tensor& matrix, const NormalizeOptions& options = {}) {
            auto values = matrix.to(torch::kFloat32);
            auto mean = values.mean(/*dim=*/0);
            auto deviation = values.std(/*dim=*/{0}, /*unbiased=*/false).clamp_min(options.eps);
            return Statistics{std::move(mean), std::move(deviation)};
        }

        [[nodiscard]] int64_t features() const { return mean.size(0); }

        // Both act on the last axis, so (K, batch, D) sample tensors work unchanged.
        [[nodiscard]] torch::Tensor normalize(const torch::Tensor& raw) const {
            return (raw.to(mean.scalar_type()) - mean.to(raw.device())) / std.to(raw.device());
        }

        [[nodiscard]] torch::Tensor unnormalize(const torch::Tensor& normalized) const {
            return normalized * std.to(normalized.device()) + mean.to(normalized.device());
        }
    };

    struct Dataset {
        torch::Tensor targets;
        torch::Tensor conditioning;
        Statistics target_statistics;
        Statistics conditioning_statistics;

        [[nodiscard]] int64_t size() const { return targets.defined() ? targets.size(0) : 0; }
        [[nodiscard]] int64_t input_dims() const { return target_statistics.features(); }
        [[nodiscard]] int64_t n_conditioning() const { return conditioning_statistics.features(); }

        [[nodiscard]] torch::Tensor unnormalize_target(const torch::Tensor& value) const {
            return target_statistics.unnormalize(value);
        }
        [[nodiscard]] torch::Tensor unnormalize_conditioning(const torch::Tensor& value) const {
            return conditioning_statistics.unnormalize(value);
        }
        [[nodiscard]] torch::Tensor normalize_target(const torch::Tensor& value) const {
            return target_statistics.normalize(value);
        }
        [[nodiscard]] torch::Tensor normalize_conditioning(const torch::Tensor& value) const {
            return conditioning_statistics.normalize(value);
        }

        // Rows selected by a long index tensor; statistics are shared.
        [[nodiscard]] Dataset subset(const torch::Tensor& indices) const {
            return Dataset{targets.index_select(0, indices),
                           conditioning.index_select(0, indices),
                           target_statistics,
                           conditioning_statistics};
        }
    };

    inline Dataset Normalize(const torch::Tensor& raw_targets,
                             const torch::Tensor& raw_conditioning,
                             const NormalizeOptions& options = {})
    {
        if (!raw_targets.defined() || !raw_conditioning.defined()) {
            throw ::Fathom::ShapeMismatchError("Normalize expects defined target and conditioning tensors.");
        }
        if (raw_targets.dim() != 2 || raw_conditioning.dim() != 2) {
            throw ::Fathom::ShapeMismatchError("Normalize expects (rows, features) matrices, got targets "
                                               + ::Fathom::Common::Details::describe_shape(raw_targets) + " and conditioning "
                                               + ::Fathom::Common::Details::describe_shape(raw_conditioning) + ".");
        }
        if (raw_targets.size(0) == 0) {
            throw ::Fathom::ShapeMismatchError("Normalize requires at least one example.");
        }
        ::Fathom::Common::Details::expect_same_batch(raw_targets, "targets", raw_conditioning, "conditioning");
        if (options.eps <= 0.0) {
            throw ::Fathom::ConfigurationError("Normalize requires a positive eps.");
        }

        auto target_statistics = Statistics::fit(raw_targets, options);
        auto conditioning_statistics = Statistics::fit(raw_conditioning, options);
        auto targets = target_statistics.normalize(raw_targets);
        auto conditioning = conditioning_statistics.normalize(raw_conditioning);
        return Dataset{std::move(targets), std::move(conditioning),
                       std::move(target_statistics), std::move(conditioning_statistics)};
    }
}

#endif // FATHOM_DATA_NORMALIZATION_HPP
