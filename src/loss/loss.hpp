#ifndef FATHOM_LOSS_HPP
#define FATHOM_LOSS_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"

#include "details/kl.hpp"
#include "details/mse.hpp"
#include "details/objective.hpp"
#include "details/reduction.hpp"

namespace Fathom::Loss {
    using Reduction = Details::Reduction;
    using Estimator = Details::Estimator;

    using ObjectiveOptions = Details::ObjectiveOptions;
    using ObjectiveDescriptor = Details::ObjectiveDescriptor;
    using ObjectiveResult = Details::ObjectiveResult;

    using Details::compute;

    [[nodiscard]] constexpr auto Objective(const ObjectiveOptions& options = {}) noexcept -> ObjectiveDescriptor {
        return {options};
    }

    [[nodiscard]] constexpr auto ELBO(Reduction reduction = Reduction::None) noexcept -> ObjectiveDescriptor {
        return {ObjectiveOptions{.estimator = Estimator::SampleAverage, .reduction = reduction}};
    }

    [[nodiscard]] constexpr auto IWAE(Reduction reduction = Reduction::None) noexcept -> ObjectiveDescriptor {
        return {ObjectiveOptions{.estimator = Estimator::ImportanceWeighted, .reduction = reduction}};
    }
}

#endif //FATHOM_LOSS_HPP
