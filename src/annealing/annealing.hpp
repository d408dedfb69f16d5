#ifndef FATHOM_ANNEALING_HPP
#define FATHOM_ANNEALING_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include <cstddef>

#include "details/constant.hpp"
#include "details/cyclic.hpp"
#include "registry.hpp"

namespace Fathom::Annealing {
    using CyclicOptions = Details::CyclicOptions;
    using CyclicDescriptor = Details::CyclicDescriptor;

    using ConstantOptions = Details::ConstantOptions;
    using ConstantDescriptor = Details::ConstantDescriptor;

    using Descriptor = Details::Descriptor;

    using Details::beta_cyclic_anneal;

    [[nodiscard]] constexpr auto Cyclic(const CyclicOptions& options = {}) noexcept -> CyclicDescriptor {
        return {options};
    }

    [[nodiscard]] constexpr auto Constant(double beta) noexcept -> ConstantDescriptor {
        return {ConstantOptions{.beta = beta}};
    }

    [[nodiscard]] inline double value(const Descriptor& descriptor, std::size_t epoch) {
        return Details::evaluate(descriptor, epoch);
    }
}

#endif //FATHOM_ANNEALING_HPP
