#ifndef FATHOM_ANNEALING_REGISTRY_HPP
#define FATHOM_ANNEALING_REGISTRY_HPP

#include <cstddef>
#include <variant>

#include "details/constant.hpp"
#include "details/cyclic.hpp"

namespace Fathom::Annealing::Details {
    using Descriptor = std::variant<CyclicDescriptor, ConstantDescriptor>;

    [[nodiscard]] inline double evaluate(const CyclicDescriptor& descriptor, std::size_t epoch) {
        return beta_cyclic_anneal(epoch, descriptor.options);
    }

    [[nodiscard]] inline double evaluate(const ConstantDescriptor& descriptor, std::size_t epoch) {
        return beta_constant(epoch, descriptor.options);
    }

    inline void validate(const Descriptor& descriptor) {
        std::visit([](const auto& concrete) { validate(concrete.options); }, descriptor);
    }

    [[nodiscard]] inline double evaluate(const Descriptor& descriptor, std::size_t epoch) {
        return std::visit([epoch](const auto& concrete) { return evaluate(concrete, epoch); }, descriptor);
    }
}

#endif //FATHOM_ANNEALING_REGISTRY_HPP
