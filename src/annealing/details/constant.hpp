#ifndef FATHOM_ANNEALING_CONSTANT_HPP
#define FATHOM_ANNEALING_CONSTANT_HPP
#include <cstddef>

#include "../../common/error.hpp"

namespace Fathom::Annealing::Details {
    struct ConstantOptions {
        double beta{1.0};
    };

    struct ConstantDescriptor {
        ConstantOptions options{};
    };

    inline void validate(const ConstantOptions& options) {
        if (options.beta < 0.0) {
            throw ::Fathom::ConfigurationError("Constant annealing requires a non-negative beta.");
        }
    }

    [[nodiscard]] inline double beta_constant(std::size_t, const ConstantOptions& options) {
        validate(options);
        return options.beta;
    }
}

#endif //FATHOM_ANNEALING_CONSTANT_HPP
