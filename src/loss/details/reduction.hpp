#ifndef FATHOM_LOSS_REDUCTION_HPP
#define FATHOM_LOSS_REDUCTION_HPP

#include <torch/torch.h>

namespace Fathom::Loss::Details {

    enum class Reduction { Mean, Sum, None };

    inline torch::Tensor apply_reduction(torch::Tensor loss, Reduction reduction) {
        switch (reduction) {
            case Reduction::None:
                return loss;
            case Reduction::Sum:
                return loss.sum();
            case Reduction::Mean:
            default:
                return loss.mean();
        }
    }
}

#endif // FATHOM_LOSS_REDUCTION_HPP
