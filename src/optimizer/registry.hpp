#ifndef FATHOM_OPTIMIZER_REGISTRY_HPP
#define FATHOM_OPTIMIZER_REGISTRY_HPP

#include <memory>
#include <variant>
#include <vector>

#include <torch/torch.h>

#include "details/adam.hpp"
#include "details/sgd.hpp"

namespace Fathom::Optimizer::Details {
    using Descriptor = std::variant<AdamDescriptor, AdamWDescriptor, SGDDescriptor>;

    inline std::unique_ptr<torch::optim::Optimizer> build_optimizer(std::vector<torch::Tensor> parameters, const AdamDescriptor& descriptor) {
        return std::make_unique<torch::optim::Adam>(std::move(parameters), to_torch_options(descriptor.options));
    }

    inline std::unique_ptr<torch::optim::Optimizer> build_optimizer(std::vector<torch::Tensor> parameters, const AdamWDescriptor& descriptor) {
        return std::make_unique<torch::optim::AdamW>(std::move(parameters), to_torch_options(descriptor.options));
    }

    inline std::unique_ptr<torch::optim::Optimizer> build_optimizer(std::vector<torch::Tensor> parameters, const SGDDescriptor& descriptor) {
        return std::make_unique<torch::optim::SGD>(std::move(parameters), to_torch_options(descriptor.options));
    }

    inline std::unique_ptr<torch::optim::Optimizer> build_optimizer(std::vector<torch::Tensor> parameters, const Descriptor& descriptor) {
        return std::visit([&](const auto& concrete) { return build_optimizer(std::move(parameters), concrete); }, descriptor);
    }
}

#endif // FATHOM_OPTIMIZER_REGISTRY_HPP
