#ifndef FATHOM_ACTIVATION_APPLY_HPP
#define FATHOM_ACTIVATION_APPLY_HPP

#include <algorithm>
#include <array>
#include <cctype>
#include <string>
#include <string_view>
#include <utility>

#include <torch/torch.h>

#include "../common/error.hpp"
#include "activation.hpp"

namespace Fathom::Activation::Details {
    inline torch::Tensor apply(::Fathom::Activation::Type type, torch::Tensor input) {
        switch (type) {
            case ::Fathom::Activation::Type::ReLU:
                return torch::relu(std::move(input));
            case ::Fathom::Activation::Type::LeakyReLU:
                return torch::leaky_relu(std::move(input), 0.01);
            case ::Fathom::Activation::Type::ELU:
                return torch::elu(std::move(input));
            case ::Fathom::Activation::Type::Tanh:
                return torch::tanh(std::move(input));
            case ::Fathom::Activation::Type::Sigmoid:
                return torch::sigmoid(std::move(input));
            case ::Fathom::Activation::Type::SiLU:
                return torch::silu(std::move(input));
            case ::Fathom::Activation::Type::GeLU:
                return torch::gelu(std::move(input));
            case ::Fathom::Activation::Type::Softplus:
                return torch::softplus(std::move(input));
            case ::Fathom::Activation::Type::Identity:
            default:
                return input;
        }
    }

    struct NamedType {
        std::string_view name;
        ::Fathom::Activation::Type type;
    };

    inline constexpr std::array<NamedType, 9> kNames{{
        {"identity", ::Fathom::Activation::Type::Identity},
        {"relu", ::Fathom::Activation::Type::ReLU},
        {"leaky_relu", ::Fathom::Activation::Type::LeakyReLU},
        {"elu", ::Fathom::Activation::Type::ELU},
        {"tanh", ::Fathom::Activation::Type::Tanh},
        {"sigmoid", ::Fathom::Activation::Type::Sigmoid},
        {"silu", ::Fathom::Activation::Type::SiLU},
        {"gelu", ::Fathom::Activation::Type::GeLU},
        {"softplus", ::Fathom::Activation::Type::Softplus},
    }};

    [[nodiscard]] inline std::string to_string(::Fathom::Activation::Type type) {
        for (const auto& entry : kNames) {
            if (entry.type == type) {
                return std::string(entry.name);
            }
        }
        return "identity";
    }

    // Case-insensitive; accepts the names written by to_string.
    [[nodiscard]] inline ::Fathom::Activation::Descriptor from_string(std::string name) {
        std::transform(name.begin(), name.end(), name.begin(), [](unsigned char character) {
            return static_cast<char>(std::tolower(character));
        });
        for (const auto& entry : kNames) {
            if (entry.name == name) {
                return ::Fathom::Activation::Descriptor{entry.type};
            }
        }
        throw ::Fathom::ConfigurationError("Unknown activation '" + name + "'.");
    }
}
#endif // FATHOM_ACTIVATION_APPLY_HPP
