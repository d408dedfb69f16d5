#ifndef FATHOM_INITIALIZATION_APPLY_HPP
#define FATHOM_INITIALIZATION_APPLY_HPP

#include <algorithm>
#include <array>
#include <cctype>
#include <string>
#include <string_view>

#include <torch/torch.h>

#include "../common/error.hpp"
#include "initialization.hpp"

namespace Fathom::Initialization::Details {
    inline void zero_bias_if_present(const torch::nn::Linear& module) {
        if (module->bias.defined()) {
            torch::nn::init::zeros_(module->bias);
        }
    }

    // Default keeps the LibTorch Linear initialisation (Kaiming uniform, a = sqrt(5)).
    inline void apply_linear_initialization(const torch::nn::Linear& module, ::Fathom::Initialization::Descriptor descriptor) {
        if (!(descriptor.gain > 0.0)) {
            throw ::Fathom::ConfigurationError("Initialization gain must be positive.");
        }
        torch::NoGradGuard no_grad{};
        switch (descriptor.type) {
            case ::Fathom::Initialization::Type::XavierNormal:
                torch::nn::init::xavier_normal_(module->weight, descriptor.gain);
                zero_bias_if_present(module);
                break;
            case ::Fathom::Initialization::Type::XavierUniform:
                torch::nn::init::xavier_uniform_(module->weight, descriptor.gain);
                zero_bias_if_present(module);
                break;
            case ::Fathom::Initialization::Type::HeNormal:
                torch::nn::init::kaiming_normal_(module->weight, /*a=*/0.0, torch::kFanIn, torch::kReLU);
                module->weight.mul_(descriptor.gain);
                zero_bias_if_present(module);
                break;
            case ::Fathom::Initialization::Type::HeUniform:
                torch::nn::init::kaiming_uniform_(module->weight, /*a=*/0.0, torch::kFanIn, torch::kReLU);
                module->weight.mul_(descriptor.gain);
                zero_bias_if_present(module);
                break;
            case ::Fathom::Initialization::Type::ZeroBias:
                zero_bias_if_present(module);
                break;
            case ::Fathom::Initialization::Type::Default:
            default:
                break;
        }
    }

    struct NamedType {
        std::string_view name;
        ::Fathom::Initialization::Type type;
    };

    inline constexpr std::array<NamedType, 6> kNames{{
        {"default", ::Fathom::Initialization::Type::Default},
        {"xavier_normal", ::Fathom::Initialization::Type::XavierNormal},
        {"xavier_uniform", ::Fathom::Initialization::Type::XavierUniform},
        {"he_normal", ::Fathom::Initialization::Type::HeNormal},
        {"he_uniform", ::Fathom::Initialization::Type::HeUniform},
        {"zero_bias", ::Fathom::Initialization::Type::ZeroBias},
    }};

    [[nodiscard]] inline std::string to_string(::Fathom::Initialization::Type type) {
        for (const auto& entry : kNames) {
            if (entry.type == type) {
                return std::string(entry.name);
            }
        }
        return "default";
    }

    // Case-insensitive; accepts the names written by to_string.
    [[nodiscard]] inline ::Fathom::Initialization::Descriptor from_string(std::string name) {
        std::transform(name.begin(), name.end(), name.begin(), [](unsigned char character) {
            return static_cast<char>(std::tolower(character));
        });
        for (const auto& entry : kNames) {
            if (entry.name == name) {
                return ::Fathom::Initialization::Descriptor{entry.type};
            }
        }
        throw ::Fathom::ConfigurationError("Unknown initialization '" + name + "'.");
    }
}
#endif // FATHOM_INITIALIZATION_APPLY_HPP
