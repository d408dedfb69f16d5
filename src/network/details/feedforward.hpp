#ifndef FATHOM_NETWORK_FEEDFORWARD_HPP
#define FATHOM_NETWORK_FEEDFORWARD_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../../activation/activation.hpp"
#include "../../activation/apply.hpp"
#include "../../initialization/apply.hpp"
#include "../../initialization/initialization.hpp"

namespace Fathom::Network::Details {
    enum class DropoutPlacement {
        // After every hidden activation except the first (encoder body).
        SkipFirst,
        // Between consecutive hidden layers, never after the last (decoder body).
        BetweenLayers,
    };

    struct FeedForwardOptions {
        int64_t in_features{};
        int64_t width{64};
        int64_t layers{2};
        ::Fathom::Activation::Descriptor activation{::Fathom::Activation::ReLU};
        double dropout{0.2};
        ::Fathom::Initialization::Descriptor initialization{::Fathom::Initialization::Default};
        DropoutPlacement placement{DropoutPlacement::SkipFirst};
    };

    // Stack of Linear -> activation with dropout placed according to
    // options.placement. Linear acts on the last axis, so (K, batch, features)
    // inputs pass through unchanged in their leading axes.
    class FeedForwardImpl : public torch::nn::Module {
    public:
        explicit FeedForwardImpl(FeedForwardOptions options)
            : options_(std::move(options))
        {
            TORCH_CHECK(options_.in_features > 0 && options_.width > 0 && options_.layers > 0,
                        "FeedForward requires positive input features, width and layer count.");
            TORCH_CHECK(options_.dropout >= 0.0 && options_.dropout < 1.0, "Dropout rate must lie in [0, 1).");

            for (int64_t index = 0; index < options_.layers; ++index) {
                const auto in = index == 0 ? options_.in_features : options_.width;
                auto linear = register_module("fc_" + std::to_string(index), torch::nn::Linear(in, options_.width));
                ::Fathom::Initialization::Details::apply_linear_initialization(linear, options_.initialization);
                layers_.push_back(std::move(linear));
            }
            dropout_ = register_module("dropout", torch::nn::Dropout(torch::nn::DropoutOptions(options_.dropout)));
        }

        torch::Tensor forward(torch::Tensor input)
        {
            auto value = std::move(input);
            for (std::size_t index = 0; index < layers_.size(); ++index) {
                value = ::Fathom::Activation::Details::apply(options_.activation.type, layers_[index]->forward(value));
                if (options_.dropout > 0.0 && dropout_after(index)) {
                    value = dropout_->forward(value);
                }
            }
            return value;
        }

        [[nodiscard]] bool dropout_after(std::size_t index) const noexcept
        {
            switch (options_.placement) {
                case DropoutPlacement::BetweenLayers:
                    return index + 1 < layers_.size();
                case DropoutPlacement::SkipFirst:
                default:
                    return index > 0;
            }
        }

        [[nodiscard]] const FeedForwardOptions& options() const noexcept { return options_; }

    private:
        FeedForwardOptions options_{};
        std::vector<torch::nn::Linear> layers_{};
        torch::nn::Dropout dropout_{nullptr};
    };

    TORCH_MODULE(FeedForward);
}

#endif // FATHOM_NETWORK_FEEDFORWARD_HPP
