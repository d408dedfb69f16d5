#ifndef FATHOM_DATA_SYNTHETIC_HPP
#define FATHOM_DATA_SYNTHETIC_HPP

#include <cstdint>
#include <utility>

#include <ATen/CPUGeneratorImpl.h>
#include <torch/torch.h>

#include "../../common/error.hpp"

namespace Fathom::Data::Details {
    struct SyntheticOptions {
        int64_t samples{200};
        int64_t locations{64};
        double noise{0.05};
        std::uint64_t seed{42};
    };

    struct RawDataset {
        torch::Tensor targets;       // (samples, locations) damage-equivalent loads
        torch::Tensor conditioning;  // (samples, 3): turbulence intensity, wind speed, shear exponent
    };

    // Damage-equivalent load around a cross-section, sampled at evenly spaced polar
    // angles. Amplitude grows with wind speed and turbulence, shear skews the
    // fore-aft lobe, and a multiplicative log-normal term stands in for seed noise.
    inline RawDataset Synthetic(const SyntheticOptions& options = {})
    {
        if (options.samples <= 0 || options.locations <= 0 || options.noise < 0.0) {
            throw ::Fathom::ConfigurationError("Synthetic dataset requires positive sizes and non-negative noise.");
        }

        auto generator = at::make_generator<at::CPUGeneratorImpl>(options.seed);
        const auto float_options = torch::TensorOptions().dtype(torch::kFloat32);
        constexpr double kTwoPi = 6.283185307179586;

        auto turbulence = 0.05 + 0.20 * torch::rand({options.samples, 1}, generator, float_options);
        auto wind_speed = 4.0 + 21.0 * torch::rand({options.samples, 1}, generator, float_options);
        auto shear = 0.40 * torch::rand({options.samples, 1}, generator, float_options);

        auto angle = torch::arange(options.locations, float_options).unsqueeze(0) * (kTwoPi / static_cast<double>(options.locations));

        auto amplitude = torch::pow(wind_speed / 10.0, 1.5) * (1.0 + 4.0 * turbulence);
        auto lobes = 1.0 + shear * torch::cos(angle) + 0.3 * torch::sin(2.0 * angle).pow(2);
        auto noise = torch::exp(options.noise * torch::randn({options.samples, options.locations}, generator, float_options));

        auto targets = amplitude * lobes * noise;
        auto conditioning = torch::cat({turbulence, wind_speed, shear}, /*dim=*/1);
        return RawDataset{std::move(targets), std::move(conditioning)};
    }
}

#endif // FATHOM_DATA_SYNTHETIC_HPP
