#ifndef FATHOM_NETWORK_HPP
#define FATHOM_NETWORK_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"

#include "details/decoder.hpp"
#include "details/encoder.hpp"
#include "details/feedforward.hpp"
#include "details/gaussian.hpp"

namespace Fathom::Network {
    using DiagonalGaussian = Details::DiagonalGaussian;
    using EncoderOptions = Details::EncoderOptions;
    using DecoderOptions = Details::DecoderOptions;
    using FeedForwardOptions = Details::FeedForwardOptions;
    using DropoutPlacement = Details::DropoutPlacement;

    using Encoder = Details::Encoder;
    using Decoder = Details::Decoder;
    using FeedForward = Details::FeedForward;

    using Details::kl_divergence;
    using Details::kStdFloor;
    using Details::standard_normal;
}

#endif //FATHOM_NETWORK_HPP
