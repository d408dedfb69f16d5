#ifndef FATHOM_DATA_HPP
#define FATHOM_DATA_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include "details/normalization.hpp"
#include "details/split.hpp"
#include "details/synthetic.hpp"

namespace Fathom::Data {
    using NormalizeOptions = Details::NormalizeOptions;
    using Statistics = Details::Statistics;
    using Dataset = Details::Dataset;

    using SplitOptions = Details::SplitOptions;
    using Partition = Details::Partition;

    using SyntheticOptions = Details::SyntheticOptions;
    using RawDataset = Details::RawDataset;

    using Details::Normalize;
    using Details::Split;
    using Details::Synthetic;
}
#endif //FATHOM_DATA_HPP
