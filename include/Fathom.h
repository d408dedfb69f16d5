#ifndef FATHOM_LIBRARY_H
#define FATHOM_LIBRARY_H

#include "../src/core.hpp"
#include "../src/activation/activation.hpp"
#include "../src/annealing/annealing.hpp"
#include "../src/common/save_load.hpp"
#include "../src/data/data.hpp"
#include "../src/initialization/initialization.hpp"
#include "../src/loss/loss.hpp"
#include "../src/network/network.hpp"
#include "../src/optimizer/optimizer.hpp"

// Public umbrella header.
// -----------------------------------------------------------------------------
//  - Model (conditional IWAE), its option structs and the training loop.
//  - Data helpers: z-score normalisation, deterministic train/test split and a
//    synthetic fatigue-load generator.
//  - Header-only; link against LibTorch and put Boost on the include path.

#endif // FATHOM_LIBRARY_H
