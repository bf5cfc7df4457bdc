#ifndef NABLA_LIBRARY_H
#define NABLA_LIBRARY_H

#include "../src/core.hpp"
#include "../src/activation/activation.hpp"
#include "../src/initialization/initialization.hpp"
#include "../src/layer/layer.hpp"
#include "../src/loss/loss.hpp"
#include "../src/metric/metric.hpp"
#include "../src/optimizer/optimizer.hpp"

#include "../src/data/batch_generator.hpp"
#include "../src/training/history.hpp"



// Public umbrella header.
// -----------------------------------------------------------------------------
// Intention:
//  - Re-export the API surface required by downstream applications
//    (Model entry points plus the layer, loss, metric and optimizer factories).
//  - Include-only components; implementation lives in header-only modules under
//    src/ so the whole engine composes at compile time.

#endif // NABLA_LIBRARY_H
