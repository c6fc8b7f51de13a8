#ifndef LATTICE_LIBRARY_H
#define LATTICE_LIBRARY_H

#include "../src/common/error.hpp"
#include "../src/graph/arena.hpp"
#include "../src/graph/tensor.hpp"
#include "../src/layer/layer.hpp"
#include "../src/loss/loss.hpp"
#include "../src/metric/metric.hpp"
#include "../src/optimizer/optimizer.hpp"

#include "../src/model/clone.hpp"
#include "../src/model/generator.hpp"
#include "../src/model/model.hpp"
#include "../src/model/sequential.hpp"
#include "../src/common/save_load.hpp"



// Public umbrella header.
// -----------------------------------------------------------------------------
//  - Re-exports the layer graph (Input, layers, Model, Sequential), the training
//    surface (compile / fit / evaluate / predict) and the archive entry points
//    (save_model, load_model, clone_model).
//  - Header-only: every component lives under src/ and is linked only against
//    libtorch and Boost.PropertyTree.

#endif // LATTICE_LIBRARY_H
