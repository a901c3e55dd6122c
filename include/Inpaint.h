#ifndef INPAINT_LIBRARY_H
#define INPAINT_LIBRARY_H

#include "../src/activation/activation.hpp"
#include "../src/initialization/initialization.hpp"
#include "../src/layer/layer.hpp"
#include "../src/block/block.hpp"
#include "../src/optimizer/optimizer.hpp"

#include "../src/network/options.hpp"
#include "../src/network/topology.hpp"
#include "../src/network/generator.hpp"
#include "../src/network/discriminator.hpp"

#include "../src/common/save_load.hpp"
#include "../src/common/config.hpp"
#include "../src/preview/preview.hpp"
#include "../src/utils/summary.hpp"
#include "../src/utils/terminal.hpp"

// Public umbrella header.
// Everything is header-only under src/; applications include this file and
// link libtorch, OpenCV and Boost through the `inpaint` CMake target.

#endif // INPAINT_LIBRARY_H
