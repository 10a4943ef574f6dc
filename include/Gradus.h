#ifndef GRADUS_LIBRARY_H
#define GRADUS_LIBRARY_H

#include "../src/core.hpp"
#include "../src/layer/layer.hpp"
#include "../src/loss/loss.hpp"
#include "../src/optimizer/optimizer.hpp"

#include "../src/autograd/inspect.hpp"
#include "../src/config/config.hpp"
#include "../src/data/data.hpp"
#include "../src/display/display.hpp"
#include "../src/evaluation/evaluation.hpp"
#include "../src/network.hpp"
#include "../src/lesson/lesson.hpp"

// Public umbrella header.
// Every module is header-only under src/; including this file pulls in the
// Model facade, the MNIST network builder and the lesson sections.

#endif // GRADUS_LIBRARY_H
