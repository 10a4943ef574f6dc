#ifndef GRADUS_DATA_HPP
#define GRADUS_DATA_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "load/", "transform/" and "loader/"
#include "load/load.hpp"
#include "transform/manipulation.hpp"
#include "loader/loader.hpp"
#endif //GRADUS_DATA_HPP
