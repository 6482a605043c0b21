#pragma once
#include "sp/shapes/Shape.hpp"

#include <string>
#include <vector>

namespace sp {

// JSON snapshot of a primitive list:
//   {"shapes":[{"kind":"rect","min":[x,y],"max":[x,y],...}, ...]}
// Used by the demo and for inspecting frames in tests.
std::string shapesToJSON(const std::vector<Shape>& shapes);

} // namespace sp
