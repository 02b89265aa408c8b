#pragma once
#include <string>

namespace specstack {

struct Parameter {
  std::string name;
  double      value  = 0.0;
  std::string unit;
  bool        frozen = false;
};

} // namespace specstack
