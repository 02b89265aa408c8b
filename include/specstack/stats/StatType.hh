#pragma once
#include <string>

namespace specstack::stats {

enum class StatType { Cash, WStat };

inline std::string ToString(StatType t) {
  return t == StatType::Cash ? "cash" : "wstat";
}

} // namespace specstack::stats
