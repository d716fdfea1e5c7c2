#pragma once
#include "td/engine.hpp"
#include <string>

namespace td {

// Board in level-file codes, one row per line, with enemy hit points
// and tower facings listed underneath.
std::string render_ascii(const Engine& g);

} // namespace td
