#pragma once
#include "td/world.hpp"
#include <string>
#include <vector>

namespace td {

struct SpawnEvent {
  int   turn{0};
  Coord at;
};

// A parsed level: the initial world plus the scripted parts of the file.
struct Level {
  World world;
  std::vector<SpawnEvent> spawns;
  bool spaced{false};   // rows were written with whitespace between codes
  bool final_newline{true};
};

struct LoadResult {
  Level level;
  Error error{Error::None};
  int   line{0};     // 1-based, 0 when the error is not tied to a line
  int   column{0};   // 1-based character column, 0 when not applicable
  bool  ok() const { return error==Error::None; }
};

// Rows are "OpO-|e..."-style lines; '~' starts a comment line and '@'
// a metadata line (tile, max_towers, event, facing). On failure the
// level is left default-constructed.
LoadResult parse_level(const std::vector<std::string>& lines);
LoadResult parse_level_text(const std::string& text);
LoadResult load_level_file(const std::string& path);

std::string describe(const LoadResult& r);

// Current tiles back in level-file form, one row per line.
std::string serialize_grid(const World& w, bool spaced=false, bool final_newline=true);

} // namespace td
