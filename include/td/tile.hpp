#pragma once
#include "td/types.hpp"
#include <string>

namespace td {

enum class GroundKind : uint8_t { Grass=0, Water=1, Path=2 };

enum class ContentKind : uint8_t { Empty=0, Player, Enemy, Tower, Rock, Goal };

// One cell: terrain layer + occupant layer. The two vary independently.
struct Tile {
  GroundKind  ground{GroundKind::Grass};
  ContentKind content{ContentKind::Empty};

  // Only players and enemies move. Player walks anything but water,
  // enemies stay on the path. Occupied cells are never walkable.
  bool is_walkable_by(ContentKind actor) const;

  // Rocks and the goal stop a shot; terrain never does.
  bool blocks_line_of_fire() const {
    return content==ContentKind::Rock || content==ContentKind::Goal;
  }

  bool operator==(const Tile& o) const { return ground==o.ground && content==o.content; }
  bool operator!=(const Tile& o) const { return !(*this==o); }
};

// Level-file codes: ground first ('O' grass, 'x' water, '|' path),
// then content ('-' 'p' 'e' 't' 'r' 'g').
Error ground_from_code(char c, GroundKind& out);
Error content_from_code(char c, ContentKind& out);
Error tile_from_code(char ground, char content, Tile& out);

char ground_code(GroundKind g);
char content_code(ContentKind c);
std::string tile_code(const Tile& t);

} // namespace td
