#pragma once
#include "td/world.hpp"

namespace td {

struct Shot {
  bool    hit{false};
  bool    killed{false};
  EnemyId target{-1};
  Coord   stopped_at{-1,-1};  // last cell scanned: the enemy, the blocker, or the last in-bounds cell
};

// Scan from the tower outward along its facing. The first enemy on the
// ray takes TOWER_DAMAGE; a rock, the goal, another tower, the player or
// the edge of the grid ends the ray with no effect. At most one enemy is hit per call.
Shot resolve_shot(World& w, const Tower& t);

} // namespace td
