#include "td/fire.hpp"

namespace td {

// Rocks and the goal by rule; a tower or the player in the way also
// takes the shot.
static bool stops_ray(const Tile& t){
  return t.blocks_line_of_fire() || t.content==ContentKind::Tower
                                 || t.content==ContentKind::Player;
}

Shot resolve_shot(World& w, const Tower& t){
  Shot s;
  Coord cur = t.pos;
  for (;;){
    Coord nxt = step(cur, t.facing);
    if (!w.in_bounds(nxt)){ s.stopped_at = cur; return s; }
    cur = nxt;

    if (const Enemy* e = w.enemy_at(cur)){
      s.hit = true;
      s.target = e->id;
      s.stopped_at = cur;
      s.killed = w.apply_damage(e->id, TOWER_DAMAGE);
      return s;
    }
    if (stops_ray(w.at(cur))){ s.stopped_at = cur; return s; }
  }
}

} // namespace td
