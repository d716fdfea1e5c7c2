#include "td/render.hpp"
#include <sstream>

namespace td {

static char facing_glyph(Dir d){
  switch (d){
    case Dir::North: return '^';
    case Dir::East:  return '>';
    case Dir::South: return 'v';
    case Dir::West:  return '<';
  }
  return '?';
}

std::string render_ascii(const Engine& g){
  const World& w = g.world();
  std::ostringstream os;
  os << "Turn " << g.turn() << " (" << phase_name(g.phase()) << ")";
  if (w.towers_left()>=0) os << "  towers left: " << w.towers_left();
  os << "\n";

  for (int r=0;r<w.height();r++){
    for (int c=0;c<w.width();c++){
      Coord p{r,c};
      const Tile& t = w.at(p);
      char content = content_code(t.content);
      if (t.content==ContentKind::Tower){
        for (auto &tw: w.towers()) if (tw.pos==p) content = facing_glyph(tw.facing);
      }
      if (w.enemy_at(p) && p==w.goal()) content = 'E';
      os << ground_code(t.ground) << content << ' ';
    }
    os << "\n";
  }

  for (auto &e: w.enemies()){
    os << "enemy #" << e.id << " at (" << e.pos.row << "," << e.pos.col << ") hp " << e.hp << "\n";
  }
  return os.str();
}

} // namespace td
