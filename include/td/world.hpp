#pragma once
#include "td/tile.hpp"
#include <vector>

namespace td {

// Stable handle, never reused within a World. A dead id is rejected
// rather than silently aliasing another enemy.
using EnemyId = int;

struct Enemy {
  EnemyId id{-1};
  Coord   pos;
  int     hp{0};
  bool    alive() const { return hp > 0; }
};

struct Tower {
  Coord pos;
  Dir   facing{Dir::East};
};

enum class StepOutcome : uint8_t {
  Moved,        // one cell closer to the goal
  Waited,       // next cell is occupied this turn
  Stranded,     // not on a path connected to the goal
  ReachedGoal,
};

// Owns the tile matrix and every entity index derived from it.
// Shape is fixed at construction; ground never changes afterwards.
class World {
public:
  World() = default;
  // tiles is row-major, height*width entries. Entity lists are rebuilt
  // from the content layer; the caller validates player/goal counts.
  World(int height, int width, std::vector<Tile> tiles);

  int  height() const { return h_; }
  int  width()  const { return w_; }
  bool in_bounds(Coord c) const { return 0<=c.row && c.row<h_ && 0<=c.col && c.col<w_; }

  Error       tile_at(Coord c, Tile& out) const;
  const Tile& at(Coord c) const;  // throws std::out_of_range

  // Player/enemy one-step move. Ground is preserved at both ends.
  Error move_entity(ContentKind kind, Coord from, Coord to);
  Error place_tower(Coord c, Dir facing);

  const std::vector<Enemy>& enemies() const { return enemies_; }
  const std::vector<Tower>& towers()  const { return towers_; }
  const std::vector<Coord>& rocks()   const { return rocks_; }
  Coord player() const { return player_; }
  Coord goal()   const { return goal_; }

  const Enemy* enemy_at(Coord c) const;
  const Enemy& enemy(EnemyId id) const;   // throws std::logic_error if dead

  // Returns true when the hit killed the enemy (entry and tile cleared).
  bool    apply_damage(EnemyId id, int amount);
  // -1 when the cell is out of bounds or not empty.
  EnemyId spawn_enemy(Coord c, int hp = ENEMY_HP);
  StepOutcome advance_enemy(EnemyId id);
  bool    has_enemy_reached_goal() const;

  bool set_tower_facing(Coord c, Dir facing);

  // Path network, computed once from the goal.
  int  path_distance(Coord c) const;           // -1 when unreachable
  bool next_step(Coord c, Dir& out) const;

  int  towers_left() const { return towers_left_; } // -1: unlimited
  void set_tower_budget(int n) { towers_left_ = n; }

private:
  int h_{0}, w_{0};
  std::vector<Tile>   tiles_;
  std::vector<int>    enemy_at_;   // per cell: EnemyId or -1
  std::vector<int>    dist_;       // per cell: steps to goal along the path, -1 off-network
  std::vector<int8_t> next_dir_;   // per cell: Dir toward goal, -1 none
  std::vector<Enemy>  enemies_;    // insertion order
  std::vector<Tower>  towers_;
  std::vector<Coord>  rocks_;
  Coord   player_{-1,-1};
  Coord   goal_{-1,-1};
  EnemyId next_id_{0};
  int     towers_left_{-1};

  int  idx(Coord c) const { return c.row*w_ + c.col; }
  Tile& tile_mut(Coord c) { return tiles_[idx(c)]; }
  Enemy* find_enemy(EnemyId id);
  void index_entities();
  void compute_paths();
};

} // namespace td
