#include "td/world.hpp"
#include <algorithm>
#include <deque>
#include <stdexcept>
#include <string>
#include <utility>

namespace td {

// ------- Construction -------

World::World(int height, int width, std::vector<Tile> tiles)
  : h_(height), w_(width), tiles_(std::move(tiles)) {
  if (h_<0 || w_<0 || tiles_.size()!=size_t(h_)*size_t(w_))
    throw std::logic_error("World: tile count does not match shape");
  index_entities();
  compute_paths();
}

void World::index_entities(){
  enemy_at_.assign(tiles_.size(), -1);
  for (int r=0;r<h_;r++) for (int c=0;c<w_;c++){
    Coord p{r,c};
    switch (at(p).content){
      case ContentKind::Player: player_ = p; break;
      case ContentKind::Goal:   goal_ = p; break;
      case ContentKind::Rock:   rocks_.push_back(p); break;
      case ContentKind::Tower:  towers_.push_back(Tower{p, Dir::East}); break;
      case ContentKind::Enemy: {
        Enemy e; e.id = next_id_++; e.pos = p; e.hp = ENEMY_HP;
        enemy_at_[idx(p)] = e.id;
        enemies_.push_back(e);
        break;
      }
      case ContentKind::Empty: break;
    }
  }
}

// Breadth-first from the goal over path tiles. The goal's own ground
// does not matter; it is the root of the network.
void World::compute_paths(){
  dist_.assign(tiles_.size(), -1);
  next_dir_.assign(tiles_.size(), -1);
  if (!in_bounds(goal_)) return;

  std::deque<Coord> open;
  dist_[idx(goal_)] = 0;
  open.push_back(goal_);
  while (!open.empty()){
    Coord cur = open.front(); open.pop_front();
    for (Dir d: ALL_DIRS){
      Coord n = step(cur, d);
      if (!in_bounds(n) || dist_[idx(n)]!=-1) continue;
      if (at(n).ground!=GroundKind::Path) continue;
      dist_[idx(n)] = dist_[idx(cur)] + 1;
      open.push_back(n);
    }
  }

  for (int r=0;r<h_;r++) for (int c=0;c<w_;c++){
    Coord p{r,c};
    int dp = dist_[idx(p)];
    if (dp<=0) continue;
    for (Dir d: ALL_DIRS){
      Coord n = step(p, d);
      if (in_bounds(n) && dist_[idx(n)]==dp-1){ next_dir_[idx(p)] = int8_t(d); break; }
    }
  }
}

// ------- Queries -------

Error World::tile_at(Coord c, Tile& out) const {
  if (!in_bounds(c)) return Error::OutOfBounds;
  out = tiles_[idx(c)];
  return Error::None;
}

const Tile& World::at(Coord c) const {
  if (!in_bounds(c))
    throw std::out_of_range("World::at(" + std::to_string(c.row) + "," + std::to_string(c.col) + ")");
  return tiles_[idx(c)];
}

const Enemy* World::enemy_at(Coord c) const {
  if (!in_bounds(c)) return nullptr;
  int id = enemy_at_[idx(c)];
  if (id<0) return nullptr;
  return &enemy(id);
}

Enemy* World::find_enemy(EnemyId id){
  auto it = std::find_if(enemies_.begin(), enemies_.end(),
                         [id](const Enemy& e){ return e.id==id; });
  return it==enemies_.end() ? nullptr : &*it;
}

const Enemy& World::enemy(EnemyId id) const {
  auto it = std::find_if(enemies_.begin(), enemies_.end(),
                         [id](const Enemy& e){ return e.id==id; });
  if (it==enemies_.end())
    throw std::logic_error("no live enemy with id " + std::to_string(id));
  return *it;
}

bool World::has_enemy_reached_goal() const {
  for (auto &e: enemies_) if (e.pos==goal_) return true;
  return false;
}

int World::path_distance(Coord c) const {
  return in_bounds(c) ? dist_[idx(c)] : -1;
}

bool World::next_step(Coord c, Dir& out) const {
  if (!in_bounds(c) || next_dir_[idx(c)]<0) return false;
  out = Dir(next_dir_[idx(c)]);
  return true;
}

// ------- Mutations -------

Error World::move_entity(ContentKind kind, Coord from, Coord to){
  if (kind!=ContentKind::Player && kind!=ContentKind::Enemy)
    throw std::logic_error("move_entity: only players and enemies move");
  if (!in_bounds(from) || at(from).content!=kind)
    throw std::logic_error("move_entity: source cell does not hold the entity");

  if (!in_bounds(to))              return Error::OutOfBounds;
  if (!adjacent(from, to))         return Error::NotAdjacent;
  if (!at(to).is_walkable_by(kind)) return Error::BlockedDestination;

  tile_mut(from).content = ContentKind::Empty;
  tile_mut(to).content   = kind;
  if (kind==ContentKind::Player){
    player_ = to;
  } else {
    int id = enemy_at_[idx(from)];
    enemy_at_[idx(from)] = -1;
    enemy_at_[idx(to)]   = id;
    find_enemy(id)->pos  = to;
  }
  return Error::None;
}

Error World::place_tower(Coord c, Dir facing){
  if (!in_bounds(c))           return Error::OutOfBounds;
  if (!adjacent(player_, c))   return Error::TooFarFromPlayer;
  const Tile& t = at(c);
  if (t.content!=ContentKind::Empty || t.ground==GroundKind::Water) return Error::OccupiedTile;
  if (towers_left_==0)         return Error::NoTowersLeft;

  tile_mut(c).content = ContentKind::Tower;
  towers_.push_back(Tower{c, facing});
  if (towers_left_>0) --towers_left_;
  return Error::None;
}

bool World::set_tower_facing(Coord c, Dir facing){
  for (auto &t: towers_){
    if (t.pos==c){ t.facing = facing; return true; }
  }
  return false;
}

bool World::apply_damage(EnemyId id, int amount){
  Enemy* e = find_enemy(id);
  if (!e) throw std::logic_error("apply_damage on dead enemy " + std::to_string(id));
  e->hp = std::max(0, e->hp - amount);
  if (e->alive()) return false;

  Coord p = e->pos;
  enemy_at_[idx(p)] = -1;
  if (p!=goal_) tile_mut(p).content = ContentKind::Empty;
  enemies_.erase(enemies_.begin() + (e - enemies_.data()));
  return true;
}

EnemyId World::spawn_enemy(Coord c, int hp){
  if (!in_bounds(c) || at(c).content!=ContentKind::Empty || hp<=0) return -1;
  Enemy e; e.id = next_id_++; e.pos = c; e.hp = hp;
  tile_mut(c).content = ContentKind::Enemy;
  enemy_at_[idx(c)] = e.id;
  enemies_.push_back(e);
  return e.id;
}

StepOutcome World::advance_enemy(EnemyId id){
  Enemy* e = find_enemy(id);
  if (!e) throw std::logic_error("advance_enemy on dead enemy " + std::to_string(id));

  Dir d;
  if (!next_step(e->pos, d)) return StepOutcome::Stranded;
  Coord to = step(e->pos, d);

  // The goal keeps its content; the enemy just stands on it.
  if (to==goal_){
    tile_mut(e->pos).content = ContentKind::Empty;
    enemy_at_[idx(e->pos)] = -1;
    enemy_at_[idx(to)] = id;
    e->pos = to;
    return StepOutcome::ReachedGoal;
  }
  if (move_entity(ContentKind::Enemy, e->pos, to)!=Error::None) return StepOutcome::Waited;
  return StepOutcome::Moved;
}

} // namespace td
