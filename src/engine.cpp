#include "td/engine.hpp"
#include <algorithm>
#include <climits>
#include <stdexcept>
#include <string>
#include <utility>

namespace td {

const char* phase_name(Phase p){
  switch (p){
    case Phase::AwaitingPlayerInput: return "AwaitingPlayerInput";
    case Phase::EnemyPhase:          return "EnemyPhase";
    case Phase::TowerPhase:          return "TowerPhase";
    case Phase::GameOver:            return "GameOver";
    case Phase::Victory:             return "Victory";
  }
  return "?";
}

Engine::Engine(Level level)
  : w_(std::move(level.world)), pending_(std::move(level.spawns)) {
  apply_spawns();
}

// ------- Player phase -------

Error Engine::submit(const Intent& in){
  if (finished()) return Error::GameFinished;
  if (phase_!=Phase::AwaitingPlayerInput)
    throw std::logic_error("submit outside the player phase");

  Error e = Error::None;
  Coord target = step(w_.player(), in.dir);
  switch (in.kind){
    case IntentKind::Move:       e = w_.move_entity(ContentKind::Player, w_.player(), target); break;
    case IntentKind::PlaceTower: e = w_.place_tower(target, in.dir); break;
    case IntentKind::Skip:       break;
  }
  if (e!=Error::None) return e;

  phase_ = Phase::EnemyPhase;
  return Error::None;
}

// ------- Enemy / tower phases -------

void Engine::advance(){
  switch (phase_){
    case Phase::EnemyPhase: enemy_phase(); break;
    case Phase::TowerPhase: tower_phase(); break;
    default: throw std::logic_error(std::string("advance from ") + phase_name(phase_));
  }
}

void Engine::enemy_phase(){
  shots_.clear();
  // Nobody dies while walking, so the id list stays valid for the whole pass.
  std::vector<EnemyId> ids;
  for (auto &e: w_.enemies()) ids.push_back(e.id);

  // Closest to the goal first, so a convoy moves as one; ties keep load
  // order and stranded enemies go last.
  auto rank = [this](EnemyId id){
    int d = w_.path_distance(w_.enemy(id).pos);
    return d<0 ? INT_MAX : d;
  };
  std::stable_sort(ids.begin(), ids.end(),
                   [&](EnemyId a, EnemyId b){ return rank(a) < rank(b); });

  for (EnemyId id: ids){
    if (w_.advance_enemy(id)==StepOutcome::ReachedGoal){
      phase_  = Phase::GameOver;
      reason_ = LossReason::EnemyReachedGoal;
      return;
    }
  }
  phase_ = Phase::TowerPhase;
}

void Engine::tower_phase(){
  shots_.clear();
  for (auto &t: w_.towers()) shots_.push_back(resolve_shot(w_, t));

  ++turn_;
  apply_spawns();
  phase_ = (w_.enemies().empty() && pending_.empty()) ? Phase::Victory
                                                      : Phase::AwaitingPlayerInput;
}

// Due spawns land on their cell, or wait a turn if it is taken.
void Engine::apply_spawns(){
  std::vector<SpawnEvent> later;
  for (auto &ev: pending_){
    if (ev.turn>turn_){ later.push_back(ev); continue; }
    if (w_.spawn_enemy(ev.at)<0) later.push_back(SpawnEvent{turn_+1, ev.at});
  }
  pending_ = std::move(later);
}

TurnReport Engine::play_turn(const Intent& in){
  TurnReport tr;
  tr.rejected = submit(in);
  tr.phase = phase_;
  if (tr.rejected!=Error::None) return tr;

  while (!finished() && phase_!=Phase::AwaitingPlayerInput) advance();
  for (auto &s: shots_){
    tr.hits  += s.hit;
    tr.kills += s.killed;
  }
  tr.phase = phase_;
  return tr;
}

} // namespace td
