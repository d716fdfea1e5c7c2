#pragma once
#include "td/fire.hpp"
#include "td/level.hpp"
#include <vector>

namespace td {

enum class Phase : uint8_t { AwaitingPlayerInput, EnemyPhase, TowerPhase, GameOver, Victory };

enum class LossReason : uint8_t { None, EnemyReachedGoal };

enum class IntentKind : uint8_t { Move, PlaceTower, Skip };

struct Intent {
  IntentKind kind{IntentKind::Skip};
  Dir        dir{Dir::North};

  static Intent move(Dir d)  { return Intent{IntentKind::Move, d}; }
  static Intent place(Dir d) { return Intent{IntentKind::PlaceTower, d}; }
  static Intent skip()       { return Intent{}; }
};

struct TurnReport {
  Error rejected{Error::None};  // the intent was refused, nothing else ran
  int   kills{0};
  int   hits{0};
  Phase phase{Phase::AwaitingPlayerInput};
};

const char* phase_name(Phase p);

// Player -> Enemy -> Tower, repeated until an enemy reaches the goal or
// none are left. Owns the world for the whole game; callers only ever
// see it through const references between phases.
class Engine {
public:
  explicit Engine(Level level);

  Phase      phase()       const { return phase_; }
  LossReason loss_reason() const { return reason_; }
  int        turn()        const { return turn_; }
  bool       finished()    const { return phase_==Phase::GameOver || phase_==Phase::Victory; }
  const World& world()     const { return w_; }
  const std::vector<Shot>&       last_shots()     const { return shots_; }
  const std::vector<SpawnEvent>& pending_spawns() const { return pending_; }

  // Player phase. A refused intent leaves the phase unchanged.
  Error submit(const Intent& in);
  // Runs the current enemy or tower phase to completion.
  void  advance();
  // submit + advance until the player is asked again or the game ends.
  TurnReport play_turn(const Intent& in);

private:
  World w_;
  std::vector<SpawnEvent> pending_;
  std::vector<Shot>       shots_;
  Phase      phase_{Phase::AwaitingPlayerInput};
  LossReason reason_{LossReason::None};
  int        turn_{0};

  void enemy_phase();
  void tower_phase();
  void apply_spawns();
};

} // namespace td
