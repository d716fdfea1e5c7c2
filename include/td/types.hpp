#pragma once
#include <cstdint>

namespace td {

constexpr int ENEMY_HP     = 5;   // every enemy spawns with this many hit points
constexpr int TOWER_DAMAGE = 1;   // one shot, one point

enum class Dir : uint8_t { North=0, East=1, South=2, West=3 };

constexpr Dir ALL_DIRS[4] = { Dir::North, Dir::East, Dir::South, Dir::West };

struct Coord {
  int row{0}, col{0};
  bool operator==(const Coord& o) const { return row==o.row && col==o.col; }
  bool operator!=(const Coord& o) const { return !(*this==o); }
};

inline int drow(Dir d){ return (d==Dir::South)-(d==Dir::North); }
inline int dcol(Dir d){ return (d==Dir::East)-(d==Dir::West); }
inline Coord step(Coord c, Dir d){ return Coord{c.row+drow(d), c.col+dcol(d)}; }

inline bool adjacent(Coord a, Coord b){
  int dr = a.row-b.row, dc = a.col-b.col;
  return (dr*dr + dc*dc) == 1;
}

const char* dir_name(Dir d);
bool parse_dir(const char* s, Dir& out); // accepts north/east/south/west

// Everything the core can refuse, load-time and turn-time alike.
enum class Error : uint8_t {
  None = 0,
  // level loading
  InvalidGroundCode, InvalidContentCode, TruncatedTileCode, IrregularGridShape,
  MissingPlayer, MultiplePlayers, MissingGoal, MultipleGoals,
  UndefinedTileName, UnknownMetadata, BadMetadataValue, FileNotFound,
  // player turn
  OutOfBounds, NotAdjacent, BlockedDestination, OccupiedTile, TooFarFromPlayer,
  NoTowersLeft, GameFinished,
};

const char* error_name(Error e);

} // namespace td
