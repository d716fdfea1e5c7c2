#include "td/tile.hpp"
#include <cstring>

namespace td {

// ------- Names -------

const char* dir_name(Dir d){
  switch (d){
    case Dir::North: return "north";
    case Dir::East:  return "east";
    case Dir::South: return "south";
    case Dir::West:  return "west";
  }
  return "?";
}

bool parse_dir(const char* s, Dir& out){
  for (Dir d: ALL_DIRS){
    if (std::strcmp(s, dir_name(d))==0){ out = d; return true; }
  }
  return false;
}

const char* error_name(Error e){
  switch (e){
    case Error::None:               return "None";
    case Error::InvalidGroundCode:  return "InvalidGroundCode";
    case Error::InvalidContentCode: return "InvalidContentCode";
    case Error::TruncatedTileCode:  return "TruncatedTileCode";
    case Error::IrregularGridShape: return "IrregularGridShape";
    case Error::MissingPlayer:      return "MissingPlayer";
    case Error::MultiplePlayers:    return "MultiplePlayers";
    case Error::MissingGoal:        return "MissingGoal";
    case Error::MultipleGoals:      return "MultipleGoals";
    case Error::UndefinedTileName:  return "UndefinedTileName";
    case Error::UnknownMetadata:    return "UnknownMetadata";
    case Error::BadMetadataValue:   return "BadMetadataValue";
    case Error::FileNotFound:       return "FileNotFound";
    case Error::OutOfBounds:        return "OutOfBounds";
    case Error::NotAdjacent:        return "NotAdjacent";
    case Error::BlockedDestination: return "BlockedDestination";
    case Error::OccupiedTile:       return "OccupiedTile";
    case Error::TooFarFromPlayer:   return "TooFarFromPlayer";
    case Error::NoTowersLeft:       return "NoTowersLeft";
    case Error::GameFinished:       return "GameFinished";
  }
  return "?";
}

// ------- Tile rules -------

bool Tile::is_walkable_by(ContentKind actor) const {
  if (content!=ContentKind::Empty) return false;
  switch (actor){
    case ContentKind::Player: return ground!=GroundKind::Water;
    case ContentKind::Enemy:  return ground==GroundKind::Path;
    default: return false; // towers, rocks and the goal never move
  }
}

// ------- Codes -------

Error ground_from_code(char c, GroundKind& out){
  switch (c){
    case 'O': out = GroundKind::Grass; return Error::None;
    case 'x': out = GroundKind::Water; return Error::None;
    case '|': out = GroundKind::Path;  return Error::None;
    default:  return Error::InvalidGroundCode;
  }
}

Error content_from_code(char c, ContentKind& out){
  switch (c){
    case '-': out = ContentKind::Empty;  return Error::None;
    case 'p': out = ContentKind::Player; return Error::None;
    case 'e': out = ContentKind::Enemy;  return Error::None;
    case 't': out = ContentKind::Tower;  return Error::None;
    case 'r': out = ContentKind::Rock;   return Error::None;
    case 'g': out = ContentKind::Goal;   return Error::None;
    default:  return Error::InvalidContentCode;
  }
}

Error tile_from_code(char ground, char content, Tile& out){
  Tile t;
  Error e = ground_from_code(ground, t.ground);
  if (e!=Error::None) return e;
  e = content_from_code(content, t.content);
  if (e!=Error::None) return e;
  out = t;
  return Error::None;
}

char ground_code(GroundKind g){
  switch (g){
    case GroundKind::Grass: return 'O';
    case GroundKind::Water: return 'x';
    case GroundKind::Path:  return '|';
  }
  return '?';
}

char content_code(ContentKind c){
  switch (c){
    case ContentKind::Empty:  return '-';
    case ContentKind::Player: return 'p';
    case ContentKind::Enemy:  return 'e';
    case ContentKind::Tower:  return 't';
    case ContentKind::Rock:   return 'r';
    case ContentKind::Goal:   return 'g';
  }
  return '?';
}

std::string tile_code(const Tile& t){
  return std::string{ground_code(t.ground), content_code(t.content)};
}

} // namespace td
