#include "td/level.hpp"
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <map>
#include <sstream>
#include <utility>

namespace td {

namespace {

struct RawRow  { int line; std::string text; };
struct RawMeta { int line; std::string text; };

// A "?X" cell waiting for its "@tile X .." definition.
struct Placeholder { char name; Coord at; int line; int column; };

LoadResult fail(Error e, int line, int column=0){
  LoadResult r;
  r.error = e; r.line = line; r.column = column;
  return r;
}

bool parse_count(const std::string& s, int& out){
  if (s.empty()) return false;
  errno = 0;
  char* end = nullptr;
  long v = std::strtol(s.c_str(), &end, 10);
  if (errno!=0 || *end!='\0' || v<0 || v>1000000) return false;
  out = int(v);
  return true;
}

bool is_blank(const std::string& s){
  for (char c: s) if (!std::isspace((unsigned char)c)) return false;
  return true;
}

} // namespace

// ------- Parsing -------

LoadResult parse_level(const std::vector<std::string>& lines){
  std::vector<RawRow>  rows;
  std::vector<RawMeta> metas;
  for (size_t i=0;i<lines.size();i++){
    std::string s = lines[i];
    if (!s.empty() && s.back()=='\r') s.pop_back();
    if (is_blank(s) || s[0]=='~') continue;
    if (s[0]=='@') metas.push_back({int(i)+1, s.substr(1)});
    else           rows.push_back({int(i)+1, s});
  }

  Level lv;
  std::vector<Tile> tiles;
  std::vector<Placeholder> holes;
  int width = -1;

  for (size_t r=0;r<rows.size();r++){
    const std::string& s = rows[r].text;
    int line = rows[r].line;
    int col_count = 0;
    size_t i = 0;
    bool seen_token = false;
    while (i<s.size()){
      if (std::isspace((unsigned char)s[i])){ ++i; continue; }
      size_t j = i;
      while (j<s.size() && !std::isspace((unsigned char)s[j])) ++j;
      if (seen_token) lv.spaced = true;
      seen_token = true;
      // the dangling character sits at index j-1, i.e. column j
      if ((j-i)%2!=0) return fail(Error::TruncatedTileCode, line, int(j));

      for (size_t k=i;k<j;k+=2){
        Coord at{int(r), col_count};
        if (s[k]=='?'){
          holes.push_back({s[k+1], at, line, int(k)+1});
          tiles.push_back(Tile{});
        } else {
          Tile t;
          Error e = ground_from_code(s[k], t.ground);
          if (e!=Error::None) return fail(e, line, int(k)+1);
          e = content_from_code(s[k+1], t.content);
          if (e!=Error::None) return fail(e, line, int(k)+2);
          tiles.push_back(t);
        }
        ++col_count;
      }
      i = j;
    }
    if (width<0) width = col_count;
    else if (col_count!=width) return fail(Error::IrregularGridShape, line);
  }
  if (width<0) width = 0;
  const int height = int(rows.size());

  // Metadata may sit anywhere in the file, so it is read once the grid
  // shape is known.
  std::map<char, Tile> defs;
  int max_towers = -1;
  std::vector<std::pair<char,int>>  spawn_at;      // name, turn
  std::vector<std::pair<char,Dir>>  facing;
  std::vector<int>                  facing_lines;

  auto named = [&](char name){
    for (auto &h: holes) if (h.name==name) return true;
    return false;
  };

  for (auto &m: metas){
    std::istringstream in(m.text);
    std::string key;
    in >> key;
    if (key=="tile"){
      std::string name, code;
      if (!(in >> name >> code) || name.size()!=1) return fail(Error::BadMetadataValue, m.line);
      if (code.size()!=2) return fail(Error::TruncatedTileCode, m.line);
      Tile t;
      Error e = tile_from_code(code[0], code[1], t);
      if (e!=Error::None) return fail(e, m.line);
      defs[name[0]] = t;
    } else if (key=="max_towers"){
      std::string n;
      if (!(in >> n) || !parse_count(n, max_towers)) return fail(Error::BadMetadataValue, m.line);
    } else if (key=="event"){
      std::string what, creature, name, turn;
      if (!(in >> what >> creature >> name >> turn)) return fail(Error::BadMetadataValue, m.line);
      if (what!="spawn" || creature!="enemy") return fail(Error::UnknownMetadata, m.line);
      int t = 0;
      if (name.size()!=1 || !parse_count(turn, t)) return fail(Error::BadMetadataValue, m.line);
      if (!named(name[0])) return fail(Error::UndefinedTileName, m.line);
      spawn_at.push_back({name[0], t});
    } else if (key=="facing"){
      std::string name, dir;
      Dir d;
      if (!(in >> name >> dir) || name.size()!=1 || !parse_dir(dir.c_str(), d))
        return fail(Error::BadMetadataValue, m.line);
      if (!named(name[0])) return fail(Error::UndefinedTileName, m.line);
      facing.push_back({name[0], d});
      facing_lines.push_back(m.line);
    } else {
      return fail(Error::UnknownMetadata, m.line);
    }
  }

  for (auto &h: holes){
    auto it = defs.find(h.name);
    if (it==defs.end()) return fail(Error::UndefinedTileName, h.line, h.column);
    tiles[size_t(h.at.row)*width + h.at.col] = it->second;
  }

  // Exactly one player and one goal.
  int players=0, goals=0;
  for (size_t k=0;k<tiles.size();k++){
    int line = rows[k/width].line;
    if (tiles[k].content==ContentKind::Player && ++players>1) return fail(Error::MultiplePlayers, line);
    if (tiles[k].content==ContentKind::Goal   && ++goals>1)   return fail(Error::MultipleGoals, line);
  }
  if (players==0) return fail(Error::MissingPlayer, 0);
  if (goals==0)   return fail(Error::MissingGoal, 0);

  lv.world = World(height, width, std::move(tiles));
  lv.world.set_tower_budget(max_towers);

  for (size_t i=0;i<facing.size();i++){
    for (auto &h: holes){
      if (h.name!=facing[i].first) continue;
      if (!lv.world.set_tower_facing(h.at, facing[i].second))
        return fail(Error::BadMetadataValue, facing_lines[i]);
    }
  }
  for (auto &sp: spawn_at){
    for (auto &h: holes) if (h.name==sp.first) lv.spawns.push_back(SpawnEvent{sp.second, h.at});
  }

  LoadResult r;
  r.level = std::move(lv);
  return r;
}

LoadResult parse_level_text(const std::string& text){
  std::vector<std::string> lines;
  std::istringstream in(text);
  std::string s;
  while (std::getline(in, s)) lines.push_back(s);
  LoadResult r = parse_level(lines);
  if (r.ok()) r.level.final_newline = text.empty() || text.back()=='\n';
  return r;
}

LoadResult load_level_file(const std::string& path){
  std::ifstream f(path);
  if (!f) return fail(Error::FileNotFound, 0);
  std::ostringstream buf;
  buf << f.rdbuf();
  return parse_level_text(buf.str());
}

std::string describe(const LoadResult& r){
  std::ostringstream os;
  os << error_name(r.error);
  if (r.line>0)   os << " at line " << r.line;
  if (r.column>0) os << ", column " << r.column;
  return os.str();
}

// ------- Serialization -------

std::string serialize_grid(const World& w, bool spaced, bool final_newline){
  std::ostringstream os;
  for (int r=0;r<w.height();r++){
    if (r>0) os << "\n";
    for (int c=0;c<w.width();c++){
      if (spaced && c>0) os << ' ';
      os << tile_code(w.at(Coord{r,c}));
    }
  }
  if (final_newline && w.height()>0) os << "\n";
  return os.str();
}

} // namespace td
