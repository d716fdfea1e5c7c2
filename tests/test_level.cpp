#include <doctest/doctest.h>

#include "td/level.hpp"

#include <string>
#include <vector>

using namespace td;

TEST_CASE("well-formed level gives lines x codes grid"){
  auto r = parse_level({"OpO-O-", "|e|-|g", "x-OrOt"});
  REQUIRE(r.ok());
  const World& w = r.level.world;
  CHECK(w.height()==3);
  CHECK(w.width()==3);
  CHECK(w.player()==Coord{0,0});
  CHECK(w.goal()==Coord{1,2});
  REQUIRE(w.enemies().size()==1);
  CHECK(w.enemies()[0].pos==Coord{1,0});
  CHECK(w.enemies()[0].hp==ENEMY_HP);
  REQUIRE(w.towers().size()==1);
  CHECK(w.towers()[0].pos==Coord{2,2});
  CHECK(w.towers()[0].facing==Dir::East);
  REQUIRE(w.rocks().size()==1);
  CHECK(w.rocks()[0]==Coord{2,1});
  CHECK(w.at(Coord{2,0}).ground==GroundKind::Water);
  CHECK(w.towers_left()==-1);
}

TEST_CASE("player and goal counts are enforced"){
  CHECK(parse_level({"O-O-Og"}).error==Error::MissingPlayer);
  CHECK(parse_level({"OpO-O-"}).error==Error::MissingGoal);
  CHECK(parse_level({"OpOpOg"}).error==Error::MultiplePlayers);
  CHECK(parse_level({"OpOgOg"}).error==Error::MultipleGoals);
  CHECK(parse_level({}).error==Error::MissingPlayer);

  auto r = parse_level({"OpO-", "OgOp"});
  CHECK(r.error==Error::MultiplePlayers);
  CHECK(r.line==2);
  // nothing partial comes back
  CHECK(r.level.world.height()==0);
  CHECK(r.level.world.enemies().empty());
}

TEST_CASE("malformed codes report where they are"){
  auto r = parse_level({"OpO-", "OgZ-"});
  CHECK(r.error==Error::InvalidGroundCode);
  CHECK(r.line==2);
  CHECK(r.column==3);

  r = parse_level({"OpO?", "OgO-"});
  CHECK(r.error==Error::InvalidContentCode);
  CHECK(r.column==4);

  r = parse_level({"OpO-O", "OgO-"});
  CHECK(r.error==Error::TruncatedTileCode);
  CHECK(r.line==1);
  CHECK(r.column==5);   // the lone 'O'

  r = parse_level({"Op O", "OgO-"});
  CHECK(r.error==Error::TruncatedTileCode);
  CHECK(r.column==4);

  r = parse_level({"OpO-", "OgO-O-"});
  CHECK(r.error==Error::IrregularGridShape);
  CHECK(r.line==2);
  CHECK(describe(r)=="IrregularGridShape at line 2");
}

TEST_CASE("comments, blank lines and spaced rows"){
  auto r = parse_level_text("~ header\n\nOp O- Og\r\n   \n|e |- |-\n");
  REQUIRE(r.ok());
  CHECK(r.level.spaced);
  CHECK(r.level.world.height()==2);
  CHECK(r.level.world.width()==3);
  CHECK(serialize_grid(r.level.world, r.level.spaced)=="Op O- Og\n|e |- |-\n");
}

TEST_CASE("serializing the initial world reproduces the text"){
  const std::string text = "OpO-O-xr\n|e|-|-|g\nOtOrx-O-\n";
  auto r = parse_level_text(text);
  REQUIRE(r.ok());
  CHECK_FALSE(r.level.spaced);
  CHECK(serialize_grid(r.level.world)==text);
}

TEST_CASE("a level without a final newline serializes without one"){
  auto r = parse_level_text("OpO-\n|e|g");
  REQUIRE(r.ok());
  CHECK_FALSE(r.level.final_newline);
  CHECK(serialize_grid(r.level.world, r.level.spaced, r.level.final_newline)=="OpO-\n|e|g");

  r = parse_level_text("OpOg\n");
  REQUIRE(r.ok());
  CHECK(r.level.final_newline);
  CHECK(serialize_grid(r.level.world, false, r.level.final_newline)=="OpOg\n");
}

TEST_CASE("metadata: placeholders, tower budget, spawns, facing"){
  auto r = parse_level({
    "@max_towers 2",
    "?a |- |g",
    "Op ?b O-",
    "@tile a |-",
    "@tile b Ot",
    "@facing b north",
    "@event spawn enemy a 3",
  });
  REQUIRE(r.ok());
  const World& w = r.level.world;
  CHECK(w.at(Coord{0,0}).ground==GroundKind::Path);
  CHECK(w.at(Coord{1,1}).content==ContentKind::Tower);
  REQUIRE(w.towers().size()==1);
  CHECK(w.towers()[0].facing==Dir::North);
  CHECK(w.towers_left()==2);
  REQUIRE(r.level.spawns.size()==1);
  CHECK(r.level.spawns[0].turn==3);
  CHECK(r.level.spawns[0].at==Coord{0,0});
}

TEST_CASE("metadata errors"){
  CHECK(parse_level({"Op?q", "@tile z Og"}).error==Error::UndefinedTileName);
  CHECK(parse_level({"OpOg", "@bogus 1"}).error==Error::UnknownMetadata);
  CHECK(parse_level({"OpOg", "@max_towers lots"}).error==Error::BadMetadataValue);
  CHECK(parse_level({"Op?a", "@tile a Qg"}).error==Error::InvalidGroundCode);
  CHECK(parse_level({"Op?a", "@tile a |-", "@facing a east", "Og|-"}).error==Error::BadMetadataValue);
  CHECK(parse_level({"Op?a", "@tile a Og", "@event spawn dragon a 1"}).error==Error::UnknownMetadata);
  CHECK(parse_level({"OpOg", "@event spawn enemy a 1"}).error==Error::UndefinedTileName);
}

TEST_CASE("missing file"){
  auto r = load_level_file("/nonexistent/level.lvl");
  CHECK(r.error==Error::FileNotFound);
}

TEST_CASE("bundled level loads"){
  auto r = load_level_file(std::string(TD_LEVELS_DIR) + "/default.lvl");
  REQUIRE(r.ok());
  CHECK(r.level.world.width()==7);
  CHECK(r.level.world.height()==6);
  CHECK(r.level.spawns.size()==2);
  CHECK(r.level.world.towers_left()==4);
}
