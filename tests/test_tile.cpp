#include <doctest/doctest.h>

#include "td/tile.hpp"

#include <string>

using namespace td;

TEST_CASE("tile codes decode ground then content"){
  Tile t;
  CHECK(tile_from_code('|', 'e', t)==Error::None);
  CHECK(t.ground==GroundKind::Path);
  CHECK(t.content==ContentKind::Enemy);
  CHECK(tile_code(t)=="|e");

  CHECK(tile_from_code('Q', 'e', t)==Error::InvalidGroundCode);
  CHECK(tile_from_code('O', 'Q', t)==Error::InvalidContentCode);
  // a bad ground code is reported even when the content is also bad
  CHECK(tile_from_code('Q', 'Q', t)==Error::InvalidGroundCode);
}

TEST_CASE("every valid code survives decode/encode"){
  for (char g: std::string("Ox|")){
    for (char c: std::string("-petrg")){
      Tile t;
      REQUIRE(tile_from_code(g, c, t)==Error::None);
      CHECK(tile_code(t)==std::string{g, c});
    }
  }
}

TEST_CASE("walkability depends on both layers"){
  Tile grass{GroundKind::Grass, ContentKind::Empty};
  Tile path {GroundKind::Path,  ContentKind::Empty};
  Tile water{GroundKind::Water, ContentKind::Empty};

  CHECK(grass.is_walkable_by(ContentKind::Player));
  CHECK(path.is_walkable_by(ContentKind::Player));
  CHECK_FALSE(water.is_walkable_by(ContentKind::Player));

  CHECK(path.is_walkable_by(ContentKind::Enemy));
  CHECK_FALSE(grass.is_walkable_by(ContentKind::Enemy));
  CHECK_FALSE(water.is_walkable_by(ContentKind::Enemy));

  for (ContentKind occ: {ContentKind::Player, ContentKind::Enemy, ContentKind::Tower,
                         ContentKind::Rock, ContentKind::Goal}){
    Tile t{GroundKind::Path, occ};
    CHECK_FALSE(t.is_walkable_by(ContentKind::Player));
    CHECK_FALSE(t.is_walkable_by(ContentKind::Enemy));
  }
  CHECK_FALSE(grass.is_walkable_by(ContentKind::Tower));
}

TEST_CASE("only rocks and the goal block a shot"){
  CHECK(Tile{GroundKind::Grass, ContentKind::Rock}.blocks_line_of_fire());
  CHECK(Tile{GroundKind::Path,  ContentKind::Goal}.blocks_line_of_fire());
  CHECK_FALSE(Tile{GroundKind::Water, ContentKind::Empty}.blocks_line_of_fire());
  CHECK_FALSE(Tile{GroundKind::Grass, ContentKind::Tower}.blocks_line_of_fire());
  CHECK_FALSE(Tile{GroundKind::Path,  ContentKind::Empty}.blocks_line_of_fire());
}

TEST_CASE("direction and error names"){
  Dir d;
  CHECK(parse_dir("west", d));
  CHECK(d==Dir::West);
  CHECK_FALSE(parse_dir("up", d));
  CHECK(std::string(error_name(Error::TooFarFromPlayer))=="TooFarFromPlayer");
  CHECK(step(Coord{2,2}, Dir::North)==Coord{1,2});
  CHECK(step(Coord{2,2}, Dir::East)==Coord{2,3});
  CHECK(adjacent(Coord{0,0}, Coord{1,0}));
  CHECK_FALSE(adjacent(Coord{0,0}, Coord{1,1}));
  CHECK_FALSE(adjacent(Coord{0,0}, Coord{0,0}));
}
