#include "td/engine.hpp"
#include "td/render.hpp"

#include <iostream>
#include <string>
#include <utility>

#ifndef TD_DEFAULT_LEVEL
#define TD_DEFAULT_LEVEL "levels/default.lvl"
#endif

// One command per line: w/a/s/d move, W/A/S/D place a tower facing that
// way, '.' skip, q quit.
static bool decode(char c, td::Intent& out){
  switch (c){
    case 'w': out = td::Intent::move(td::Dir::North);  return true;
    case 'd': out = td::Intent::move(td::Dir::East);   return true;
    case 's': out = td::Intent::move(td::Dir::South);  return true;
    case 'a': out = td::Intent::move(td::Dir::West);   return true;
    case 'W': out = td::Intent::place(td::Dir::North); return true;
    case 'D': out = td::Intent::place(td::Dir::East);  return true;
    case 'S': out = td::Intent::place(td::Dir::South); return true;
    case 'A': out = td::Intent::place(td::Dir::West);  return true;
    case '.': out = td::Intent::skip();                return true;
    default:  return false;
  }
}

int main(int argc, char** argv){
  std::string path = TD_DEFAULT_LEVEL;
  if (argc>1){
    std::string a = argv[1];
    if (a=="-h" || a=="--help"){
      std::cout << "usage: " << argv[0] << " [level-file]\n"
                << "  w/a/s/d move, W/A/S/D place tower, . skip, q quit\n";
      return 0;
    }
    path = a;
  }

  auto loaded = td::load_level_file(path);
  if (!loaded.ok()){
    std::cerr << path << ": " << td::describe(loaded) << "\n";
    return 1;
  }

  std::cout << "=== Tile Defense ===\n";
  td::Engine game(std::move(loaded.level));
  std::cout << td::render_ascii(game);

  std::string line;
  while (!game.finished() && std::getline(std::cin, line)){
    if (line.empty()) continue;
    if (line[0]=='q') return 0;

    td::Intent in;
    if (!decode(line[0], in)){
      std::cout << "unknown command '" << line[0] << "'\n";
      continue;
    }
    td::Error e = game.submit(in);
    if (e!=td::Error::None){
      std::cout << "rejected: " << td::error_name(e) << "\n";
      continue;
    }
    // Show the board after every phase.
    while (!game.finished() && game.phase()!=td::Phase::AwaitingPlayerInput){
      game.advance();
      std::cout << td::render_ascii(game);
    }
  }

  if (game.phase()==td::Phase::GameOver){
    std::cout << "Game over: an enemy reached the goal on turn " << game.turn() << "\n";
    return 2;
  }
  if (game.phase()==td::Phase::Victory)
    std::cout << "Victory after " << game.turn() << " turns\n";
  return 0;
}
