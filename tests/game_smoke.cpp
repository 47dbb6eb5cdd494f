#include <cassert>
#include "gambit/fen.hpp"
#include "gambit/game.hpp"
#include "gambit/notation.hpp"

using namespace gambit;

int main() {
  Game g;
  assert(g.turn() == Color::White);
  assert(!g.status().ended());
  assert(g.history().empty());
  assert(g.captured_by(Color::White).empty() && g.captured_by(Color::Black).empty());
  assert(g.board() == start_board());
  assert(!g.automated_opponent());
  assert(g.to_fen() == STARTPOS_FEN);

  // Rejections leave everything as it was
  const std::string before = g.to_fen();
  assert(!g.attempt_move(64, 0));
  assert(!g.attempt_move(-1, make_square(4, 3)));
  assert(!g.attempt_move(make_square(4, 1), 70));
  assert(!g.attempt_move(parse_move("e7e5")));  // Black piece on White's turn
  assert(!g.attempt_move(parse_move("e2e5")));  // pawn cannot go three
  assert(!g.attempt_move(parse_move("e3e4")));  // empty origin
  assert(!g.attempt_move(parse_move("a1a3")));  // rook blocked by its own pawn
  assert(g.to_fen() == before);
  assert(g.history().empty());
  assert(g.turn() == Color::White);

  // Turns alternate and undo hands the move back to the mover
  assert(g.attempt_move(parse_move("g1f3")));
  assert(g.turn() == Color::Black);
  assert(g.piece_at(parse_square("f3")) == Piece::Knight);
  assert(g.piece_at(parse_square("g1")) == Piece::None);
  assert(g.attempt_move(parse_move("b8c6")));
  assert(g.turn() == Color::White);
  g.undo();
  assert(g.turn() == Color::Black);
  assert(g.history().size() == 1);
  Color c;
  assert(g.piece_at(parse_square("b8"), &c) == Piece::Knight && c == Color::Black);
  g.undo();
  g.undo(); // nothing left: no-op
  assert(g.board() == start_board());
  assert(g.turn() == Color::White);

  // Off-board lookups are empty
  assert(g.piece_at(64) == Piece::None);
  assert(g.piece_at(NO_SQUARE) == Piece::None);

  // new_game keeps the automated-opponent setting
  g.set_automated_opponent(true);
  assert(g.attempt_move(parse_move("e2e4")));
  g.new_game();
  assert(g.automated_opponent());
  assert(g.history().empty());
  assert(g.board() == start_board());
  g.set_automated_opponent(false);

  // A rejected FEN changes nothing
  assert(g.attempt_move(parse_move("d2d4")));
  const std::string mid = g.to_fen();
  bool threw = false;
  try {
    g.load_fen("rnbqkbnr/pppppppp/8/8/8 w - - 0 1");
  } catch (const FenError&) {
    threw = true;
  }
  assert(threw);
  assert(g.to_fen() == mid);
  assert(g.history().size() == 1);

  // A good one replaces the game and takes its side to move
  g.load_fen("4k3/8/8/8/8/8/8/4K2R b - - 0 1");
  assert(g.turn() == Color::Black);
  assert(g.history().empty());
  assert(g.piece_at(parse_square("h1")) == Piece::Rook);
  assert(!g.in_check());

  return 0;
}
