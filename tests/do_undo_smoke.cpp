#include <cassert>
#include <initializer_list>
#include <vector>
#include "gambit/board.hpp"
#include "gambit/fen.hpp"
#include "gambit/game.hpp"
#include "gambit/legal.hpp"
#include "gambit/move_do.hpp"
#include "gambit/notation.hpp"

using namespace gambit;

struct Snapshot {
  Board board;
  Color turn;
  std::vector<Piece> capW, capB;
  Phase phase;
  EndReason reason;
  std::size_t plies;
};

static Snapshot snap(const Game& g) {
  return Snapshot{ g.board(), g.turn(),
                   g.captured_by(Color::White), g.captured_by(Color::Black),
                   g.status().phase, g.status().reason, g.history().size() };
}

static bool same(const Snapshot& a, const Snapshot& b) {
  return a.board == b.board && a.turn == b.turn && a.capW == b.capW && a.capB == b.capB &&
         a.phase == b.phase && a.reason == b.reason && a.plies == b.plies;
}

// Every legal move from the current position must be exactly reversible.
static void round_trip_all(Game& g) {
  const Snapshot s0 = snap(g);
  MoveList ml;
  g.legal_moves(ml);
  assert(!ml.empty());
  for (const auto& m : ml) {
    assert(g.attempt_move(m));
    assert(!same(snap(g), s0));
    g.undo();
    assert(same(snap(g), s0));
  }
}

int main() {
  // From the initial position
  {
    Game g;
    round_trip_all(g);
    assert(g.to_fen() == STARTPOS_FEN);
  }

  // Mid-game with captures pending for both sides (exd5 / Qxd5 / Nxe4 ...)
  {
    Game g;
    for (const char* t : { "e2e4", "d7d5", "g1f3", "g8f6" }) assert(g.attempt_move(parse_move(t)));
    round_trip_all(g);

    // one capture deep as well, so the captured lists are non-empty before the trial
    assert(g.attempt_move(parse_move("e4d5")));
    round_trip_all(g);
  }

  // Board-level do_move / undo_move
  {
    Board b;
    const Color us = set_from_fen(b, "4k3/8/8/3p4/4P3/8/8/4K3 w - - 0 1");
    const Board before = b;
    const HistoryEntry h = do_move(b, parse_move("e4d5"), us);
    assert(h.mover == Color::White);
    assert(h.captured == Piece::Pawn && h.captured_color == Color::Black);
    assert(!h.promoted);
    assert(b.piece_at(parse_square("e4")) == Piece::None);
    undo_move(b, h);
    assert(b == before);
  }

  // Undo on an empty history does nothing
  {
    Game g;
    const Snapshot s0 = snap(g);
    g.undo();
    g.undo();
    assert(same(snap(g), s0));
  }

  // Undo several plies back to the start
  {
    Game g;
    for (const char* t : { "e2e4", "e7e5", "g1f3", "b8c6", "f1b5" }) assert(g.attempt_move(parse_move(t)));
    while (!g.history().empty()) g.undo();
    assert(g.to_fen() == STARTPOS_FEN);
    assert(g.turn() == Color::White);
  }

  return 0;
}
