#include <cassert>
#include "gambit/board.hpp"
#include "gambit/fen.hpp"
#include "gambit/movegen.hpp"
#include "gambit/notation.hpp"

using namespace gambit;

static MoveList moves_of(const char* fen, const char* from) {
  Board b;
  set_from_fen(b, fen);
  MoveList ml;
  generate_piece_moves(b, parse_square(from), ml);
  return ml;
}

static bool has(const MoveList& ml, const char* from, const char* to) {
  return ml.contains(Move{ parse_square(from), parse_square(to) });
}

int main() {
  // 1) Single + double push from the home rank
  {
    auto ml = moves_of(STARTPOS_FEN, "e2");
    assert(ml.size() == 2);
    assert(has(ml, "e2", "e3") && has(ml, "e2", "e4"));
  }

  // 2) Blocked directly in front: no pushes at all
  {
    auto ml = moves_of("4k3/8/8/8/8/4n3/4P3/4K3 w - - 0 1", "e2");
    assert(ml.empty());
  }

  // 3) Double push blocked on the second square only
  {
    auto ml = moves_of("4k3/8/8/8/4n3/8/4P3/4K3 w - - 0 1", "e2");
    assert(ml.size() == 1 && has(ml, "e2", "e3"));
  }

  // 4) Captures only from d4: c5 and e5, with d5 blocked
  {
    auto ml = moves_of("4k3/8/8/2nbn3/3P4/8/8/4K3 w - - 0 1", "d4");
    assert(ml.size() == 2);
    assert(has(ml, "d4", "c5") && has(ml, "d4", "e5"));
  }

  // 5) Own pieces on the diagonals are not captures
  {
    auto ml = moves_of("4k3/8/8/2N1N3/3P4/8/8/4K3 w - - 0 1", "d4");
    assert(ml.size() == 1 && has(ml, "d4", "d5"));
  }

  // 6) Black pawns move down the board
  {
    auto ml = moves_of("4k3/3p4/8/8/8/8/8/4K3 b - - 0 1", "d7");
    assert(ml.size() == 2);
    assert(has(ml, "d7", "d6") && has(ml, "d7", "d5"));
  }

  // 7) Edge file: only one diagonal exists
  {
    auto ml = moves_of("4k3/8/8/8/8/1p6/P7/4K3 w - - 0 1", "a2");
    assert(ml.size() == 3);
    assert(has(ml, "a2", "b3"));
  }

  // 8) No double push away from the home rank
  {
    auto ml = moves_of("4k3/8/8/8/8/3P4/8/4K3 w - - 0 1", "d3");
    assert(ml.size() == 1 && has(ml, "d3", "d4"));
  }

  // 9) A pawn on its last-but-one rank pushes onto the back rank
  {
    auto ml = moves_of("4k3/P7/8/8/8/8/8/4K3 w - - 0 1", "a7");
    assert(ml.size() == 1 && has(ml, "a7", "a8"));
  }

  return 0;
}
