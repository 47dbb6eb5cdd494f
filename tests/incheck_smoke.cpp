#include <cassert>
#include "gambit/attack.hpp"
#include "gambit/board.hpp"
#include "gambit/fen.hpp"
#include "gambit/perft.hpp"

static bool attacked(const char* fen, gambit::Color side) {
  gambit::Board b;
  gambit::set_from_fen(b, fen);
  return gambit::king_attacked(b, side);
}

int main() {
  using namespace gambit;

  // White in check from Re2: legal escapes are Kxe2, Kd1, Kf1 => 3
  {
    Board b;
    const Color stm = set_from_fen(b, "4k3/8/8/8/8/8/4r3/4K3 w - - 0 1");
    assert(king_attacked(b, Color::White));
    assert(!king_attacked(b, Color::Black));
    assert(perft(b, stm, 1) == 3ULL);
  }

  // Start position: nobody is in check
  assert(!attacked(STARTPOS_FEN, Color::White));
  assert(!attacked(STARTPOS_FEN, Color::Black));

  // Pawns attack diagonally forward only
  assert(attacked("8/8/8/4k3/3P4/8/8/4K3 b - - 0 1", Color::Black));
  assert(!attacked("8/8/8/3k4/3P4/8/8/4K3 b - - 0 1", Color::Black));
  assert(attacked("4k3/8/8/8/8/3p4/4K3/8 w - - 0 1", Color::White));
  assert(!attacked("4k3/8/8/8/8/8/3pK3/8 w - - 0 1", Color::White));

  // Knight jumps; sliders are blocked by anything in between
  assert(attacked("4k3/8/8/8/8/3n4/8/4K3 w - - 0 1", Color::White));
  assert(!attacked("4k3/8/8/8/8/8/8/r2NK3 w - - 0 1", Color::White));
  assert(attacked("4k3/8/8/8/8/8/8/r3K3 w - - 0 1", Color::White));
  assert(attacked("4k3/8/8/b7/8/8/8/4K3 w - - 0 1", Color::White));
  assert(!attacked("4k3/8/8/b7/8/2P5/8/4K3 w - - 0 1", Color::White));

  // Adjacent enemy king counts as an attacker
  assert(attacked("8/8/8/8/8/3k4/3K4/8 w - - 0 1", Color::White));

  // No king of that colour: reported as in check
  {
    Board b;
    set_from_fen(b, "8/8/8/8/8/8/8/4K3 w - - 0 1");
    assert(find_king(b, Color::Black) == NO_SQUARE);
    assert(king_attacked(b, Color::Black));
    assert(!king_attacked(b, Color::White));

    Board empty;
    assert(king_attacked(empty, Color::White));
    assert(king_attacked(empty, Color::Black));
  }

  return 0;
}
