#include "gambit/attack.hpp"
#include "gambit/movegen.hpp"
#include "gambit/types.hpp"

namespace gambit {

Square find_king(const Board& b, Color side) {
  for (Square s = 0; s < 64; ++s) {
    Color c; Piece p = b.piece_at(s, &c);
    if (p == Piece::King && c == side) return s;
  }
  return NO_SQUARE;
}

bool square_attacked(const Board& b, Square s, Color by) {
  for (Square q = 0; q < 64; ++q) {
    Color c; Piece p = b.piece_at(q, &c);
    if (p == Piece::None || c != by) continue;
    if (is_pseudo_legal(b, Move{ q, s }, /*attack_probe=*/true)) return true;
  }
  return false;
}

bool king_attacked(const Board& b, Color side) {
  const Square ks = find_king(b, side);
  if (ks == NO_SQUARE) return true; // no king: treat as already lost
  return square_attacked(b, ks, other(side));
}

} // namespace gambit
