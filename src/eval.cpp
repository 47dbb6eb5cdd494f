#include "gambit/eval.hpp"
#include "gambit/types.hpp"

namespace gambit {

// Conventional material values (centipawns)
static constexpr int VAL_NONE  = 0;
static constexpr int VAL_PAWN  = 100;
static constexpr int VAL_KNIGHT= 320;
static constexpr int VAL_BISHOP= 330;
static constexpr int VAL_ROOK  = 500;
static constexpr int VAL_QUEEN = 900;
static constexpr int VAL_KING  = 20000;

int piece_value(Piece p) {
  switch (p) {
    case Piece::Pawn:   return VAL_PAWN;
    case Piece::Knight: return VAL_KNIGHT;
    case Piece::Bishop: return VAL_BISHOP;
    case Piece::Rook:   return VAL_ROOK;
    case Piece::Queen:  return VAL_QUEEN;
    case Piece::King:   return VAL_KING;
    case Piece::None:   return VAL_NONE;
  }
  return VAL_NONE;
}

int evaluate(const Board& b) {
  int score = 0;
  for (int s = 0; s < 64; ++s) {
    Color c; Piece p = b.piece_at(s, &c);
    if (p == Piece::None) continue;
    int v = piece_value(p);
    score += (c == Color::White ? v : -v);
  }
  return score;
}

} // namespace gambit
