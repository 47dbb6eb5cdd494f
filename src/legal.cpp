#include "gambit/legal.hpp"
#include "gambit/attack.hpp"
#include "gambit/movegen.hpp"
#include "gambit/move_do.hpp"

namespace gambit {
namespace {

// Full copy per trial; the live board is never touched.
bool king_safe_after(const Board& b, const Move& m, Color mover) {
  Board tmp = b;
  apply_on_copy(tmp, m);
  return !king_attacked(tmp, mover);
}

} // namespace

bool is_legal(const Board& b, const Move& m, Color mover) {
  if (!is_square(m.from) || !is_square(m.to)) return false;
  Color c; Piece p = b.piece_at(m.from, &c);
  if (p == Piece::None || c != mover) return false;
  if (!is_pseudo_legal(b, m)) return false;
  return king_safe_after(b, m, mover);
}

void generate_legal(const Board& b, Color side, MoveList& out) {
  MoveList ml;
  generate_pseudo_legal(b, side, ml);
  out.clear();
  for (const auto& m : ml) {
    if (king_safe_after(b, m, side)) out.push(m);
  }
}

bool has_legal_move(const Board& b, Color side) {
  MoveList ml;
  generate_pseudo_legal(b, side, ml);
  for (const auto& m : ml) {
    if (king_safe_after(b, m, side)) return true;
  }
  return false;
}

} // namespace gambit
