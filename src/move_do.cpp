#include "gambit/move_do.hpp"
#include <cassert>

namespace gambit {

static inline bool reaches_last_rank(Piece p, Color c, Square to) {
  return p == Piece::Pawn && rank_of(to) == promotion_rank(c);
}

void apply_on_copy(Board& b, const Move& m) {
  Color c; Piece p = b.piece_at(m.from, &c);
  if (p == Piece::None) return;
  b.remove_piece(m.from);
  b.set_piece(c, reaches_last_rank(p, c, m.to) ? Piece::Queen : p, m.to);
}

HistoryEntry do_move(Board& b, const Move& m, Color mover) {
  HistoryEntry h{};
  h.move  = m;
  h.mover = mover;

  Color sc; Piece srcP = b.piece_at(m.from, &sc);
  assert(srcP != Piece::None && sc == mover);

  // destination occupancy
  Color dc; Piece dstP = b.piece_at(m.to, &dc);
  if (dstP != Piece::None) {
    h.captured       = dstP;
    h.captured_color = dc;
  }
  h.promoted = reaches_last_rank(srcP, sc, m.to);

  apply_on_copy(b, m);
  return h;
}

void undo_move(Board& b, const HistoryEntry& h) {
  Color mc; Piece movedNow = b.piece_at(h.move.to, &mc);
  b.remove_piece(h.move.to);
  if (movedNow != Piece::None) b.set_piece(mc, movedNow, h.move.from);

  if (h.captured != Piece::None) {
    b.set_piece(h.captured_color, h.captured, h.move.to);
  }
}

} // namespace gambit
