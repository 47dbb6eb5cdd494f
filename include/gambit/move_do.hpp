#pragma once
#include "gambit/move.hpp"
#include "gambit/board.hpp"

namespace gambit {

// Everything needed to take a move back
struct HistoryEntry {
  Move    move{};
  Color   mover{Color::White};           // side who moved
  Piece   captured{Piece::None};         // captured piece type (if any)
  Color   captured_color{Color::White};  // meaningful only when captured != None
  bool    promoted{false};               // pawn became a queen on arrival
};

// Relocate the piece, clear the source, queen a pawn that reaches its last rank.
// No legality checks; used for trial positions as well as by do_move.
void apply_on_copy(Board& b, const Move& m);

// apply_on_copy plus the record undo_move needs.
HistoryEntry do_move(Board& b, const Move& m, Color mover);

// Moves the piece on `to` back to `from` unchanged (a promoted queen stays a queen)
// and restores any captured piece.
void undo_move(Board& b, const HistoryEntry& h);

} // namespace gambit
