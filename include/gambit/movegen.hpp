#pragma once
#include "gambit/board.hpp"
#include "gambit/movelist.hpp"


namespace gambit {


// Appends the pseudo-legal moves of the piece on `from` (nothing for an empty square).
// Own king safety is not considered.
void generate_piece_moves(const Board& b, Square from, MoveList& out);

// Clears `out`, then appends the pseudo-legal moves of every `side` piece, scanning from
// rank 8 down to rank 1 and from file a to h.
void generate_pseudo_legal(const Board& b, Color side, MoveList& out);

// Geometry + path test for a single move. With attack_probe set, a destination held by
// the mover's own colour is not rejected; check detection uses this to ask "does this
// piece hit that square".
bool is_pseudo_legal(const Board& b, const Move& m, bool attack_probe = false);


} // namespace gambit
