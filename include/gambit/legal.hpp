#pragma once
#include "gambit/board.hpp"
#include "gambit/movelist.hpp"

namespace gambit {

// A `mover` piece stands on m.from, the move fits its pattern on `b`, and after
// playing it on a copy the mover's king is not attacked.
bool is_legal(const Board& b, const Move& m, Color mover);

// Clears `out` and fills it with side's legal moves, in generation order.
void generate_legal(const Board& b, Color side, MoveList& out);

bool has_legal_move(const Board& b, Color side);

} // namespace gambit
