#pragma once
#include "gambit/board.hpp"

namespace gambit {

// Material value of one piece in centipawns (king included, 20000).
int piece_value(Piece p);

// Returns a side-to-move agnostic material score: positive = White better.
int evaluate(const Board& b);

} // namespace gambit
