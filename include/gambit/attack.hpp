#pragma once
#include "gambit/board.hpp"

namespace gambit {

// Square of side's king, NO_SQUARE if the board has none.
Square find_king(const Board& b, Color side);

// Can some piece of colour 'by' move onto s, ignoring what colour holds s?
// Meant for occupied squares: onto an empty square a pawn push would count too.
bool square_attacked(const Board& b, Square s, Color by);

// Is side's king attacked? A board without that king counts as attacked.
bool king_attacked(const Board& b, Color side);

} // namespace gambit
