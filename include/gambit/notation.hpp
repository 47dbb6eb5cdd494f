// include/gambit/notation.hpp
#pragma once
#include <string>
#include <string_view>

#include "gambit/move.hpp"
#include "gambit/types.hpp"

namespace gambit {

// "e4" style square names
std::string square_to_string(Square s);

// Throws std::invalid_argument for anything but [a-h][1-8].
Square parse_square(std::string_view text);

// Coordinate form, e.g. "e2e4". Promotion is implicit (always a queen), so there is
// no fifth character.
std::string move_to_text(const Move& m);

// Parses "e2e4" (a trailing "q" is tolerated). Throws std::invalid_argument.
// Only syntax is checked; legality is the game's business.
Move parse_move(std::string_view text);

// "Pawn", "Knight", ... / "White", "Black"
const char* piece_name(Piece p);
const char* color_name(Color c);

// Unicode chess glyph, e.g. "♔" for a white king.
const char* piece_symbol(Piece p, Color c);

} // namespace gambit
