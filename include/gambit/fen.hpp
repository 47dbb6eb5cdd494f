#pragma once
#include <string>
#include <string_view>
#include <stdexcept>
#include "gambit/board.hpp"

namespace gambit {

struct FenError : std::runtime_error { using std::runtime_error::runtime_error; };

// No castling or en-passant in this engine, so those fields are always "-".
inline constexpr char STARTPOS_FEN[] =
  "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w - - 0 1";

// Needs the placement and active-colour fields; castling, en-passant and clock fields
// may follow and are ignored. Returns the side to move. `b` is left unchanged on error.
Color set_from_fen(Board& b, std::string_view fen);
std::string to_fen(const Board& b, Color stm);

char piece_to_char(Piece p, Color c);

} // namespace gambit
