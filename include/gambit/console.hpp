// include/gambit/console.hpp
#pragma once
#include <iosfwd>
#include <string>

namespace gambit {

class Game;

// Text board, rank 8 on top, Unicode glyphs.
std::string render_board(const Game& g);

// "White's Turn" / "Black's Turn"
std::string turn_line(const Game& g);

// "Game in Progress", "<Color> is checkmated!" or "Stalemate"
std::string status_line(const Game& g);

// Interactive text front-end. Reads one command per line from `in` until EOF or
// "quit"; all replies go to `out`. Type "help" for the command list.
void console_loop(std::istream& in, std::ostream& out, Game& g);
void console_loop(); // stdin/stdout, fresh game

} // namespace gambit
