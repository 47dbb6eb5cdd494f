#include <cassert>
#include "gambit/board.hpp"


int main() {
using namespace gambit;
Board a, b;
// Same init yields same board
assert(a == b);
a.set_piece(Color::White, Piece::Pawn, 12);
assert(a != b);

Color c;
assert(a.piece_at(12, &c) == Piece::Pawn && c == Color::White);
assert(a.piece_at(13) == Piece::None);

// Copies are independent grids
Board copy = a;
copy.remove_piece(12);
assert(a.piece_at(12) == Piece::Pawn);
assert(copy.piece_at(12) == Piece::None);
assert(copy == b);

// Standard setup
Board s = start_board();
assert(s.count(Color::White, Piece::Pawn) == 8);
assert(s.count(Color::Black, Piece::Pawn) == 8);
assert(s.count(Color::White, Piece::King) == 1);
assert(s.count(Color::Black, Piece::King) == 1);
assert(s.piece_at(make_square(4, 0), &c) == Piece::King && c == Color::White);   // e1
assert(s.piece_at(make_square(3, 7), &c) == Piece::Queen && c == Color::Black);  // d8
assert(s.piece_at(make_square(4, 4)) == Piece::None);                            // e5

// Coordinates
assert(make_square(0, 0) == 0);
assert(make_square(7, 7) == 63);
assert(make_square(8, 0) == NO_SQUARE);
assert(make_square(-1, 3) == NO_SQUARE);
assert(file_of(make_square(5, 2)) == 5 && rank_of(make_square(5, 2)) == 2);
return 0;
}
