#include "gambit/board.hpp"
#include <cassert>


namespace gambit {


Board::Board() { clear(); }


void Board::clear() {
for (auto& c : cells_) c = Cell{};
}


void Board::set_piece(Color c, Piece p, Square s) {
assert(is_square(s));
cells_[static_cast<std::size_t>(s)] = Cell{p, c};
}


void Board::remove_piece(Square s) {
assert(is_square(s));
cells_[static_cast<std::size_t>(s)] = Cell{};
}


Piece Board::piece_at(Square s, Color* c_out) const {
  const Cell& cl = cells_[static_cast<std::size_t>(s)];
  if (cl.piece != Piece::None && c_out) *c_out = cl.color;
  return cl.piece;
}


int Board::count(Color c, Piece p) const {
  int n = 0;
  for (const auto& cl : cells_)
    if (cl.piece == p && cl.color == c) ++n;
  return n;
}


Board start_board() {
  static constexpr Piece BACK[8] = {
    Piece::Rook, Piece::Knight, Piece::Bishop, Piece::Queen,
    Piece::King, Piece::Bishop, Piece::Knight, Piece::Rook
  };
  Board b;
  for (int f = 0; f < 8; ++f) {
    b.set_piece(Color::White, BACK[f],     make_square(f, 0));
    b.set_piece(Color::White, Piece::Pawn, make_square(f, 1));
    b.set_piece(Color::Black, Piece::Pawn, make_square(f, 6));
    b.set_piece(Color::Black, BACK[f],     make_square(f, 7));
  }
  return b;
}


} // namespace gambit
