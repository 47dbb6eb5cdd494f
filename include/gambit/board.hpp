#pragma once
#include <array>
#include <cstdint>
#include "gambit/types.hpp"


namespace gambit {


// Contents of one square. piece == Piece::None means empty; color is then meaningless.
struct Cell {
  Piece piece = Piece::None;
  Color color = Color::White;

  bool empty() const { return piece == Piece::None; }
  bool operator==(const Cell& o) const {
    return piece == o.piece && (piece == Piece::None || color == o.color);
  }
};


// 8x8 mailbox. Plain value type: copying yields an independent grid.
class Board {
public:
Board();
void clear();


void set_piece(Color c, Piece p, Square s);
void remove_piece(Square s);


// Returns Piece::None for an empty square; writes the owner to c_out otherwise.
Piece piece_at(Square s, Color* c_out = nullptr) const;


int count(Color c, Piece p) const;


bool operator==(const Board& o) const { return cells_ == o.cells_; }
bool operator!=(const Board& o) const { return !(*this == o); }


private:
std::array<Cell, 64> cells_{};
};


// Standard initial setup.
Board start_board();


} // namespace gambit
