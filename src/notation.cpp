#include "gambit/notation.hpp"

#include <cctype>
#include <stdexcept>
#include <string>

namespace gambit {

// ------------ squares ------------
static inline char file_char(int s) { return char('a' + file_of(s)); }
static inline char rank_char(int s) { return char('1' + rank_of(s)); }

std::string square_to_string(Square s) {
  if (!is_square(s)) return "-";
  std::string out;
  out.push_back(file_char(s));
  out.push_back(rank_char(s));
  return out;
}

Square parse_square(std::string_view u) {
  if (u.size() != 2) throw std::invalid_argument("bad square length");
  const char f = static_cast<char>(std::tolower(static_cast<unsigned char>(u[0])));
  const char r = u[1];
  if (f < 'a' || f > 'h' || r < '1' || r > '8')
    throw std::invalid_argument("bad square");
  return make_square(f - 'a', r - '1');
}

// ------------ moves ------------
std::string move_to_text(const Move& m) {
  return square_to_string(m.from) + square_to_string(m.to);
}

Move parse_move(std::string_view u) {
  if (u.size() == 5 && std::tolower(static_cast<unsigned char>(u[4])) == 'q')
    u = u.substr(0, 4);
  if (u.size() != 4) throw std::invalid_argument("bad move length");
  return Move{ parse_square(u.substr(0, 2)), parse_square(u.substr(2, 2)) };
}

// ------------ names ------------
const char* piece_name(Piece p) {
  switch (p) {
    case Piece::Pawn:   return "Pawn";
    case Piece::Knight: return "Knight";
    case Piece::Bishop: return "Bishop";
    case Piece::Rook:   return "Rook";
    case Piece::Queen:  return "Queen";
    case Piece::King:   return "King";
    case Piece::None:   break;
  }
  return "None";
}

const char* color_name(Color c) { return c == Color::White ? "White" : "Black"; }

const char* piece_symbol(Piece p, Color c) {
  static const char* const W[PIECE_N] = { "♙", "♘", "♗", "♖", "♕", "♔" };
  static const char* const B[PIECE_N] = { "♟", "♞", "♝", "♜", "♛", "♚" };
  if (p == Piece::None) return ".";
  const auto idx = static_cast<std::size_t>(p);
  return c == Color::White ? W[idx] : B[idx];
}

} // namespace gambit
