#pragma once
#include <cstdint>


namespace gambit {


using Square = int; // 0..63, rank * 8 + file; rank 0 is White's back rank


enum class Color : int { White = 0, Black = 1 };


enum class Piece : int { Pawn=0, Knight=1, Bishop=2, Rook=3, Queen=4, King=5, None=6 };


constexpr int COLOR_N = 2;
constexpr int PIECE_N = 6; // without None
constexpr Square NO_SQUARE = -1;


inline constexpr int file_of(Square s) { return s & 7; }
inline constexpr int rank_of(Square s) { return s >> 3; }

inline constexpr bool on_board(int file, int rank) {
  return file >= 0 && file < 8 && rank >= 0 && rank < 8;
}
inline constexpr bool is_square(Square s) { return s >= 0 && s < 64; }

// NO_SQUARE for coordinates off the board
inline constexpr Square make_square(int file, int rank) {
  return on_board(file, rank) ? rank * 8 + file : NO_SQUARE;
}

inline constexpr Color other(Color c) { return c == Color::White ? Color::Black : Color::White; }

// +1 rank for White, -1 for Black
inline constexpr int pawn_dir(Color c) { return c == Color::White ? 1 : -1; }
inline constexpr int pawn_home_rank(Color c) { return c == Color::White ? 1 : 6; }
inline constexpr int promotion_rank(Color c) { return c == Color::White ? 7 : 0; }


} // namespace gambit
