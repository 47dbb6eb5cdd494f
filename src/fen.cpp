#include "gambit/fen.hpp"
#include <cctype>
#include <sstream>
#include <string>   // ensure operator>> into std::string is visible

namespace gambit {

static inline bool is_digit(char c) { return c >= '0' && c <= '9'; }

static constexpr const char* PIECE_CHARS = "pnbrqk";

// Piece::None for anything that is not a FEN piece letter.
static Piece char_to_piece(char c, Color& out_color) {
  out_color = std::isupper(static_cast<unsigned char>(c)) ? Color::White : Color::Black;
  const char lc = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  for (int i = 0; i < PIECE_N; ++i)
    if (PIECE_CHARS[i] == lc) return static_cast<Piece>(i);
  return Piece::None;
}

char piece_to_char(Piece p, Color c) {
  if (p == Piece::None) return '.';
  const char ch = PIECE_CHARS[static_cast<int>(p)];
  return c == Color::White ? static_cast<char>(std::toupper(static_cast<unsigned char>(ch))) : ch;
}

Color set_from_fen(Board& out, std::string_view fen) {
  std::string fen_str(fen);
  std::istringstream ss(fen_str);
  std::string placement, active;
  if (!(ss >> placement >> active))
    throw FenError("Malformed FEN: expected placement and active color");

  // 1) Piece placement
  Board b;
  int r = 7, f = 0;
  for (char ch : placement) {
    if (ch == '/') {
      if (f != 8) throw FenError("FEN rank does not cover 8 files");
      --r; f = 0;
      if (r < 0) throw FenError("FEN has more than 8 ranks");
      continue;
    }
    if (is_digit(ch)) {
      if (ch == '0' || ch == '9') throw FenError("Invalid empty-run digit in FEN");
      f += ch - '0';
      if (f > 8) throw FenError("FEN rank does not cover 8 files");
      continue;
    }
    Color col; Piece p = char_to_piece(ch, col);
    if (p == Piece::None) throw FenError("Invalid piece character in FEN");
    if (f > 7) throw FenError("Square out of range while parsing FEN");
    b.set_piece(col, p, make_square(f, r));
    ++f;
  }
  if (r != 0 || f != 8) throw FenError("FEN placement must describe 8 ranks of 8 files");

  // 2) Active color
  Color stm;
  if (active == "w") stm = Color::White;
  else if (active == "b") stm = Color::Black;
  else throw FenError("Invalid active color in FEN");

  out = b;
  return stm;
}

std::string to_fen(const Board& b, Color stm) {
  std::string out;

  // 1) Piece placement
  for (int r = 7; r >= 0; --r) {
    int empties = 0;
    for (int f = 0; f < 8; ++f) {
      Square s = r * 8 + f;
      Color c;
      Piece p = b.piece_at(s, &c);
      if (p == Piece::None) {
        ++empties;
      } else {
        if (empties) { out += char('0' + empties); empties = 0; }
        out += piece_to_char(p, c);
      }
    }
    if (empties) out += char('0' + empties);
    if (r) out += '/';
  }
  out += ' ';

  // 2) Active color
  out += (stm == Color::White ? 'w' : 'b');

  // 3)-6) Castling, en-passant and clocks are not tracked
  out += " - - 0 1";
  return out;
}

} // namespace gambit
