#include "gambit/movegen.hpp"
#include "gambit/types.hpp"
#include "gambit/board.hpp"
#include <cstdlib> // std::abs
#include <initializer_list>

namespace gambit {

// (file, rank) steps. Order matters: the search keeps the first of equal moves.
static constexpr int KN_DF[8] = {+1, +2, -1, -2, +1, +2, -1, -2};
static constexpr int KN_DR[8] = {-2, -1, -2, -1, +2, +1, +2, +1};

static constexpr int DFr[4] = {+1, -1,  0,  0}; // E, W,  -,  -
static constexpr int DRr[4] = { 0,  0, -1, +1}; // -,  -,  S,  N
static constexpr int DFb[4] = {+1, +1, -1, -1};
static constexpr int DRb[4] = {-1, +1, -1, +1};

static inline int sign(int v) { return (v > 0) - (v < 0); }

// Empty, or held by the other colour.
static inline bool can_land(const Board& b, Square t, Color us) {
  Color oc; Piece op = b.piece_at(t, &oc);
  return op == Piece::None || oc != us;
}

static void slide(const Board& b, Square s, Color us,
                  const int* df, const int* dr, int ndirs, MoveList& out) {
  const int f0 = file_of(s), r0 = rank_of(s);
  for (int dir = 0; dir < ndirs; ++dir) {
    int f = f0 + df[dir], r = r0 + dr[dir];
    while (on_board(f, r)) {
      const Square t = make_square(f, r);
      Color oc; Piece op = b.piece_at(t, &oc);
      if (op == Piece::None) {
        out.push(Move{ s, t });
      } else {
        if (oc != us) out.push(Move{ s, t });
        break; // blocked
      }
      f += df[dir]; r += dr[dir];
    }
  }
}

void generate_piece_moves(const Board& b, Square s, MoveList& out) {
  if (!is_square(s)) return;
  Color us; Piece pc = b.piece_at(s, &us);
  const int f0 = file_of(s), r0 = rank_of(s);

  switch (pc) {
    case Piece::Pawn: {
      const int dir = pawn_dir(us);
      const Square one = make_square(f0, r0 + dir);
      if (one != NO_SQUARE && b.piece_at(one) == Piece::None) {
        out.push(Move{ s, one });
        if (r0 == pawn_home_rank(us)) {
          const Square two = make_square(f0, r0 + 2 * dir);
          if (b.piece_at(two) == Piece::None) out.push(Move{ s, two });
        }
      }
      for (int df : {-1, +1}) {
        const Square t = make_square(f0 + df, r0 + dir);
        if (t == NO_SQUARE) continue;
        Color oc; Piece op = b.piece_at(t, &oc);
        if (op != Piece::None && oc != us) out.push(Move{ s, t });
      }
      break;
    }
    case Piece::Knight:
      for (int i = 0; i < 8; ++i) {
        const Square t = make_square(f0 + KN_DF[i], r0 + KN_DR[i]);
        if (t != NO_SQUARE && can_land(b, t, us)) out.push(Move{ s, t });
      }
      break;
    case Piece::Bishop:
      slide(b, s, us, DFb, DRb, 4, out);
      break;
    case Piece::Rook:
      slide(b, s, us, DFr, DRr, 4, out);
      break;
    case Piece::Queen:
      slide(b, s, us, DFr, DRr, 4, out);
      slide(b, s, us, DFb, DRb, 4, out);
      break;
    case Piece::King:
      for (int df = -1; df <= 1; ++df) for (int dr = 1; dr >= -1; --dr) {
        if (!df && !dr) continue;
        const Square t = make_square(f0 + df, r0 + dr);
        if (t != NO_SQUARE && can_land(b, t, us)) out.push(Move{ s, t });
      }
      break;
    case Piece::None:
      break;
  }
}

// Rank 8 down to rank 1, a to h within a rank.
void generate_pseudo_legal(const Board& b, Color side, MoveList& out) {
  out.clear();
  for (int r = 7; r >= 0; --r) for (int f = 0; f < 8; ++f) {
    const Square s = make_square(f, r);
    Color c; Piece p = b.piece_at(s, &c);
    if (p == Piece::None || c != side) continue;
    generate_piece_moves(b, s, out);
  }
}

// Squares strictly between from and to along a file, rank or diagonal are empty.
static bool path_clear(const Board& b, Square from, Square to) {
  const int sf = sign(file_of(to) - file_of(from));
  const int sr = sign(rank_of(to) - rank_of(from));
  int f = file_of(from) + sf, r = rank_of(from) + sr;
  while (f != file_of(to) || r != rank_of(to)) {
    if (b.piece_at(make_square(f, r)) != Piece::None) return false;
    f += sf; r += sr;
  }
  return true;
}

bool is_pseudo_legal(const Board& b, const Move& m, bool attack_probe) {
  if (!is_square(m.from) || !is_square(m.to) || m.from == m.to) return false;

  Color us; Piece pc = b.piece_at(m.from, &us);
  if (pc == Piece::None) return false;

  Color tc; Piece target = b.piece_at(m.to, &tc);
  const bool occupied = target != Piece::None;
  if (!attack_probe && occupied && tc == us) return false;

  const int dx = file_of(m.to) - file_of(m.from);
  const int dr = rank_of(m.to) - rank_of(m.from);
  const int adx = std::abs(dx), adr = std::abs(dr);

  switch (pc) {
    case Piece::Pawn: {
      const int dir = pawn_dir(us);
      if (dx == 0) {
        if (dr == dir) return !occupied;
        if (dr == 2 * dir && rank_of(m.from) == pawn_home_rank(us))
          return !occupied && b.piece_at(m.from + 8 * dir) == Piece::None;
        return false;
      }
      return adx == 1 && dr == dir && occupied && tc != us;
    }
    case Piece::Knight:
      return (adx == 1 && adr == 2) || (adx == 2 && adr == 1);
    case Piece::Bishop:
      return adx == adr && path_clear(b, m.from, m.to);
    case Piece::Rook:
      return (dx == 0 || dr == 0) && path_clear(b, m.from, m.to);
    case Piece::Queen:
      return (dx == 0 || dr == 0 || adx == adr) && path_clear(b, m.from, m.to);
    case Piece::King:
      return adx <= 1 && adr <= 1;
    case Piece::None:
      break;
  }
  return false;
}

} // namespace gambit
