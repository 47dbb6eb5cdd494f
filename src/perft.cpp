#include "gambit/perft.hpp"
#include "gambit/legal.hpp"
#include "gambit/move_do.hpp"
#include "gambit/movelist.hpp"
#include <vector>

namespace gambit {

// Children are full copies: undo_move keeps a promoted queen, so it cannot rewind promotions.
static std::uint64_t perft_rec(const Board& b, Color us, int depth) {
  if (depth == 0) return 1ULL;

  MoveList ml;
  generate_legal(b, us, ml);
  if (depth == 1) return ml.size();

  std::uint64_t nodes = 0ULL;
  for (const auto& m : ml) {
    Board next = b;
    apply_on_copy(next, m);
    nodes += perft_rec(next, other(us), depth - 1);
  }
  return nodes;
}

std::uint64_t perft(const Board& b, Color stm, int depth) {
  if (depth < 0) return 0ULL;
  return perft_rec(b, stm, depth);
}

void perft_divide(const Board& b, Color stm, int depth,
                  std::vector<std::pair<Move, std::uint64_t>>& out) {
  out.clear();
  if (depth <= 0) return;

  MoveList ml;
  generate_legal(b, stm, ml);

  for (const auto& m : ml) {
    Board next = b;
    apply_on_copy(next, m);
    out.emplace_back(m, perft_rec(next, other(stm), depth - 1));
  }
}

} // namespace gambit
