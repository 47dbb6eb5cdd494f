#include "gambit/search.hpp"
#include "gambit/eval.hpp"
#include "gambit/legal.hpp"
#include "gambit/move_do.hpp"
#include "gambit/movelist.hpp"
#include "gambit/types.hpp"

#include <limits>

namespace gambit {
namespace {

constexpr int INF = std::numeric_limits<int>::max();

// White-positive score seen from c
inline int pov(int score, Color c) { return c == Color::White ? score : -score; }

// Opponent to move on `b`; the score it can reach, from its own point of view.
int opponent_best(const Board& b, Color opp, std::uint64_t& nodes) {
  MoveList replies;
  generate_legal(b, opp, replies);

  if (replies.empty()) {
    ++nodes;
    return pov(evaluate(b), opp); // mate or stalemate: plain material
  }

  int best = -INF;
  for (const auto& r : replies) {
    Board c2 = b;
    apply_on_copy(c2, r);
    ++nodes;
    const int s = pov(evaluate(c2), opp);
    if (s > best) best = s;
  }
  return best;
}

} // namespace

SearchResult search(const Board& root, Color side) {
  SearchResult out{};
  const Color opp = other(side);

  MoveList ml;
  generate_legal(root, side, ml);

  int bestScore = INF;
  for (const auto& m : ml) {
    Board c1 = root;
    apply_on_copy(c1, m);
    ++out.nodes;

    const int s = opponent_best(c1, opp, out.nodes);
    if (!out.found || s < bestScore) {
      bestScore = s;
      out.best = m;
      out.found = true;
    }
  }

  if (out.found) out.score = -bestScore;
  return out;
}

} // namespace gambit
