#pragma once

#include <cstdint>

#include "gambit/board.hpp"
#include "gambit/move.hpp"

namespace gambit {

struct SearchResult {
  Move best{};
  int score{0};              // centipawns, POV = searching side
  std::uint64_t nodes{0};    // positions visited below the root
  bool found{false};         // false when the side has no legal move
};

// Fixed two-ply material minimax: our move, then the opponent's best material reply.
// No pruning, no mate bonus. Ties keep the earliest move in generation order, so the
// result is fully determined by the position.
SearchResult search(const Board& root, Color side);

} // namespace gambit
