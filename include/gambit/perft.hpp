#pragma once
#include <cstdint>
#include <utility>
#include <vector>
#include "gambit/types.hpp"
#include "gambit/board.hpp"
#include "gambit/move.hpp"

namespace gambit {

// Number of legal move sequences of length `depth` with `stm` to move first.
std::uint64_t perft(const Board& b, Color stm, int depth);

// Per-move breakdown at root
void perft_divide(const Board& b, Color stm, int depth,
                  std::vector<std::pair<Move, std::uint64_t>>& out);

} // namespace gambit
