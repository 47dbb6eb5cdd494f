#pragma once
#include <array>
#include <cstddef>
#include "gambit/move.hpp"


namespace gambit {


// No piece has more than 27 destinations, so 64 * 27 bounds any board a FEN can
// describe, not only positions reachable from the start (which stay under 218).
struct MoveList {
static constexpr std::size_t CAP = 64 * 27;
std::array<Move, CAP> data{};
std::size_t sz = 0;


void push(const Move& m) { if (sz < CAP) data[sz++] = m; }
void clear() { sz = 0; }
const Move* begin() const { return data.data(); }
const Move* end() const { return data.data() + sz; }
const Move& operator[](std::size_t i) const { return data[i]; }
std::size_t size() const { return sz; }
bool empty() const { return sz == 0; }
bool contains(const Move& m) const {
  for (const auto& x : *this) if (x == m) return true;
  return false;
}
};


} // namespace gambit
