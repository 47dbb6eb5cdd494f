#pragma once
#include <cstdint>
#include "gambit/types.hpp"


namespace gambit {


// A move is just (from, to). Capture and promotion are read off the board when it is applied.
struct Move {
Square from{NO_SQUARE};
Square to{NO_SQUARE};

bool operator==(const Move& o) const { return from == o.from && to == o.to; }
bool operator!=(const Move& o) const { return !(*this == o); }
};


} // namespace gambit
