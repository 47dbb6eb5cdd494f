#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include <cstdint>
#include <stdexcept>

#include "gambit/types.hpp"
#include "gambit/board.hpp"
#include "gambit/console.hpp"
#include "gambit/fen.hpp"
#include "gambit/game.hpp"
#include "gambit/perft.hpp"
#include "gambit/eval.hpp"
#include "gambit/notation.hpp"
#include "gambit/search.hpp"

using namespace gambit;

static void usage() {
  std::cout <<
    "Gambit CLI\n"
    "Usage:\n"
    "  gambit_cli perft <depth> [fen...]\n"
    "  gambit_cli divide <depth> [fen...]\n"
    "  gambit_cli eval [fen...]\n"
    "  gambit_cli search [fen...]\n"
    "  gambit_cli play [--ai] [fen...]\n"
    "If FEN omitted, uses startpos.\n";
}

static std::string join_from(const std::vector<std::string>& a, size_t i) {
  if (i >= a.size()) return "";
  std::ostringstream oss;
  for (size_t k = i; k < a.size(); ++k) {
    if (k > i) oss << ' ';
    oss << a[k];
  }
  return oss.str();
}

static Color board_from_args(const std::vector<std::string>& a, size_t fenStart, Board& b) {
  if (fenStart < a.size()) {
    const std::string fen = join_from(a, fenStart);
    return set_from_fen(b, fen);
  }
  return set_from_fen(b, STARTPOS_FEN);
}

static int to_int(const std::string& s) {
  return std::stoi(s);
}

static int run(const std::vector<std::string>& args) {
  const std::string cmd = args[0];

  // perft <depth> [fen...]
  if (cmd == "perft") {
    if (args.size() < 2) { usage(); return 1; }
    const int depth = to_int(args[1]);
    Board b;
    const Color stm = board_from_args(args, 2, b);
    std::cout << perft(b, stm, depth) << "\n";
    return 0;
  }

  // divide <depth> [fen...]
  if (cmd == "divide") {
    if (args.size() < 2) { usage(); return 1; }
    const int depth = to_int(args[1]);
    Board b;
    const Color stm = board_from_args(args, 2, b);
    std::vector<std::pair<Move, std::uint64_t>> parts;
    perft_divide(b, stm, depth, parts);
    std::uint64_t total = 0;
    for (auto& [m, n] : parts) {
      std::cout << move_to_text(m) << " " << n << "\n";
      total += n;
    }
    std::cout << "total " << total << "\n";
    return 0;
  }

  // eval [fen...]
  if (cmd == "eval") {
    Board b;
    const Color stm = board_from_args(args, 1, b);
    std::cout << "eval " << evaluate(b)
              << " (" << (stm == Color::White ? "white" : "black") << " to move)\n";
    return 0;
  }

  // search [fen...]
  if (cmd == "search") {
    Board b;
    const Color stm = board_from_args(args, 1, b);
    const SearchResult r = search(b, stm);
    if (!r.found) { std::cout << "best none nodes " << r.nodes << "\n"; return 0; }
    std::cout << "best " << move_to_text(r.best)
              << " score " << r.score
              << " nodes " << r.nodes << "\n";
    return 0;
  }

  // play [--ai] [fen...]
  if (cmd == "play") {
    Game g;
    size_t fenStart = 1;
    if (fenStart < args.size() && args[fenStart] == "--ai") {
      g.set_automated_opponent(true);
      ++fenStart;
    }
    if (fenStart < args.size()) g.load_fen(join_from(args, fenStart));
    std::cout << render_board(g) << turn_line(g) << "\n";
    if (g.play_automated_move()) std::cout << render_board(g) << turn_line(g) << "\n";
    console_loop(std::cin, std::cout, g);
    return 0;
  }

  usage();
  return 1;
}

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);
  if (args.empty()) { usage(); return 0; }

  try {
    return run(args);
  } catch (const FenError& e) {
    std::cerr << "error: " << e.what() << "\n";
  } catch (const std::invalid_argument& e) {
    std::cerr << "error: bad number: " << e.what() << "\n";
  } catch (const std::out_of_range& e) {
    std::cerr << "error: number out of range: " << e.what() << "\n";
  }
  return 1;
}
