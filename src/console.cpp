#include "gambit/console.hpp"
#include "gambit/fen.hpp"
#include "gambit/game.hpp"
#include "gambit/movelist.hpp"
#include "gambit/notation.hpp"
#include "gambit/types.hpp"

#include <cctype>
#include <initializer_list>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace gambit {

// ------------ rendering ------------
std::string render_board(const Game& g) {
  std::ostringstream oss;
  for (int r = 7; r >= 0; --r) {
    oss << char('1' + r);
    for (int f = 0; f < 8; ++f) {
      Color c; Piece p = g.piece_at(make_square(f, r), &c);
      oss << ' ' << piece_symbol(p, c);
    }
    oss << '\n';
  }
  oss << "  a b c d e f g h\n";
  return oss.str();
}

std::string turn_line(const Game& g) {
  return std::string(color_name(g.turn())) + "'s Turn";
}

std::string status_line(const Game& g) {
  const GameStatus& st = g.status();
  if (!st.ended()) return "Game in Progress";
  if (st.reason == EndReason::Checkmate)
    return std::string(color_name(st.loser)) + " is checkmated!";
  return "Stalemate";
}

// ------------ helpers ------------
static std::vector<std::string> split_ws(const std::string& line) {
  std::istringstream iss(line);
  std::vector<std::string> out;
  std::string tok;
  while (iss >> tok) out.push_back(tok);
  return out;
}

static std::string join_from(const std::vector<std::string>& toks, size_t start) {
  std::string s;
  for (size_t i = start; i < toks.size(); ++i) {
    if (!s.empty()) s.push_back(' ');
    s += toks[i];
  }
  return s;
}

static std::string lower(std::string s) {
  for (auto& ch : s) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  return s;
}

static void print_captured(std::ostream& out, const Game& g) {
  for (Color c : {Color::White, Color::Black}) {
    out << color_name(c) << " captured:";
    for (Piece p : g.captured_by(c)) out << ' ' << piece_symbol(p, other(c));
    out << '\n';
  }
}

static void print_state(std::ostream& out, const Game& g) {
  out << turn_line(g) << '\n' << status_line(g) << '\n';
}

// Notices for the move just played (last history entry).
static void report_last_move(std::ostream& out, const Game& g) {
  const HistoryEntry& h = g.history().back();
  const Piece moved = h.promoted ? Piece::Pawn : g.piece_at(h.move.to);
  out << color_name(h.mover) << ' ' << move_to_text(h.move) << '\n';
  out << "He moved " << piece_name(moved) << '\n';
  if (h.captured == Piece::Queen || h.captured == Piece::Rook)
    out << "That's a great move!\n";
  else if (h.captured != Piece::None)
    out << "Captured " << lower(piece_name(h.captured)) << '\n';
  if (h.promoted) out << "Promoted to Queen\n";
  print_state(out, g);
}

static void run_automated(std::ostream& out, Game& g) {
  if (!g.automated_to_move()) return;
  if (g.play_automated_move()) report_last_move(out, g);
}

static void try_move(std::ostream& out, Game& g, const std::string& text) {
  Move m;
  try {
    m = parse_move(text);
  } catch (const std::invalid_argument& e) {
    out << "error: " << e.what() << '\n';
    return;
  }
  if (!g.attempt_move(m)) {
    out << "Invalid move\n";
    return;
  }
  report_last_move(out, g);
  run_automated(out, g);
}

static void print_help(std::ostream& out) {
  out <<
    "Commands:\n"
    "  move <from><to> | <from><to>   play a move, e.g. e2e4\n"
    "  undo                           take back the last move\n"
    "  new                            start a new game\n"
    "  ai [on|off|toggle]             computer plays Black\n"
    "  board | captured | status | turn | moves\n"
    "  fen [<FEN...>]                 print or load a position\n"
    "  help | quit\n";
}

// ------------ command loop ------------
void console_loop(std::istream& in, std::ostream& out, Game& g) {
  std::string line;
  while (std::getline(in, line)) {
    auto tokens = split_ws(line);
    if (tokens.empty()) continue;
    const std::string cmd = lower(tokens[0]);

    if (cmd == "quit" || cmd == "exit") {
      break;
    }
    else if (cmd == "help") {
      print_help(out);
    }
    else if (cmd == "new") {
      g.new_game();
      out << "New Game\n";
      print_state(out, g);
    }
    else if (cmd == "move") {
      if (tokens.size() < 2) { out << "error: move needs <from><to>\n"; continue; }
      try_move(out, g, tokens[1]);
    }
    else if (cmd == "undo") {
      if (g.history().empty()) { out << "Nothing to undo\n"; continue; }
      g.undo();
      print_state(out, g);
    }
    else if (cmd == "ai") {
      const std::string arg = tokens.size() >= 2 ? lower(tokens[1]) : "toggle";
      if (arg == "on") g.set_automated_opponent(true);
      else if (arg == "off") g.set_automated_opponent(false);
      else if (arg == "toggle") g.set_automated_opponent(!g.automated_opponent());
      else { out << "error: ai expects on, off or toggle\n"; continue; }
      out << (g.automated_opponent() ? "AI: ON" : "AI: OFF") << '\n';
      run_automated(out, g);
    }
    else if (cmd == "board") {
      out << render_board(g);
    }
    else if (cmd == "captured") {
      print_captured(out, g);
    }
    else if (cmd == "status") {
      out << status_line(g) << '\n';
    }
    else if (cmd == "turn") {
      out << turn_line(g) << '\n';
    }
    else if (cmd == "moves") {
      MoveList ml;
      g.legal_moves(ml);
      std::string s;
      for (const auto& m : ml) {
        if (!s.empty()) s.push_back(' ');
        s += move_to_text(m);
      }
      out << (s.empty() ? "(none)" : s) << '\n';
    }
    else if (cmd == "fen") {
      if (tokens.size() == 1) { out << g.to_fen() << '\n'; continue; }
      try {
        g.load_fen(join_from(tokens, 1));
        print_state(out, g);
        run_automated(out, g);
      } catch (const FenError& e) {
        out << "error: " << e.what() << '\n';
      }
    }
    else if (cmd.size() == 4 || cmd.size() == 5) {
      try_move(out, g, cmd);
    }
    else {
      out << "Unknown command: " << tokens[0] << '\n';
    }
    out.flush();
  }
}

void console_loop() {
  Game g;
  console_loop(std::cin, std::cout, g);
}

} // namespace gambit
