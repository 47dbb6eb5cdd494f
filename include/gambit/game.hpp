#pragma once

#include <array>
#include <string>
#include <string_view>
#include <vector>

#include "gambit/board.hpp"
#include "gambit/move.hpp"
#include "gambit/move_do.hpp"
#include "gambit/movelist.hpp"

namespace gambit {

enum class Phase { InProgress, Ended };
enum class EndReason { None, Checkmate, Stalemate };

struct GameStatus {
  Phase phase = Phase::InProgress;
  EndReason reason = EndReason::None;
  Color loser = Color::White;    // side that was mated; only for EndReason::Checkmate

  bool ended() const { return phase == Phase::Ended; }
};

// One game in memory: board, side to move, history, captured pieces and phase.
// All mutation goes through attempt_move / undo / new_game / load_fen.
// Not thread-safe; callers on several threads must serialise access.
class Game {
public:
  // The automated opponent always plays the second colour.
  static constexpr Color AUTOMATED_SIDE = Color::Black;

  Game();

  // Standard setup, White to move, empty history and captures, phase in progress.
  // The automated-opponent switch is left as it was.
  void new_game();

  // Same reset as new_game but from a FEN position (side to move taken from the FEN).
  // Throws FenError; the game is untouched on failure.
  void load_fen(std::string_view fen);
  std::string to_fen() const;

  // Applies the move if the game is still on, both squares are on the board and the
  // move is legal for the side to move. Returns false and changes nothing otherwise.
  bool attempt_move(Square from, Square to);
  bool attempt_move(const Move& m) { return attempt_move(m.from, m.to); }

  // Takes back the last move (no-op when there is none). The phase always returns to
  // InProgress, even if the restored position is itself finished.
  void undo();

  void set_automated_opponent(bool enabled) { automated_ = enabled; }
  bool automated_opponent() const { return automated_; }

  // True when the automated opponent is enabled, on move, and the game is running.
  // The move is never played implicitly; call play_automated_move() when ready.
  bool automated_to_move() const;

  // Searches and plays the automated side's move. False if none was due.
  bool play_automated_move();

  Color turn() const { return turn_; }
  const GameStatus& status() const { return status_; }
  bool in_check() const;

  // Piece::None for empty or off-board squares.
  Piece piece_at(Square s, Color* c_out = nullptr) const;
  const Board& board() const { return board_; }

  // Piece types captured *by* c, in capture order.
  const std::vector<Piece>& captured_by(Color c) const {
    return captured_[static_cast<std::size_t>(c)];
  }
  const std::vector<HistoryEntry>& history() const { return history_; }

  void legal_moves(MoveList& out) const;

private:
  void apply_move(const Move& m);
  void evaluate_status();
  void reset(const Board& b, Color stm);

  Board board_;
  Color turn_ = Color::White;
  GameStatus status_{};
  std::vector<HistoryEntry> history_;
  std::array<std::vector<Piece>, COLOR_N> captured_{};
  bool automated_ = false;
};

} // namespace gambit
