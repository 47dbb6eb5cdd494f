#include "gambit/game.hpp"

#include "gambit/attack.hpp"
#include "gambit/fen.hpp"
#include "gambit/legal.hpp"
#include "gambit/search.hpp"

namespace gambit {

Game::Game() { new_game(); }

void Game::reset(const Board& b, Color stm) {
  board_ = b;
  turn_ = stm;
  status_ = GameStatus{};
  history_.clear();
  for (auto& c : captured_) c.clear();
}

void Game::new_game() { reset(start_board(), Color::White); }

void Game::load_fen(std::string_view fen) {
  Board b;
  const Color stm = set_from_fen(b, fen); // throws before anything is touched
  reset(b, stm);
}

std::string Game::to_fen() const { return gambit::to_fen(board_, turn_); }

bool Game::attempt_move(Square from, Square to) {
  if (status_.ended()) return false;
  const Move m{ from, to };
  if (!is_legal(board_, m, turn_)) return false;
  apply_move(m);
  return true;
}

void Game::apply_move(const Move& m) {
  const Color mover = turn_;
  HistoryEntry h = do_move(board_, m, mover);
  if (h.captured != Piece::None)
    captured_[static_cast<std::size_t>(mover)].push_back(h.captured);
  history_.push_back(h);

  turn_ = other(mover);
  evaluate_status();
}

void Game::undo() {
  if (history_.empty()) return;
  const HistoryEntry h = history_.back();
  history_.pop_back();

  undo_move(board_, h);
  if (h.captured != Piece::None) {
    auto& caps = captured_[static_cast<std::size_t>(h.mover)];
    if (!caps.empty()) caps.pop_back();
  }

  turn_ = h.mover;
  status_ = GameStatus{};
}

void Game::evaluate_status() {
  if (has_legal_move(board_, turn_)) {
    status_ = GameStatus{};
    return;
  }
  status_.phase = Phase::Ended;
  if (king_attacked(board_, turn_)) {
    status_.reason = EndReason::Checkmate;
    status_.loser = turn_;
  } else {
    status_.reason = EndReason::Stalemate;
  }
}

bool Game::automated_to_move() const {
  return automated_ && turn_ == AUTOMATED_SIDE && !status_.ended();
}

bool Game::play_automated_move() {
  if (!automated_to_move()) return false;
  const SearchResult r = search(board_, turn_);
  if (!r.found) return false;
  apply_move(r.best);
  return true;
}

bool Game::in_check() const { return king_attacked(board_, turn_); }

Piece Game::piece_at(Square s, Color* c_out) const {
  if (!is_square(s)) return Piece::None;
  return board_.piece_at(s, c_out);
}

void Game::legal_moves(MoveList& out) const { generate_legal(board_, turn_, out); }

} // namespace gambit
