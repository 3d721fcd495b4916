#pragma once

// ============================================================================
// BetEngine - 单注
// Pending -> Won / Lost / Push (结算) 或 Cancelled (开赛前撤单)
// 下注即扣本金; Won 派 potential_payout, Push / Cancelled 退本金
// ============================================================================

#include <iostream>
#include <string>
#include <vector>

#include "../core/clock.hpp"
#include "../core/config.hpp"
#include "../core/database.hpp"
#include "../core/model.hpp"
#include "../ledger/account_ledger.hpp"
#include "game_registry.hpp"
#include "outcome.hpp"

namespace betting {

// 一次判定是否真正生效 (已是终态则 applied = false)
struct Resolution {
  bool applied = false;
  model::BetStatus status = model::BetStatus::Pending;
  fixed::Cents credited = 0;
};

// 下注前的公共校验 (单注与串关共用)
inline void check_stake(const Config &config, fixed::Cents stake) {
  if (stake <= 0) {
    throw LedgerError(ErrorKind::InvalidStake, "stake must be positive");
  }
  if (stake < config.min_stake) {
    throw LedgerError(ErrorKind::InvalidStake,
                      "minimum stake is " + fixed::format_cents(config.min_stake));
  }
}

inline void check_bettor(const Config &config, const model::Account &account) {
  if (config.require_age_verification && !account.verified_adult) {
    throw LedgerError(ErrorKind::AgeVerificationRequired,
                      account.user_id + " must verify age before wagering");
  }
}

inline void check_open(const Config &config, const model::Game &game) {
  if (game.status != model::GameStatus::Scheduled) {
    throw LedgerError(ErrorKind::BettingClosed, "game " + std::to_string(game.id) + " is completed");
  }
  if (!GameRegistry::betting_open(game, config.betting_close_minutes, now_ms())) {
    throw LedgerError(ErrorKind::BettingClosed, "betting closed for game " + std::to_string(game.id));
  }
}

class BetEngine {
public:
  BetEngine(Database &db, const Config &config, ledger::AccountLedger &accounts, GameRegistry &games)
      : db_(db), config_(config), accounts_(accounts), games_(games) {}

  model::Bet place_bet(const std::string &user_id, const model::Selection &selection, fixed::Cents stake) {
    check_stake(config_, stake);
    if (!valid_selection(selection)) {
      throw LedgerError(ErrorKind::InvalidSelection, std::string("pick '") + model::to_string(selection.pick) +
                                                         "' does not fit " + model::to_string(selection.type));
    }

    model::Bet bet = db_.transact([&](Tx &tx) {
      check_bettor(config_, accounts_.get(tx, user_id));
      model::Game game = games_.load(tx, selection.game_id);
      check_open(config_, game);

      model::Bet b;
      b.user_id = user_id;
      b.selection = selection;
      b.stake = stake;
      b.odds = quoted_odds(game, selection, config_.standard_odds);
      b.potential_payout = fixed::payout(stake, b.odds);
      b.placed_at = now_ms();

      accounts_.debit(tx, user_id, stake);
      b.id = tx.insert_returning_id(
          "INSERT INTO bets (user_id, game_id, bet_type, pick, stake, odds, potential_payout, status, placed_at) "
          "VALUES (?, ?, ?, ?, ?, ?, ?, 'pending', ?) RETURNING id",
          {duckdb::Value(user_id), duckdb::Value::BIGINT(selection.game_id),
           duckdb::Value(model::to_string(selection.type)), duckdb::Value(model::to_string(selection.pick)),
           duckdb::Value::BIGINT(stake), duckdb::Value::BIGINT(b.odds), duckdb::Value::BIGINT(b.potential_payout),
           duckdb::Value::BIGINT(b.placed_at)});
      return b;
    });

    std::cout << "[Bets] #" << bet.id << " " << user_id << " " << model::to_string(selection.type) << "/"
              << model::to_string(selection.pick) << " game=" << selection.game_id
              << " stake=" << fixed::format_cents(stake) << " payout=" << fixed::format_cents(bet.potential_payout)
              << std::endl;
    return bet;
  }

  // 幂等: 只有 pending 的注单会被改写
  Resolution resolve_bet(Tx &tx, const model::Bet &bet, Grade grade) {
    Resolution r;
    r.status = model::to_bet_status(grade);

    int64_t changed = tx.exec("UPDATE bets SET status = ?, settled_at = ? WHERE id = ? AND status = 'pending'",
                              {duckdb::Value(model::to_string(r.status)), duckdb::Value::BIGINT(now_ms()),
                               duckdb::Value::BIGINT(bet.id)});
    if (changed == 0)
      return r;

    r.applied = true;
    if (grade == Grade::Won)
      r.credited = bet.potential_payout;
    else if (grade == Grade::Push)
      r.credited = bet.stake;
    accounts_.credit(tx, bet.user_id, r.credited);
    return r;
  }

  std::vector<model::Bet> pending_for_game(Tx &tx, int64_t game_id) {
    return to_bets(tx.query(std::string(SELECT_SQL) + " WHERE game_id = ? AND status = 'pending' ORDER BY id",
                            {duckdb::Value::BIGINT(game_id)}));
  }

  model::Bet cancel_bet(int64_t bet_id, const std::string &user_id) {
    model::Bet bet = db_.transact([&](Tx &tx) {
      model::Bet b = load(tx, bet_id);
      if (b.user_id != user_id) {
        throw LedgerError(ErrorKind::NotAuthorized, "bet " + std::to_string(bet_id) + " belongs to another user");
      }
      if (b.status != model::BetStatus::Pending) {
        throw LedgerError(ErrorKind::AlreadySettled,
                          "bet " + std::to_string(bet_id) + " is " + model::to_string(b.status));
      }
      check_open(config_, games_.load(tx, b.selection.game_id));

      int64_t changed =
          tx.exec("UPDATE bets SET status = 'cancelled', settled_at = ? WHERE id = ? AND status = 'pending'",
                  {duckdb::Value::BIGINT(now_ms()), duckdb::Value::BIGINT(bet_id)});
      if (changed == 0) {
        throw LedgerError(ErrorKind::AlreadySettled, "bet " + std::to_string(bet_id) + " is no longer pending");
      }
      accounts_.credit(tx, user_id, b.stake);
      b.status = model::BetStatus::Cancelled;
      return b;
    });

    std::cout << "[Bets] #" << bet_id << " cancelled, refunded " << fixed::format_cents(bet.stake) << std::endl;
    return bet;
  }

  model::Bet load(Tx &tx, int64_t bet_id) {
    auto bets = to_bets(tx.query(std::string(SELECT_SQL) + " WHERE id = ?", {duckdb::Value::BIGINT(bet_id)}));
    if (bets.empty()) {
      throw LedgerError(ErrorKind::NotFound, "unknown bet " + std::to_string(bet_id));
    }
    return bets.front();
  }

  std::vector<model::Bet> user_bets(const std::string &user_id) {
    return to_bets(db_.query(std::string(SELECT_SQL) + " WHERE user_id = ? ORDER BY placed_at DESC, id DESC",
                             {duckdb::Value(user_id)}));
  }

private:
  static constexpr const char *SELECT_SQL =
      "SELECT id, user_id, game_id, bet_type, pick, stake, odds, potential_payout, status, placed_at FROM bets";

  static std::vector<model::Bet> to_bets(Rows rows) {
    std::vector<model::Bet> out;
    out.reserve(rows.size());
    for (size_t r = 0; r < rows.size(); ++r) {
      model::Bet b;
      b.id = rows.get_int(r, 0);
      b.user_id = rows.get_string(r, 1);
      b.selection.game_id = rows.get_int(r, 2);
      b.selection.type = model::parse<model::BetType>(rows.get_string(r, 3));
      b.selection.pick = model::parse<model::Pick>(rows.get_string(r, 4));
      b.stake = rows.get_int(r, 5);
      b.odds = rows.get_int(r, 6);
      b.potential_payout = rows.get_int(r, 7);
      b.status = model::parse<model::BetStatus>(rows.get_string(r, 8));
      b.placed_at = rows.get_int(r, 9);
      out.push_back(std::move(b));
    }
    return out;
  }

  Database &db_;
  const Config &config_;
  ledger::AccountLedger &accounts_;
  GameRegistry &games_;
};

} // namespace betting
