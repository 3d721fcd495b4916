#pragma once

// ============================================================================
// ParlayEngine - 串关
// 赔率在创建时锁定, potential_payout = stake * Π(odds)
// 状态由各腿推导:
//   任一腿 Lost              -> Lost (其余腿不必等待)
//   全部判定且无 Lost         -> Won (Push 腿视为中性, 派彩不变)
//   全部 Push                -> Push (退本金)
//   否则                     -> Pending
// ============================================================================

#include <algorithm>
#include <iostream>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "../core/clock.hpp"
#include "../core/config.hpp"
#include "../core/database.hpp"
#include "../core/model.hpp"
#include "../ledger/account_ledger.hpp"
#include "bet_engine.hpp"
#include "game_registry.hpp"
#include "outcome.hpp"

namespace betting {

class ParlayEngine {
public:
  ParlayEngine(Database &db, const Config &config, ledger::AccountLedger &accounts, GameRegistry &games)
      : db_(db), config_(config), accounts_(accounts), games_(games) {}

  static model::BetStatus derive_status(const std::vector<model::BetStatus> &legs) {
    bool any_pending = false;
    bool all_push = !legs.empty();
    for (auto s : legs) {
      if (s == model::BetStatus::Lost)
        return model::BetStatus::Lost;
      if (s == model::BetStatus::Pending)
        any_pending = true;
      if (s != model::BetStatus::Push)
        all_push = false;
    }
    if (any_pending)
      return model::BetStatus::Pending;
    return all_push ? model::BetStatus::Push : model::BetStatus::Won;
  }

  model::Parlay create_parlay(const std::string &user_id, const std::vector<model::Selection> &selections,
                              fixed::Cents stake) {
    if (selections.size() < 2) {
      throw LedgerError(ErrorKind::InvalidSelection, "a parlay needs at least 2 legs");
    }
    if (selections.size() > static_cast<size_t>(config_.max_parlay_legs)) {
      throw LedgerError(ErrorKind::InvalidSelection,
                        "a parlay allows at most " + std::to_string(config_.max_parlay_legs) + " legs");
    }
    check_stake(config_, stake);

    std::set<std::pair<int64_t, model::BetType>> seen;
    for (const auto &s : selections) {
      if (!valid_selection(s)) {
        throw LedgerError(ErrorKind::InvalidSelection, std::string("pick '") + model::to_string(s.pick) +
                                                           "' does not fit " + model::to_string(s.type));
      }
      if (!seen.insert({s.game_id, s.type}).second) {
        throw LedgerError(ErrorKind::InvalidSelection, "duplicate " + std::string(model::to_string(s.type)) +
                                                           " leg on game " + std::to_string(s.game_id));
      }
    }

    model::Parlay parlay = db_.transact([&](Tx &tx) {
      check_bettor(config_, accounts_.get(tx, user_id));

      model::Parlay p;
      p.user_id = user_id;
      p.stake = stake;
      p.created_at = now_ms();

      std::vector<fixed::Odds> odds;
      for (const auto &s : selections) {
        model::Game game = games_.load(tx, s.game_id);
        check_open(config_, game);

        model::ParlayLeg leg;
        leg.selection = s;
        leg.odds = quoted_odds(game, s, config_.standard_odds);
        odds.push_back(leg.odds);
        p.legs.push_back(leg);
      }
      p.potential_payout = fixed::payout(stake, odds);

      accounts_.debit(tx, user_id, stake);
      p.id = tx.insert_returning_id("INSERT INTO parlays (user_id, stake, potential_payout, status, created_at) "
                                    "VALUES (?, ?, ?, 'pending', ?) RETURNING id",
                                    {duckdb::Value(user_id), duckdb::Value::BIGINT(stake),
                                     duckdb::Value::BIGINT(p.potential_payout), duckdb::Value::BIGINT(p.created_at)});
      for (auto &leg : p.legs) {
        leg.parlay_id = p.id;
        leg.id = tx.insert_returning_id(
            "INSERT INTO parlay_legs (parlay_id, game_id, bet_type, pick, odds, status) "
            "VALUES (?, ?, ?, ?, ?, 'pending') RETURNING id",
            {duckdb::Value::BIGINT(p.id), duckdb::Value::BIGINT(leg.selection.game_id),
             duckdb::Value(model::to_string(leg.selection.type)), duckdb::Value(model::to_string(leg.selection.pick)),
             duckdb::Value::BIGINT(leg.odds)});
      }
      return p;
    });

    std::cout << "[Parlay] #" << parlay.id << " " << user_id << " legs=" << parlay.legs.size()
              << " stake=" << fixed::format_cents(stake) << " payout=" << fixed::format_cents(parlay.potential_payout)
              << std::endl;
    return parlay;
  }

  std::vector<model::ParlayLeg> pending_legs_for_game(Tx &tx, int64_t game_id) {
    return to_legs(tx.query(std::string(LEG_SQL) + " WHERE game_id = ? AND status = 'pending' ORDER BY id",
                            {duckdb::Value::BIGINT(game_id)}));
  }

  // 幂等: 已判定的腿不会再次改写
  bool resolve_leg(Tx &tx, const model::ParlayLeg &leg, Grade grade) {
    return tx.exec("UPDATE parlay_legs SET status = ? WHERE id = ? AND status = 'pending'",
                   {duckdb::Value(model::to_string(model::to_bet_status(grade))),
                    duckdb::Value::BIGINT(leg.id)}) > 0;
  }

  // 腿更新后重算串关状态; 进入终态时派彩一次
  Resolution refresh_parlay(Tx &tx, int64_t parlay_id) {
    model::Parlay p = load(tx, parlay_id);

    Resolution r;
    std::vector<model::BetStatus> statuses;
    for (const auto &leg : p.legs)
      statuses.push_back(leg.status);
    r.status = derive_status(statuses);
    if (r.status == model::BetStatus::Pending || p.status != model::BetStatus::Pending)
      return r;

    int64_t changed = tx.exec("UPDATE parlays SET status = ?, settled_at = ? WHERE id = ? AND status = 'pending'",
                              {duckdb::Value(model::to_string(r.status)), duckdb::Value::BIGINT(now_ms()),
                               duckdb::Value::BIGINT(parlay_id)});
    if (changed == 0)
      return r;

    r.applied = true;
    if (r.status == model::BetStatus::Won)
      r.credited = p.potential_payout;
    else if (r.status == model::BetStatus::Push)
      r.credited = p.stake;
    accounts_.credit(tx, p.user_id, r.credited);

    std::cout << "[Parlay] #" << parlay_id << " " << model::to_string(r.status)
              << " credited=" << fixed::format_cents(r.credited) << std::endl;
    return r;
  }

  model::Parlay load(Tx &tx, int64_t parlay_id) {
    auto rows = tx.query(std::string(PARLAY_SQL) + " WHERE id = ?", {duckdb::Value::BIGINT(parlay_id)});
    if (rows.empty()) {
      throw LedgerError(ErrorKind::NotFound, "unknown parlay " + std::to_string(parlay_id));
    }
    model::Parlay p = to_parlay(rows, 0);
    p.legs = to_legs(tx.query(std::string(LEG_SQL) + " WHERE parlay_id = ? ORDER BY id",
                              {duckdb::Value::BIGINT(parlay_id)}));
    return p;
  }

  model::Parlay get_parlay(int64_t parlay_id) {
    return db_.transact([&](Tx &tx) { return load(tx, parlay_id); });
  }

  std::vector<model::Parlay> user_parlays(const std::string &user_id) {
    auto rows = db_.query(std::string(PARLAY_SQL) + " WHERE user_id = ? ORDER BY created_at DESC, id DESC",
                          {duckdb::Value(user_id)});
    std::vector<model::Parlay> out;
    for (size_t r = 0; r < rows.size(); ++r)
      out.push_back(to_parlay(rows, r));
    if (out.empty())
      return out;

    auto legs = to_legs(db_.query(std::string(LEG_SQL) +
                                      " WHERE parlay_id IN (SELECT id FROM parlays WHERE user_id = ?) ORDER BY id",
                                  {duckdb::Value(user_id)}));
    for (auto &leg : legs) {
      auto it = std::find_if(out.begin(), out.end(), [&](const model::Parlay &p) { return p.id == leg.parlay_id; });
      if (it != out.end())
        it->legs.push_back(std::move(leg));
    }
    return out;
  }

private:
  static constexpr const char *PARLAY_SQL =
      "SELECT id, user_id, stake, potential_payout, status, created_at FROM parlays";
  static constexpr const char *LEG_SQL = "SELECT id, parlay_id, game_id, bet_type, pick, odds, status FROM parlay_legs";

  static model::Parlay to_parlay(Rows &rows, size_t r) {
    model::Parlay p;
    p.id = rows.get_int(r, 0);
    p.user_id = rows.get_string(r, 1);
    p.stake = rows.get_int(r, 2);
    p.potential_payout = rows.get_int(r, 3);
    p.status = model::parse<model::BetStatus>(rows.get_string(r, 4));
    p.created_at = rows.get_int(r, 5);
    return p;
  }

  static std::vector<model::ParlayLeg> to_legs(Rows rows) {
    std::vector<model::ParlayLeg> out;
    out.reserve(rows.size());
    for (size_t r = 0; r < rows.size(); ++r) {
      model::ParlayLeg leg;
      leg.id = rows.get_int(r, 0);
      leg.parlay_id = rows.get_int(r, 1);
      leg.selection.game_id = rows.get_int(r, 2);
      leg.selection.type = model::parse<model::BetType>(rows.get_string(r, 3));
      leg.selection.pick = model::parse<model::Pick>(rows.get_string(r, 4));
      leg.odds = rows.get_int(r, 5);
      leg.status = model::parse<model::BetStatus>(rows.get_string(r, 6));
      out.push_back(std::move(leg));
    }
    return out;
  }

  Database &db_;
  const Config &config_;
  ledger::AccountLedger &accounts_;
  GameRegistry &games_;
};

} // namespace betting
