#pragma once

// ============================================================================
// SettlementOrchestrator - 终场比分 -> 注单/串关结算
//
// 流程 (单一事务):
//   1. games: scheduled -> completed (条件更新, 只成功一次)
//   2. 该场所有 pending 单注逐一判定并派彩
//   3. 该场所有 pending 串关腿逐一判定
//   4. 受影响的串关重算状态, 进入终态时派彩
// 任一步失败整体回滚, 重试不会重复派彩
// ============================================================================

#include <iostream>
#include <set>
#include <string>

#include "../core/clock.hpp"
#include "../core/database.hpp"
#include "../core/model.hpp"
#include "bet_engine.hpp"
#include "game_registry.hpp"
#include "outcome.hpp"
#include "parlay_engine.hpp"

namespace betting {

struct SettlementReport {
  int64_t game_id = 0;
  int home_score = 0;
  int away_score = 0;
  int bets_won = 0;
  int bets_lost = 0;
  int bets_pushed = 0;
  int legs_resolved = 0;
  int parlays_won = 0;
  int parlays_lost = 0;
  int parlays_pushed = 0;
  fixed::Cents total_credited = 0;

  void count_bet(const Resolution &r) { count(r, bets_won, bets_lost, bets_pushed); }
  void count_parlay(const Resolution &r) { count(r, parlays_won, parlays_lost, parlays_pushed); }

private:
  void count(const Resolution &r, int &won, int &lost, int &pushed) {
    if (!r.applied)
      return;
    switch (r.status) {
    case model::BetStatus::Won:
      ++won;
      break;
    case model::BetStatus::Lost:
      ++lost;
      break;
    case model::BetStatus::Push:
      ++pushed;
      break;
    default:
      break;
    }
    total_credited += r.credited;
  }
};

class SettlementOrchestrator {
public:
  SettlementOrchestrator(Database &db, GameRegistry &games, BetEngine &bets, ParlayEngine &parlays)
      : db_(db), games_(games), bets_(bets), parlays_(parlays) {}

  SettlementReport settle_game(int64_t game_id, int home_score, int away_score) {
    if (home_score < 0 || away_score < 0) {
      throw LedgerError(ErrorKind::InvalidArgument, "scores must not be negative");
    }

    SettlementReport report = db_.transact([&](Tx &tx) {
      model::Game game = games_.load(tx, game_id);
      if (game.status != model::GameStatus::Scheduled) {
        throw LedgerError(ErrorKind::AlreadySettled, "game " + std::to_string(game_id) + " already settled");
      }

      int64_t changed = tx.exec("UPDATE games SET status = 'completed', home_score = ?, away_score = ?, "
                                "settled_at = ? WHERE id = ? AND status = 'scheduled'",
                                {duckdb::Value::INTEGER(home_score), duckdb::Value::INTEGER(away_score),
                                 duckdb::Value::BIGINT(now_ms()), duckdb::Value::BIGINT(game_id)});
      if (changed == 0) {
        throw LedgerError(ErrorKind::AlreadySettled, "game " + std::to_string(game_id) + " already settled");
      }

      SettlementReport rep;
      rep.game_id = game_id;
      rep.home_score = home_score;
      rep.away_score = away_score;

      GameOutcome outcome = GameOutcome::of(game, home_score, away_score);

      for (const auto &bet : bets_.pending_for_game(tx, game_id))
        rep.count_bet(bets_.resolve_bet(tx, bet, outcome.grade(bet.selection)));

      std::set<int64_t> touched;
      for (const auto &leg : parlays_.pending_legs_for_game(tx, game_id)) {
        if (parlays_.resolve_leg(tx, leg, outcome.grade(leg.selection))) {
          ++rep.legs_resolved;
          touched.insert(leg.parlay_id);
        }
      }
      for (int64_t parlay_id : touched)
        rep.count_parlay(parlays_.refresh_parlay(tx, parlay_id));

      return rep;
    });

    std::cout << "[Settle] game " << game_id << " " << home_score << "-" << away_score << " bets W/L/P="
              << report.bets_won << "/" << report.bets_lost << "/" << report.bets_pushed << " parlays W/L/P="
              << report.parlays_won << "/" << report.parlays_lost << "/" << report.parlays_pushed
              << " credited=" << fixed::format_cents(report.total_credited) << std::endl;
    return report;
  }

private:
  Database &db_;
  GameRegistry &games_;
  BetEngine &bets_;
  ParlayEngine &parlays_;
};

} // namespace betting
