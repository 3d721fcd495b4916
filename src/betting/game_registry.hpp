#pragma once

// ============================================================================
// GameRegistry - 比赛 (由外部赛程源写入)
// 状态只走一次 scheduled -> completed
// ============================================================================

#include <iostream>
#include <string>
#include <vector>

#include "../core/clock.hpp"
#include "../core/database.hpp"
#include "../core/model.hpp"

namespace betting {

using Tx = Database::Tx;

class GameRegistry {
public:
  explicit GameRegistry(Database &db) : db_(db) {}

  int64_t add_game(const model::Game &g) {
    if (g.home_team.empty() || g.away_team.empty()) {
      throw LedgerError(ErrorKind::InvalidArgument, "game needs both teams");
    }
    if (g.home_team == g.away_team) {
      throw LedgerError(ErrorKind::InvalidArgument, "home and away team must differ");
    }
    if (g.home_odds <= fixed::ODDS_SCALE || g.away_odds <= fixed::ODDS_SCALE) {
      throw LedgerError(ErrorKind::InvalidArgument, "moneyline odds must be greater than 1.00");
    }
    if (g.home_odds > fixed::MAX_ODDS || g.away_odds > fixed::MAX_ODDS) {
      throw LedgerError(ErrorKind::InvalidArgument, "moneyline odds must not exceed " +
                                                        fixed::to_decimal(fixed::MAX_ODDS, fixed::ODDS_SCALE));
    }
    if (g.total_line <= 0) {
      throw LedgerError(ErrorKind::InvalidArgument, "total line must be positive");
    }

    int64_t id = db_.transact([&](Tx &tx) {
      return tx.insert_returning_id(
          "INSERT INTO games (home_team, away_team, scheduled_at, home_odds, away_odds, spread, total_line) "
          "VALUES (?, ?, ?, ?, ?, ?, ?) RETURNING id",
          {duckdb::Value(g.home_team), duckdb::Value(g.away_team), duckdb::Value::BIGINT(g.scheduled_at),
           duckdb::Value::BIGINT(g.home_odds), duckdb::Value::BIGINT(g.away_odds),
           duckdb::Value::BIGINT(g.spread), duckdb::Value::BIGINT(g.total_line)});
    });

    std::cout << "[Bets] game " << id << " " << g.away_team << " @ " << g.home_team << " added" << std::endl;
    return id;
  }

  model::Game load(Tx &tx, int64_t game_id) {
    auto rows = tx.query(std::string(SELECT_SQL) + " WHERE id = ?", {duckdb::Value::BIGINT(game_id)});
    if (rows.empty()) {
      throw LedgerError(ErrorKind::NotFound, "unknown game " + std::to_string(game_id));
    }
    return to_game(rows, 0);
  }

  model::Game get_game(int64_t game_id) {
    auto rows = db_.query(std::string(SELECT_SQL) + " WHERE id = ?", {duckdb::Value::BIGINT(game_id)});
    if (rows.empty()) {
      throw LedgerError(ErrorKind::NotFound, "unknown game " + std::to_string(game_id));
    }
    return to_game(rows, 0);
  }

  std::vector<model::Game> upcoming_games(int limit = 50) {
    auto rows = db_.query(std::string(SELECT_SQL) +
                              " WHERE status = 'scheduled' AND scheduled_at > ? ORDER BY scheduled_at, id LIMIT ?",
                          {duckdb::Value::BIGINT(now_ms()), duckdb::Value::BIGINT(limit)});
    std::vector<model::Game> out;
    out.reserve(rows.size());
    for (size_t r = 0; r < rows.size(); ++r)
      out.push_back(to_game(rows, r));
    return out;
  }

  // 投注截止: 开赛前 close_minutes 分钟
  static bool betting_open(const model::Game &g, int close_minutes, int64_t now) {
    return g.status == model::GameStatus::Scheduled &&
           g.scheduled_at > now + static_cast<int64_t>(close_minutes) * 60 * 1000;
  }

private:
  static constexpr const char *SELECT_SQL =
      "SELECT id, home_team, away_team, scheduled_at, home_odds, away_odds, spread, total_line, status, "
      "home_score, away_score FROM games";

  static model::Game to_game(Rows &rows, size_t r) {
    model::Game g;
    g.id = rows.get_int(r, 0);
    g.home_team = rows.get_string(r, 1);
    g.away_team = rows.get_string(r, 2);
    g.scheduled_at = rows.get_int(r, 3);
    g.home_odds = rows.get_int(r, 4);
    g.away_odds = rows.get_int(r, 5);
    g.spread = rows.get_int(r, 6);
    g.total_line = rows.get_int(r, 7);
    g.status = model::parse<model::GameStatus>(rows.get_string(r, 8));
    if (!rows.is_null(r, 9))
      g.home_score = static_cast<int>(rows.get_int(r, 9));
    if (!rows.is_null(r, 10))
      g.away_score = static_cast<int>(rows.get_int(r, 10));
    return g;
  }

  Database &db_;
};

} // namespace betting
