#pragma once

// ============================================================================
// TransactionLog - 只追加的持仓变动记录, 以及平均成本 / 已实现盈亏
//
// 成本口径: 历史 Buy / TradeIn 行的按数量加权平均单价 (不是 FIFO/LIFO)
//          单价为 0 的 TradeIn (转出方无成本记录) 不参与平均
//          无任何有价记录时, 以当前成交价作为成本, 盈亏为 0
// ============================================================================

#include <algorithm>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "../core/clock.hpp"
#include "../core/database.hpp"
#include "../core/model.hpp"

namespace ledger {

using Tx = Database::Tx;

struct PerformanceSummary {
  fixed::Cents total_invested = 0;
  fixed::Cents total_sold = 0;
  fixed::Cents realized_pnl = 0;
  int64_t buy_count = 0;
  int64_t sell_count = 0;
  int64_t trade_in_count = 0;
  int64_t trade_out_count = 0;
  int64_t last_transaction_at = 0;
  std::map<std::string, fixed::Cents> pnl_by_asset_type;
  std::map<std::string, int64_t> count_by_asset_type; // 仅 Buy / Sell

  // 最近 7 / 30 天 (滚动窗口)
  fixed::Cents weekly_pnl = 0;
  fixed::Cents monthly_pnl = 0;
  int64_t weekly_count = 0;
  int64_t monthly_count = 0;
};

static constexpr int64_t MS_PER_DAY = 24LL * 3600 * 1000;

class TransactionLog {
public:
  explicit TransactionLog(Database &db) : db_(db) {}

  int64_t record(Tx &tx, const model::Transaction &t) {
    if (t.quantity <= 0) {
      throw LedgerError(ErrorKind::InvalidArgument, "transaction quantity must be positive");
    }
    return tx.insert_returning_id(
        "INSERT INTO transactions (ts, user_id, kind, asset_type, asset_name, unit_price, quantity, "
        "cost_basis, profit_loss, offer_id) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?) RETURNING id",
        {duckdb::Value::BIGINT(t.ts ? t.ts : now_ms()), duckdb::Value(t.user_id),
         duckdb::Value(model::to_string(t.kind)), duckdb::Value(model::to_string(t.asset.type)),
         duckdb::Value(t.asset.name), duckdb::Value::BIGINT(t.unit_price), duckdb::Value::BIGINT(t.quantity),
         duckdb::Value::BIGINT(t.cost_basis), duckdb::Value::BIGINT(t.profit_loss),
         t.offer_id ? duckdb::Value::BIGINT(*t.offer_id) : duckdb::Value()});
  }

  // 历史加权均价; 无有价记录返回 nullopt
  std::optional<fixed::Cents> historical_cost(Tx &tx, const std::string &user_id, const model::AssetRef &asset) {
    auto rows = tx.query("SELECT CAST(SUM(unit_price * quantity) AS BIGINT), CAST(SUM(quantity) AS BIGINT) "
                         "FROM transactions "
                         "WHERE user_id = ? AND asset_type = ? AND asset_name = ? "
                         "AND kind IN ('buy', 'trade_in') AND unit_price > 0",
                         {duckdb::Value(user_id), duckdb::Value(model::to_string(asset.type)),
                          duckdb::Value(asset.name)});
    if (rows.empty() || rows.is_null(0, 1))
      return std::nullopt;
    int64_t total_qty = rows.get_int(0, 1);
    if (total_qty <= 0)
      return std::nullopt;
    return fixed::div_round(rows.get_int(0, 0), total_qty);
  }

  fixed::Cents average_cost(Tx &tx, const std::string &user_id, const model::AssetRef &asset,
                            fixed::Cents market_price) {
    return historical_cost(tx, user_id, asset).value_or(market_price);
  }

  struct Realized {
    fixed::Cents cost_basis = 0;
    fixed::Cents profit_loss = 0;
  };

  // (salePrice - AverageCost) * qty
  Realized realize_sell(Tx &tx, const std::string &user_id, const model::AssetRef &asset,
                        fixed::Cents sale_price, fixed::Qty qty) {
    Realized r;
    r.cost_basis = average_cost(tx, user_id, asset, sale_price);
    r.profit_loss = fixed::notional(sale_price - r.cost_basis, qty);
    return r;
  }

  // ========================================================================
  // 读模型
  // ========================================================================

  std::vector<model::Transaction> history(const std::string &user_id, int limit = 500) {
    auto rows = db_.query("SELECT id, ts, user_id, kind, asset_type, asset_name, unit_price, quantity, "
                          "cost_basis, profit_loss, offer_id FROM transactions WHERE user_id = ? "
                          "ORDER BY ts DESC, id DESC LIMIT ?",
                          {duckdb::Value(user_id), duckdb::Value::BIGINT(limit)});

    std::vector<model::Transaction> out;
    out.reserve(rows.size());
    for (size_t r = 0; r < rows.size(); ++r) {
      model::Transaction t;
      t.id = rows.get_int(r, 0);
      t.ts = rows.get_int(r, 1);
      t.user_id = rows.get_string(r, 2);
      t.kind = model::parse<model::TxKind>(rows.get_string(r, 3));
      t.asset.type = model::parse<model::AssetType>(rows.get_string(r, 4));
      t.asset.name = rows.get_string(r, 5);
      t.unit_price = rows.get_int(r, 6);
      t.quantity = rows.get_int(r, 7);
      t.cost_basis = rows.get_int(r, 8);
      t.profit_loss = rows.get_int(r, 9);
      if (!rows.is_null(r, 10))
        t.offer_id = rows.get_int(r, 10);
      out.push_back(std::move(t));
    }
    return out;
  }

  PerformanceSummary summary(const std::string &user_id, int64_t now = now_ms()) {
    PerformanceSummary s;
    int64_t week_start = now - 7 * MS_PER_DAY;
    int64_t month_start = now - 30 * MS_PER_DAY;

    auto rows = db_.query(
        "SELECT kind, asset_type, COUNT(*), "
        "CAST(SUM(unit_price * quantity) AS BIGINT), CAST(SUM(profit_loss) AS BIGINT), MAX(ts), "
        "CAST(SUM(CASE WHEN ts >= ? THEN profit_loss ELSE 0 END) AS BIGINT), "
        "CAST(SUM(CASE WHEN ts >= ? THEN profit_loss ELSE 0 END) AS BIGINT), "
        "COUNT(CASE WHEN ts >= ? THEN 1 END), COUNT(CASE WHEN ts >= ? THEN 1 END) "
        "FROM transactions WHERE user_id = ? GROUP BY kind, asset_type",
        {duckdb::Value::BIGINT(week_start), duckdb::Value::BIGINT(month_start), duckdb::Value::BIGINT(week_start),
         duckdb::Value::BIGINT(month_start), duckdb::Value(user_id)});

    for (size_t r = 0; r < rows.size(); ++r) {
      auto kind = model::parse<model::TxKind>(rows.get_string(r, 0));
      std::string asset_type = rows.get_string(r, 1);
      int64_t count = rows.get_int(r, 2);
      // unit_price 为 cent, quantity 为千分之一份
      fixed::Cents value = fixed::div_round(rows.get_int(r, 3), fixed::QTY_SCALE);
      fixed::Cents pnl = rows.get_int(r, 4);
      s.last_transaction_at = std::max(s.last_transaction_at, rows.get_int(r, 5));

      int64_t week_count = rows.get_int(r, 8);
      int64_t month_count = rows.get_int(r, 9);

      switch (kind) {
      case model::TxKind::Buy:
        s.buy_count += count;
        s.total_invested += value;
        s.count_by_asset_type[asset_type] += count;
        s.weekly_count += week_count;
        s.monthly_count += month_count;
        break;
      case model::TxKind::Sell:
        s.sell_count += count;
        s.total_sold += value;
        s.realized_pnl += pnl;
        s.pnl_by_asset_type[asset_type] += pnl;
        s.count_by_asset_type[asset_type] += count;
        s.weekly_pnl += rows.get_int(r, 6);
        s.monthly_pnl += rows.get_int(r, 7);
        s.weekly_count += week_count;
        s.monthly_count += month_count;
        break;
      case model::TxKind::TradeIn:
        s.trade_in_count += count;
        break;
      case model::TxKind::TradeOut:
        s.trade_out_count += count;
        break;
      }
    }
    return s;
  }

private:
  Database &db_;
};

} // namespace ledger
