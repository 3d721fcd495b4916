#pragma once

// ============================================================================
// HoldingsRegistry - (user, asset) -> 份额
// 只管数量, 不存价格; 数量归零即删除该行
// ============================================================================

#include <string>
#include <vector>

#include "../core/database.hpp"
#include "../core/errors.hpp"
#include "../core/model.hpp"

namespace ledger {

using fixed::Qty;
using Tx = Database::Tx;

class HoldingsRegistry {
public:
  explicit HoldingsRegistry(Database &db) : db_(db) {}

  Qty quantity(Tx &tx, const std::string &user_id, const model::AssetRef &asset) {
    auto rows = tx.query("SELECT quantity FROM holdings WHERE user_id = ? AND asset_type = ? AND asset_name = ?",
                         key(user_id, asset));
    return rows.empty() ? 0 : rows.get_int(0, 0);
  }

  void increase(Tx &tx, const std::string &user_id, const model::AssetRef &asset, Qty qty) {
    check_qty(qty);

    Params params = {duckdb::Value::BIGINT(qty)};
    for (auto &v : key(user_id, asset))
      params.push_back(std::move(v));

    int64_t changed = tx.exec("UPDATE holdings SET quantity = quantity + ? "
                              "WHERE user_id = ? AND asset_type = ? AND asset_name = ?",
                              params);
    if (changed == 0) {
      Params insert = key(user_id, asset);
      insert.push_back(duckdb::Value::BIGINT(qty));
      tx.exec("INSERT INTO holdings (user_id, asset_type, asset_name, quantity) VALUES (?, ?, ?, ?)", insert);
    }
  }

  void decrease(Tx &tx, const std::string &user_id, const model::AssetRef &asset, Qty qty) {
    check_qty(qty);

    Params params = {duckdb::Value::BIGINT(qty)};
    for (auto &v : key(user_id, asset))
      params.push_back(std::move(v));
    params.push_back(duckdb::Value::BIGINT(qty));

    int64_t changed = tx.exec("UPDATE holdings SET quantity = quantity - ? "
                              "WHERE user_id = ? AND asset_type = ? AND asset_name = ? AND quantity >= ?",
                              params);
    if (changed == 0) {
      Qty held = quantity(tx, user_id, asset);
      throw LedgerError(ErrorKind::InsufficientHoldings,
                        user_id + " holds " + fixed::format_qty(held) + " of " + asset.name + ", needs " +
                            fixed::format_qty(qty));
    }

    tx.exec("DELETE FROM holdings WHERE user_id = ? AND asset_type = ? AND asset_name = ? AND quantity = 0",
            key(user_id, asset));
  }

  std::vector<model::Holding> list(Tx &tx, const std::string &user_id) {
    return to_holdings(tx.query(LIST_SQL, {duckdb::Value(user_id)}));
  }

  // 读连接快照
  std::vector<model::Holding> holdings(const std::string &user_id) {
    return to_holdings(db_.query(LIST_SQL, {duckdb::Value(user_id)}));
  }

private:
  static constexpr const char *LIST_SQL =
      "SELECT user_id, asset_type, asset_name, quantity FROM holdings "
      "WHERE user_id = ? AND quantity > 0 ORDER BY asset_type, asset_name";

  static Params key(const std::string &user_id, const model::AssetRef &asset) {
    return {duckdb::Value(user_id), duckdb::Value(model::to_string(asset.type)), duckdb::Value(asset.name)};
  }

  static void check_qty(Qty qty) {
    if (qty <= 0) {
      throw LedgerError(ErrorKind::InvalidArgument, "quantity must be positive");
    }
  }

  static std::vector<model::Holding> to_holdings(Rows rows) {
    std::vector<model::Holding> out;
    out.reserve(rows.size());
    for (size_t r = 0; r < rows.size(); ++r) {
      model::Holding h;
      h.user_id = rows.get_string(r, 0);
      h.asset.type = model::parse<model::AssetType>(rows.get_string(r, 1));
      h.asset.name = rows.get_string(r, 2);
      h.quantity = rows.get_int(r, 3);
      out.push_back(std::move(h));
    }
    return out;
  }

  Database &db_;
};

} // namespace ledger
