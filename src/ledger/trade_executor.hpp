#pragma once

// ============================================================================
// TradeExecutor - 买入/卖出
// Buy:  Debit -> Increase -> Record(Buy)
// Sell: Decrease -> 成本/盈亏 -> Credit -> Record(Sell)
// 扣款向上取整, 入账向下取整 (fixed::purchase_cost / sale_proceeds)
// 四步在同一事务内, 任一步失败整体回滚
// ============================================================================

#include <iostream>
#include <string>

#include "../core/clock.hpp"
#include "../core/database.hpp"
#include "../core/model.hpp"
#include "account_ledger.hpp"
#include "holdings_registry.hpp"
#include "transaction_log.hpp"

namespace ledger {

struct TradeReceipt {
  int64_t transaction_id = 0;
  model::Side side = model::Side::Buy;
  model::AssetRef asset;
  fixed::Cents unit_price = 0;
  fixed::Qty quantity = 0;
  fixed::Cents cash_delta = 0; // 买入为负
  fixed::Cents cost_basis = 0;
  fixed::Cents profit_loss = 0;
  fixed::Cents balance_after = 0;
  fixed::Qty holding_after = 0;
};

class TradeExecutor {
public:
  TradeExecutor(Database &db, AccountLedger &accounts, HoldingsRegistry &holdings, TransactionLog &log)
      : db_(db), accounts_(accounts), holdings_(holdings), log_(log) {}

  TradeReceipt execute_trade(const std::string &user_id, const model::AssetRef &asset, model::Side side,
                             fixed::Cents unit_price, fixed::Qty qty) {
    if (asset.name.empty()) {
      throw LedgerError(ErrorKind::InvalidArgument, "asset name must not be empty");
    }
    if (unit_price <= 0) {
      throw LedgerError(ErrorKind::InvalidArgument, "unit price must be positive");
    }
    if (qty <= 0) {
      throw LedgerError(ErrorKind::InvalidArgument, "quantity must be positive");
    }

    auto receipt = db_.transact([&](Tx &tx) {
      return side == model::Side::Buy ? buy(tx, user_id, asset, unit_price, qty)
                                      : sell(tx, user_id, asset, unit_price, qty);
    });

    std::cout << "[Ledger] " << model::to_string(side) << " " << user_id << " " << asset.name << " x"
              << fixed::format_qty(qty) << " @" << fixed::format_cents(unit_price)
              << " balance=" << fixed::format_cents(receipt.balance_after) << std::endl;
    return receipt;
  }

private:
  TradeReceipt buy(Tx &tx, const std::string &user_id, const model::AssetRef &asset, fixed::Cents unit_price,
                   fixed::Qty qty) {
    fixed::Cents cost = fixed::purchase_cost(unit_price, qty);
    accounts_.debit(tx, user_id, cost);
    holdings_.increase(tx, user_id, asset, qty);

    model::Transaction t;
    t.ts = now_ms();
    t.user_id = user_id;
    t.kind = model::TxKind::Buy;
    t.asset = asset;
    t.unit_price = unit_price;
    t.quantity = qty;
    t.cost_basis = unit_price;
    t.profit_loss = 0;

    TradeReceipt r;
    r.transaction_id = log_.record(tx, t);
    r.side = model::Side::Buy;
    r.asset = asset;
    r.unit_price = unit_price;
    r.quantity = qty;
    r.cash_delta = -cost;
    r.cost_basis = unit_price;
    r.balance_after = accounts_.balance(tx, user_id);
    r.holding_after = holdings_.quantity(tx, user_id, asset);
    return r;
  }

  TradeReceipt sell(Tx &tx, const std::string &user_id, const model::AssetRef &asset, fixed::Cents unit_price,
                    fixed::Qty qty) {
    accounts_.get(tx, user_id);
    holdings_.decrease(tx, user_id, asset, qty);

    auto realized = log_.realize_sell(tx, user_id, asset, unit_price, qty);
    fixed::Cents proceeds = fixed::sale_proceeds(unit_price, qty);
    accounts_.credit(tx, user_id, proceeds);

    model::Transaction t;
    t.ts = now_ms();
    t.user_id = user_id;
    t.kind = model::TxKind::Sell;
    t.asset = asset;
    t.unit_price = unit_price;
    t.quantity = qty;
    t.cost_basis = realized.cost_basis;
    t.profit_loss = realized.profit_loss;

    TradeReceipt r;
    r.transaction_id = log_.record(tx, t);
    r.side = model::Side::Sell;
    r.asset = asset;
    r.unit_price = unit_price;
    r.quantity = qty;
    r.cash_delta = proceeds;
    r.cost_basis = realized.cost_basis;
    r.profit_loss = realized.profit_loss;
    r.balance_after = accounts_.balance(tx, user_id);
    r.holding_after = holdings_.quantity(tx, user_id, asset);
    return r;
  }

  Database &db_;
  AccountLedger &accounts_;
  HoldingsRegistry &holdings_;
  TransactionLog &log_;
};

} // namespace ledger
