#pragma once

// ============================================================================
// OfferEngine - 用户间多资产互换
//
// 报价: initiator 给出 offered, 索取 requested; counterparty 为空即公开报价
// 接受: 在同一事务内重新校验双方持仓, 然后逐项 Decrease/Increase 并记
//       TradeOut/TradeIn 流水; 任一项失败整体回滚, 报价保持 pending
// ============================================================================

#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "../core/clock.hpp"
#include "../core/database.hpp"
#include "../core/model.hpp"
#include "../ledger/account_ledger.hpp"
#include "../ledger/holdings_registry.hpp"
#include "../ledger/transaction_log.hpp"

namespace trading {

using Tx = Database::Tx;

class OfferEngine {
public:
  OfferEngine(Database &db, ledger::AccountLedger &accounts, ledger::HoldingsRegistry &holdings,
              ledger::TransactionLog &log)
      : db_(db), accounts_(accounts), holdings_(holdings), log_(log) {}

  model::TradeOffer create_offer(const std::string &initiator, const std::vector<model::OfferAsset> &offered,
                                 const std::vector<model::OfferAsset> &requested,
                                 const std::optional<std::string> &counterparty, const std::string &note = "") {
    if (offered.empty() || requested.empty()) {
      throw LedgerError(ErrorKind::InvalidArgument, "an offer needs assets on both sides");
    }
    if (counterparty && *counterparty == initiator) {
      throw LedgerError(ErrorKind::InvalidArgument, "cannot trade with yourself");
    }
    check_assets(offered, requested);

    model::TradeOffer offer = db_.transact([&](Tx &tx) {
      accounts_.get(tx, initiator);
      if (counterparty)
        accounts_.get(tx, *counterparty);

      for (const auto &a : offered) {
        fixed::Qty held = holdings_.quantity(tx, initiator, a.asset);
        if (held < a.quantity) {
          throw LedgerError(ErrorKind::InsufficientHoldings, initiator + " holds " + fixed::format_qty(held) +
                                                                 " of " + a.asset.name + ", offers " +
                                                                 fixed::format_qty(a.quantity));
        }
      }

      model::TradeOffer o;
      o.initiator = initiator;
      o.counterparty = counterparty;
      o.offered = offered;
      o.requested = requested;
      o.note = note;
      o.created_at = o.updated_at = now_ms();
      o.id = tx.insert_returning_id(
          "INSERT INTO trade_offers (initiator, counterparty, status, note, created_at, updated_at) "
          "VALUES (?, ?, 'pending', ?, ?, ?) RETURNING id",
          {duckdb::Value(initiator), counterparty ? duckdb::Value(*counterparty) : duckdb::Value(),
           duckdb::Value(note), duckdb::Value::BIGINT(o.created_at), duckdb::Value::BIGINT(o.updated_at)});

      insert_assets(tx, o.id, "offered", offered);
      insert_assets(tx, o.id, "requested", requested);
      return o;
    });

    std::cout << "[Trade] offer #" << offer.id << " " << initiator << " -> "
              << (counterparty ? *counterparty : std::string("<open>")) << " give=" << offered.size()
              << " want=" << requested.size() << std::endl;
    return offer;
  }

  model::TradeOffer accept_offer(int64_t offer_id, const std::string &acceptor) {
    model::TradeOffer offer = db_.transact([&](Tx &tx) {
      model::TradeOffer o = load(tx, offer_id);
      require_pending(o);
      if (acceptor == o.initiator) {
        throw LedgerError(ErrorKind::NotAuthorized, "cannot accept your own offer");
      }
      if (o.counterparty && *o.counterparty != acceptor) {
        throw LedgerError(ErrorKind::NotAuthorized,
                          "offer " + std::to_string(offer_id) + " is addressed to " + *o.counterparty);
      }
      accounts_.get(tx, acceptor);

      // 持仓在创建之后可能已变化, 此处重新校验
      for (const auto &a : o.offered) {
        if (holdings_.quantity(tx, o.initiator, a.asset) < a.quantity) {
          throw LedgerError(ErrorKind::StaleOffer,
                            o.initiator + " no longer holds " + fixed::format_qty(a.quantity) + " of " + a.asset.name);
        }
      }
      for (const auto &a : o.requested) {
        fixed::Qty held = holdings_.quantity(tx, acceptor, a.asset);
        if (held < a.quantity) {
          throw LedgerError(ErrorKind::InsufficientHoldings, acceptor + " holds " + fixed::format_qty(held) + " of " +
                                                                 a.asset.name + ", needs " +
                                                                 fixed::format_qty(a.quantity));
        }
      }

      int64_t ts = now_ms();
      for (const auto &a : o.offered)
        transfer(tx, offer_id, ts, o.initiator, acceptor, a);
      for (const auto &a : o.requested)
        transfer(tx, offer_id, ts, acceptor, o.initiator, a);

      int64_t changed = tx.exec("UPDATE trade_offers SET status = 'accepted', counterparty = ?, updated_at = ? "
                                "WHERE id = ? AND status = 'pending'",
                                {duckdb::Value(acceptor), duckdb::Value::BIGINT(ts), duckdb::Value::BIGINT(offer_id)});
      if (changed == 0) {
        throw LedgerError(ErrorKind::StaleOffer, "offer " + std::to_string(offer_id) + " is no longer pending");
      }
      o.status = model::OfferStatus::Accepted;
      o.counterparty = acceptor;
      o.updated_at = ts;
      return o;
    });

    std::cout << "[Trade] offer #" << offer_id << " accepted by " << acceptor << std::endl;
    return offer;
  }

  // 只有指定的 counterparty 可以拒绝
  model::TradeOffer reject_offer(int64_t offer_id, const std::string &user_id) {
    return transition(offer_id, model::OfferStatus::Rejected, [&](const model::TradeOffer &o) {
      if (!o.counterparty || *o.counterparty != user_id) {
        throw LedgerError(ErrorKind::NotAuthorized, user_id + " cannot reject offer " + std::to_string(offer_id));
      }
    });
  }

  // 只有发起方可以撤销
  model::TradeOffer cancel_offer(int64_t offer_id, const std::string &user_id) {
    return transition(offer_id, model::OfferStatus::Cancelled, [&](const model::TradeOffer &o) {
      if (o.initiator != user_id) {
        throw LedgerError(ErrorKind::NotAuthorized, user_id + " cannot cancel offer " + std::to_string(offer_id));
      }
    });
  }

  model::TradeOffer load(Tx &tx, int64_t offer_id) {
    auto rows = tx.query(std::string(OFFER_SQL) + " WHERE id = ?", {duckdb::Value::BIGINT(offer_id)});
    if (rows.empty()) {
      throw LedgerError(ErrorKind::NotFound, "unknown offer " + std::to_string(offer_id));
    }
    model::TradeOffer o = to_offer(rows, 0);
    attach_assets(tx.query(std::string(ASSET_SQL) + " WHERE offer_id = ? ORDER BY side, asset_type, asset_name",
                           {duckdb::Value::BIGINT(offer_id)}),
                  o);
    return o;
  }

  model::TradeOffer get_offer(int64_t offer_id) {
    return db_.transact([&](Tx &tx) { return load(tx, offer_id); });
  }

  // 与该用户相关的 pending 报价: 自己发出的, 发给自己的, 以及他人的公开报价
  std::vector<model::TradeOffer> pending_offers(const std::string &user_id) {
    static const std::string WHERE =
        " WHERE status = 'pending' AND (initiator = ? OR counterparty = ? OR counterparty IS NULL)";

    auto rows = db_.query(std::string(OFFER_SQL) + WHERE + " ORDER BY created_at DESC, id DESC",
                          {duckdb::Value(user_id), duckdb::Value(user_id)});
    std::vector<model::TradeOffer> out;
    std::map<int64_t, size_t> index;
    for (size_t r = 0; r < rows.size(); ++r) {
      out.push_back(to_offer(rows, r));
      index[out.back().id] = r;
    }
    if (out.empty())
      return out;

    auto assets = db_.query(std::string(ASSET_SQL) + " WHERE offer_id IN (SELECT id FROM trade_offers" + WHERE +
                                ") ORDER BY side, asset_type, asset_name",
                            {duckdb::Value(user_id), duckdb::Value(user_id)});
    for (size_t r = 0; r < assets.size(); ++r) {
      auto it = index.find(assets.get_int(r, 0));
      if (it != index.end())
        append_asset(assets, r, out[it->second]);
    }
    return out;
  }

private:
  static constexpr const char *OFFER_SQL =
      "SELECT id, initiator, counterparty, status, note, created_at, updated_at FROM trade_offers";
  static constexpr const char *ASSET_SQL =
      "SELECT offer_id, side, asset_type, asset_name, quantity FROM trade_offer_assets";

  // 同一资产不能重复出现, 也不能同时出现在两侧
  static void check_assets(const std::vector<model::OfferAsset> &offered,
                           const std::vector<model::OfferAsset> &requested) {
    std::vector<model::AssetRef> seen;
    for (const auto *side : {&offered, &requested}) {
      for (const auto &a : *side) {
        if (a.asset.name.empty()) {
          throw LedgerError(ErrorKind::InvalidArgument, "asset name must not be empty");
        }
        if (a.quantity <= 0) {
          throw LedgerError(ErrorKind::InvalidArgument, "quantity for " + a.asset.name + " must be positive");
        }
        for (const auto &s : seen) {
          if (s == a.asset) {
            throw LedgerError(ErrorKind::InvalidArgument, a.asset.name + " appears more than once in the offer");
          }
        }
        seen.push_back(a.asset);
      }
    }
  }

  void insert_assets(Tx &tx, int64_t offer_id, const char *side, const std::vector<model::OfferAsset> &assets) {
    for (const auto &a : assets) {
      tx.exec("INSERT INTO trade_offer_assets (offer_id, side, asset_type, asset_name, quantity) "
              "VALUES (?, ?, ?, ?, ?)",
              {duckdb::Value::BIGINT(offer_id), duckdb::Value(side), duckdb::Value(model::to_string(a.asset.type)),
               duckdb::Value(a.asset.name), duckdb::Value::BIGINT(a.quantity)});
    }
  }

  // 转出方的历史均价随资产一起转给接收方 (无记录则为 0, 不参与均价)
  void transfer(Tx &tx, int64_t offer_id, int64_t ts, const std::string &from, const std::string &to,
                const model::OfferAsset &a) {
    fixed::Cents price = log_.historical_cost(tx, from, a.asset).value_or(0);

    holdings_.decrease(tx, from, a.asset, a.quantity);
    holdings_.increase(tx, to, a.asset, a.quantity);

    model::Transaction t;
    t.ts = ts;
    t.asset = a.asset;
    t.unit_price = price;
    t.quantity = a.quantity;
    t.cost_basis = price;
    t.offer_id = offer_id;

    t.user_id = from;
    t.kind = model::TxKind::TradeOut;
    log_.record(tx, t);

    t.user_id = to;
    t.kind = model::TxKind::TradeIn;
    log_.record(tx, t);
  }

  template <typename Check>
  model::TradeOffer transition(int64_t offer_id, model::OfferStatus next, Check &&check) {
    model::TradeOffer offer = db_.transact([&](Tx &tx) {
      model::TradeOffer o = load(tx, offer_id);
      require_pending(o);
      check(o);

      int64_t ts = now_ms();
      int64_t changed = tx.exec("UPDATE trade_offers SET status = ?, updated_at = ? WHERE id = ? AND status = 'pending'",
                                {duckdb::Value(model::to_string(next)), duckdb::Value::BIGINT(ts),
                                 duckdb::Value::BIGINT(offer_id)});
      if (changed == 0) {
        throw LedgerError(ErrorKind::StaleOffer, "offer " + std::to_string(offer_id) + " is no longer pending");
      }
      o.status = next;
      o.updated_at = ts;
      return o;
    });

    std::cout << "[Trade] offer #" << offer_id << " " << model::to_string(next) << std::endl;
    return offer;
  }

  static void require_pending(const model::TradeOffer &o) {
    if (o.status != model::OfferStatus::Pending) {
      throw LedgerError(ErrorKind::StaleOffer,
                        "offer " + std::to_string(o.id) + " is " + model::to_string(o.status));
    }
  }

  static model::TradeOffer to_offer(Rows &rows, size_t r) {
    model::TradeOffer o;
    o.id = rows.get_int(r, 0);
    o.initiator = rows.get_string(r, 1);
    if (!rows.is_null(r, 2))
      o.counterparty = rows.get_string(r, 2);
    o.status = model::parse<model::OfferStatus>(rows.get_string(r, 3));
    o.note = rows.get_string(r, 4);
    o.created_at = rows.get_int(r, 5);
    o.updated_at = rows.get_int(r, 6);
    return o;
  }

  static void append_asset(Rows &rows, size_t r, model::TradeOffer &o) {
    model::OfferAsset a;
    a.asset.type = model::parse<model::AssetType>(rows.get_string(r, 2));
    a.asset.name = rows.get_string(r, 3);
    a.quantity = rows.get_int(r, 4);
    if (rows.get_string(r, 1) == "offered")
      o.offered.push_back(std::move(a));
    else
      o.requested.push_back(std::move(a));
  }

  static void attach_assets(Rows rows, model::TradeOffer &o) {
    for (size_t r = 0; r < rows.size(); ++r)
      append_asset(rows, r, o);
  }

  Database &db_;
  ledger::AccountLedger &accounts_;
  ledger::HoldingsRegistry &holdings_;
  ledger::TransactionLog &log_;
};

} // namespace trading
