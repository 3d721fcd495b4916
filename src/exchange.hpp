#pragma once

// ============================================================================
// Exchange - 账本与结算引擎的组装
// 所有组件共享同一个 Database; 组件之间只通过引用互相调用
// ============================================================================

#include <optional>
#include <string>
#include <vector>

#include "betting/bet_engine.hpp"
#include "betting/game_registry.hpp"
#include "betting/parlay_engine.hpp"
#include "betting/settlement.hpp"
#include "core/config.hpp"
#include "core/database.hpp"
#include "ledger/account_ledger.hpp"
#include "ledger/holdings_registry.hpp"
#include "ledger/trade_executor.hpp"
#include "ledger/transaction_log.hpp"
#include "trading/offer_engine.hpp"

struct UserBets {
  std::vector<model::Bet> bets;
  std::vector<model::Parlay> parlays;
};

class Exchange {
public:
  Exchange(Database &db, const Config &config)
      : db_(db), config_(config), accounts_(db), holdings_(db), log_(db),
        trades_(db, accounts_, holdings_, log_), games_(db), bets_(db, config_, accounts_, games_),
        parlays_(db, config_, accounts_, games_), settlement_(db, games_, bets_, parlays_),
        offers_(db, accounts_, holdings_, log_) {}

  Exchange(const Exchange &) = delete;
  Exchange &operator=(const Exchange &) = delete;

  const Config &config() const { return config_; }
  Database &db() { return db_; }

  ledger::AccountLedger &accounts() { return accounts_; }
  ledger::HoldingsRegistry &holdings() { return holdings_; }
  ledger::TransactionLog &log() { return log_; }
  ledger::TradeExecutor &trades() { return trades_; }
  betting::GameRegistry &games() { return games_; }
  betting::BetEngine &bets() { return bets_; }
  betting::ParlayEngine &parlays() { return parlays_; }
  betting::SettlementOrchestrator &settlement() { return settlement_; }
  trading::OfferEngine &offers() { return offers_; }

  // 未指定初始资金时使用配置默认值
  model::Account open_account(const std::string &user_id, const std::string &username,
                              std::optional<fixed::Cents> initial_balance = std::nullopt) {
    return accounts_.open_account(user_id, username, initial_balance.value_or(config_.initial_balance));
  }

  bool verify_age(const std::string &user_id, const std::string &birthdate) {
    return accounts_.verify_age(user_id, birthdate, config_.minimum_age);
  }

  UserBets user_bets(const std::string &user_id) {
    return {bets_.user_bets(user_id), parlays_.user_parlays(user_id)};
  }

private:
  Database &db_;
  const Config &config_;

  ledger::AccountLedger accounts_;
  ledger::HoldingsRegistry holdings_;
  ledger::TransactionLog log_;
  ledger::TradeExecutor trades_;
  betting::GameRegistry games_;
  betting::BetEngine bets_;
  betting::ParlayEngine parlays_;
  betting::SettlementOrchestrator settlement_;
  trading::OfferEngine offers_;
};
