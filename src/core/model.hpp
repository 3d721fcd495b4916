#pragma once

// ============================================================================
// 领域记录: Account / Holding / Transaction / Game / Bet / Parlay / TradeOffer
// 枚举在数据库中以小写字符串存储
// ============================================================================

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "errors.hpp"
#include "fixed_point.hpp"

namespace model {

using fixed::Cents;
using fixed::Odds;
using fixed::Points;
using fixed::Qty;

enum class AssetType { Player, TeamFund };
enum class TxKind { Buy, Sell, TradeIn, TradeOut };
enum class Side { Buy, Sell };
enum class GameStatus { Scheduled, Completed };
enum class BetType { Moneyline, Spread, OverUnder };
enum class Pick { Home, Away, Over, Under };
enum class BetStatus { Pending, Won, Lost, Push, Cancelled };
enum class OfferStatus { Pending, Accepted, Rejected, Cancelled };

// 单注/串关腿的判定结果
enum class Grade { Won, Lost, Push };

// ----------------------------------------------------------------------------
// 枚举 <-> 字符串
// ----------------------------------------------------------------------------

template <typename E> struct EnumNames;

template <> struct EnumNames<AssetType> {
  static constexpr std::pair<AssetType, const char *> values[] = {{AssetType::Player, "player"},
                                                                  {AssetType::TeamFund, "team_fund"}};
};

template <> struct EnumNames<TxKind> {
  static constexpr std::pair<TxKind, const char *> values[] = {
      {TxKind::Buy, "buy"}, {TxKind::Sell, "sell"}, {TxKind::TradeIn, "trade_in"}, {TxKind::TradeOut, "trade_out"}};
};

template <> struct EnumNames<Side> {
  static constexpr std::pair<Side, const char *> values[] = {{Side::Buy, "buy"}, {Side::Sell, "sell"}};
};

template <> struct EnumNames<GameStatus> {
  static constexpr std::pair<GameStatus, const char *> values[] = {{GameStatus::Scheduled, "scheduled"},
                                                                   {GameStatus::Completed, "completed"}};
};

template <> struct EnumNames<BetType> {
  static constexpr std::pair<BetType, const char *> values[] = {
      {BetType::Moneyline, "moneyline"}, {BetType::Spread, "spread"}, {BetType::OverUnder, "over_under"}};
};

template <> struct EnumNames<Pick> {
  static constexpr std::pair<Pick, const char *> values[] = {
      {Pick::Home, "home"}, {Pick::Away, "away"}, {Pick::Over, "over"}, {Pick::Under, "under"}};
};

template <> struct EnumNames<BetStatus> {
  static constexpr std::pair<BetStatus, const char *> values[] = {{BetStatus::Pending, "pending"},
                                                                  {BetStatus::Won, "won"},
                                                                  {BetStatus::Lost, "lost"},
                                                                  {BetStatus::Push, "push"},
                                                                  {BetStatus::Cancelled, "cancelled"}};
};

template <> struct EnumNames<OfferStatus> {
  static constexpr std::pair<OfferStatus, const char *> values[] = {{OfferStatus::Pending, "pending"},
                                                                    {OfferStatus::Accepted, "accepted"},
                                                                    {OfferStatus::Rejected, "rejected"},
                                                                    {OfferStatus::Cancelled, "cancelled"}};
};

template <typename E> const char *to_string(E value) {
  for (const auto &[v, name] : EnumNames<E>::values) {
    if (v == value)
      return name;
  }
  return "unknown";
}

template <typename E> E parse(const std::string &text) {
  for (const auto &[v, name] : EnumNames<E>::values) {
    if (text == name)
      return v;
  }
  throw LedgerError(ErrorKind::InvalidArgument, "unknown value '" + text + "'");
}

inline BetStatus to_bet_status(Grade g) {
  switch (g) {
  case Grade::Won:
    return BetStatus::Won;
  case Grade::Lost:
    return BetStatus::Lost;
  case Grade::Push:
    return BetStatus::Push;
  }
  return BetStatus::Pending;
}

inline bool is_terminal(BetStatus s) { return s != BetStatus::Pending; }

// ----------------------------------------------------------------------------
// 记录
// ----------------------------------------------------------------------------

struct Account {
  std::string user_id;
  std::string username;
  Cents balance = 0;
  std::string birthdate;
  bool verified_adult = false;
  int64_t created_at = 0;
};

struct AssetRef {
  AssetType type = AssetType::Player;
  std::string name;

  bool operator==(const AssetRef &o) const { return type == o.type && name == o.name; }
};

struct Holding {
  std::string user_id;
  AssetRef asset;
  Qty quantity = 0;
};

struct Transaction {
  int64_t id = 0;
  int64_t ts = 0;
  std::string user_id;
  TxKind kind = TxKind::Buy;
  AssetRef asset;
  Cents unit_price = 0;
  Qty quantity = 0;
  Cents cost_basis = 0;
  Cents profit_loss = 0;
  std::optional<int64_t> offer_id;
};

struct Game {
  int64_t id = 0;
  std::string home_team;
  std::string away_team;
  int64_t scheduled_at = 0;
  Odds home_odds = 0;
  Odds away_odds = 0;
  Points spread = 0;     // 主队让分
  Points total_line = 0; // 大小分
  GameStatus status = GameStatus::Scheduled;
  std::optional<int> home_score;
  std::optional<int> away_score;
};

struct Selection {
  int64_t game_id = 0;
  BetType type = BetType::Moneyline;
  Pick pick = Pick::Home;
};

struct Bet {
  int64_t id = 0;
  std::string user_id;
  Selection selection;
  Cents stake = 0;
  Odds odds = 0;
  Cents potential_payout = 0;
  BetStatus status = BetStatus::Pending;
  int64_t placed_at = 0;
};

struct ParlayLeg {
  int64_t id = 0;
  int64_t parlay_id = 0;
  Selection selection;
  Odds odds = 0;
  BetStatus status = BetStatus::Pending;
};

struct Parlay {
  int64_t id = 0;
  std::string user_id;
  Cents stake = 0;
  Cents potential_payout = 0;
  BetStatus status = BetStatus::Pending;
  int64_t created_at = 0;
  std::vector<ParlayLeg> legs;
};

struct OfferAsset {
  AssetRef asset;
  Qty quantity = 0;
};

struct TradeOffer {
  int64_t id = 0;
  std::string initiator;
  std::optional<std::string> counterparty; // 空 = 公开报价
  std::vector<OfferAsset> offered;
  std::vector<OfferAsset> requested;
  OfferStatus status = OfferStatus::Pending;
  std::string note;
  int64_t created_at = 0;
  int64_t updated_at = 0;
};

} // namespace model
