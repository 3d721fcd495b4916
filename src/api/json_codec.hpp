#pragma once

// ============================================================================
// JSON 编解码
// 金额/赔率/盘口/份额对外一律用十进制字符串 ("19.10", "-3.5"),
// 入参同时接受数字和字符串
// ============================================================================

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "../betting/settlement.hpp"
#include "../core/fixed_point.hpp"
#include "../core/model.hpp"
#include "../exchange.hpp"
#include "../ledger/trade_executor.hpp"
#include "../ledger/transaction_log.hpp"

using json = nlohmann::json;

namespace codec {

// ----------------------------------------------------------------------------
// 入参
// ----------------------------------------------------------------------------

inline const json &field(const json &body, const char *key) {
  if (!body.is_object() || !body.contains(key) || body[key].is_null()) {
    throw LedgerError(ErrorKind::InvalidArgument, std::string("missing field '") + key + "'");
  }
  return body[key];
}

inline std::string get_string(const json &body, const char *key) {
  const json &v = field(body, key);
  if (!v.is_string()) {
    throw LedgerError(ErrorKind::InvalidArgument, std::string("field '") + key + "' must be a string");
  }
  return v.get<std::string>();
}

inline std::optional<std::string> opt_string(const json &body, const char *key) {
  if (!body.contains(key) || body[key].is_null())
    return std::nullopt;
  return get_string(body, key);
}

inline int64_t get_int(const json &body, const char *key) {
  const json &v = field(body, key);
  if (!v.is_number_integer()) {
    throw LedgerError(ErrorKind::InvalidArgument, std::string("field '") + key + "' must be an integer");
  }
  if (v.is_number_unsigned() && v.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
    throw LedgerError(ErrorKind::InvalidArgument, std::string("field '") + key + "' is out of range");
  }
  return v.get<int64_t>();
}

inline int get_int32(const json &body, const char *key) {
  int64_t v = get_int(body, key);
  if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
    throw LedgerError(ErrorKind::InvalidArgument, std::string("field '") + key + "' is out of range");
  }
  return static_cast<int>(v);
}

// 十进制数 -> 定点
inline int64_t get_fixed(const json &body, const char *key, int64_t scale) {
  const json &v = field(body, key);
  if (v.is_string())
    return fixed::parse_decimal(v.get<std::string>(), scale);
  if (v.is_number_integer()) {
    int64_t scaled = 0;
    if (__builtin_mul_overflow(get_int(body, key), scale, &scaled)) {
      throw LedgerError(ErrorKind::InvalidArgument, std::string("field '") + key + "' is out of range");
    }
    return scaled;
  }
  if (v.is_number_float())
    return fixed::from_decimal(v.get<double>(), scale);
  throw LedgerError(ErrorKind::InvalidArgument, std::string("field '") + key + "' must be a number");
}

inline std::optional<int64_t> opt_fixed(const json &body, const char *key, int64_t scale) {
  if (!body.contains(key) || body[key].is_null())
    return std::nullopt;
  return get_fixed(body, key, scale);
}

template <typename E> E get_enum(const json &body, const char *key) {
  return model::parse<E>(get_string(body, key));
}

inline model::AssetRef asset_ref(const json &body) {
  model::AssetRef a;
  a.type = get_enum<model::AssetType>(body, "asset_type");
  a.name = get_string(body, "asset_name");
  return a;
}

inline model::Selection selection(const json &body) {
  model::Selection s;
  s.game_id = get_int(body, "game_id");
  s.type = get_enum<model::BetType>(body, "bet_type");
  s.pick = get_enum<model::Pick>(body, "pick");
  return s;
}

inline std::vector<model::OfferAsset> offer_assets(const json &body, const char *key) {
  const json &list = field(body, key);
  if (!list.is_array()) {
    throw LedgerError(ErrorKind::InvalidArgument, std::string("field '") + key + "' must be an array");
  }
  std::vector<model::OfferAsset> out;
  for (const auto &item : list) {
    model::OfferAsset a;
    a.asset = asset_ref(item);
    a.quantity = get_fixed(item, "quantity", fixed::QTY_SCALE);
    out.push_back(std::move(a));
  }
  return out;
}

inline model::Game game(const json &body) {
  model::Game g;
  g.home_team = get_string(body, "home_team");
  g.away_team = get_string(body, "away_team");
  g.scheduled_at = get_int(body, "scheduled_at");
  g.home_odds = get_fixed(body, "home_odds", fixed::ODDS_SCALE);
  g.away_odds = get_fixed(body, "away_odds", fixed::ODDS_SCALE);
  g.spread = get_fixed(body, "spread", fixed::POINTS_SCALE);
  g.total_line = get_fixed(body, "total_line", fixed::POINTS_SCALE);
  return g;
}

// ----------------------------------------------------------------------------
// 出参
// ----------------------------------------------------------------------------

inline std::string money(fixed::Cents c) { return fixed::format_cents(c); }
inline std::string odds(fixed::Odds o) { return fixed::to_decimal(o, fixed::ODDS_SCALE); }
inline std::string line(fixed::Points p) { return fixed::to_decimal(p, fixed::POINTS_SCALE); }
inline std::string qty(fixed::Qty q) { return fixed::format_qty(q); }

inline json to_json(const model::Account &a) {
  return {{"user_id", a.user_id},           {"username", a.username},
          {"balance", money(a.balance)},    {"verified_adult", a.verified_adult},
          {"created_at", a.created_at}};
}

inline json to_json(const model::Holding &h) {
  return {{"asset_type", model::to_string(h.asset.type)},
          {"asset_name", h.asset.name},
          {"quantity", qty(h.quantity)}};
}

inline json to_json(const model::Transaction &t) {
  json j = {{"id", t.id},
            {"ts", t.ts},
            {"kind", model::to_string(t.kind)},
            {"asset_type", model::to_string(t.asset.type)},
            {"asset_name", t.asset.name},
            {"unit_price", money(t.unit_price)},
            {"quantity", qty(t.quantity)},
            {"cost_basis", money(t.cost_basis)},
            {"profit_loss", money(t.profit_loss)}};
  if (t.offer_id)
    j["offer_id"] = *t.offer_id;
  return j;
}

inline json to_json(const ledger::TradeReceipt &r) {
  return {{"transaction_id", r.transaction_id},
          {"side", model::to_string(r.side)},
          {"asset_type", model::to_string(r.asset.type)},
          {"asset_name", r.asset.name},
          {"unit_price", money(r.unit_price)},
          {"quantity", qty(r.quantity)},
          {"cash_delta", money(r.cash_delta)},
          {"cost_basis", money(r.cost_basis)},
          {"profit_loss", money(r.profit_loss)},
          {"balance", money(r.balance_after)},
          {"holding", qty(r.holding_after)}};
}

inline json to_json(const ledger::PerformanceSummary &s) {
  json by_type = json::object();
  for (const auto &[type, pnl] : s.pnl_by_asset_type)
    by_type[type] = money(pnl);
  json counts = json::object();
  for (const auto &[type, n] : s.count_by_asset_type)
    counts[type] = n;
  return {{"total_invested", money(s.total_invested)},
          {"total_sold", money(s.total_sold)},
          {"realized_pnl", money(s.realized_pnl)},
          {"weekly_pnl", money(s.weekly_pnl)},
          {"monthly_pnl", money(s.monthly_pnl)},
          {"buy_count", s.buy_count},
          {"sell_count", s.sell_count},
          {"trade_in_count", s.trade_in_count},
          {"trade_out_count", s.trade_out_count},
          {"weekly_count", s.weekly_count},
          {"monthly_count", s.monthly_count},
          {"last_transaction_at", s.last_transaction_at},
          {"pnl_by_asset_type", by_type},
          {"count_by_asset_type", counts}};
}

inline json to_json(const model::Game &g) {
  json j = {{"id", g.id},
            {"home_team", g.home_team},
            {"away_team", g.away_team},
            {"scheduled_at", g.scheduled_at},
            {"home_odds", odds(g.home_odds)},
            {"away_odds", odds(g.away_odds)},
            {"spread", line(g.spread)},
            {"total_line", line(g.total_line)},
            {"status", model::to_string(g.status)}};
  if (g.home_score && g.away_score) {
    j["home_score"] = *g.home_score;
    j["away_score"] = *g.away_score;
  }
  return j;
}

inline json to_json(const model::Selection &s) {
  return {{"game_id", s.game_id}, {"bet_type", model::to_string(s.type)}, {"pick", model::to_string(s.pick)}};
}

inline json to_json(const model::Bet &b) {
  json j = to_json(b.selection);
  j["id"] = b.id;
  j["user_id"] = b.user_id;
  j["stake"] = money(b.stake);
  j["odds"] = odds(b.odds);
  j["potential_payout"] = money(b.potential_payout);
  j["status"] = model::to_string(b.status);
  j["placed_at"] = b.placed_at;
  return j;
}

inline json to_json(const model::Parlay &p) {
  json legs = json::array();
  std::vector<fixed::Odds> all_odds;
  for (const auto &leg : p.legs) {
    json l = to_json(leg.selection);
    l["id"] = leg.id;
    l["odds"] = odds(leg.odds);
    l["status"] = model::to_string(leg.status);
    legs.push_back(l);
    all_odds.push_back(leg.odds);
  }
  return {{"id", p.id},
          {"user_id", p.user_id},
          {"stake", money(p.stake)},
          {"combined_odds", fixed::combined_odds(all_odds)},
          {"potential_payout", money(p.potential_payout)},
          {"status", model::to_string(p.status)},
          {"created_at", p.created_at},
          {"legs", legs}};
}

inline json to_json(const model::OfferAsset &a) {
  return {{"asset_type", model::to_string(a.asset.type)}, {"asset_name", a.asset.name}, {"quantity", qty(a.quantity)}};
}

inline json to_json(const model::TradeOffer &o) {
  json offered = json::array();
  json requested = json::array();
  for (const auto &a : o.offered)
    offered.push_back(to_json(a));
  for (const auto &a : o.requested)
    requested.push_back(to_json(a));
  return {{"id", o.id},
          {"initiator", o.initiator},
          {"counterparty", o.counterparty ? json(*o.counterparty) : json(nullptr)},
          {"status", model::to_string(o.status)},
          {"note", o.note},
          {"offered", offered},
          {"requested", requested},
          {"created_at", o.created_at},
          {"updated_at", o.updated_at}};
}

inline json to_json(const betting::SettlementReport &r) {
  return {{"game_id", r.game_id},
          {"home_score", r.home_score},
          {"away_score", r.away_score},
          {"bets", {{"won", r.bets_won}, {"lost", r.bets_lost}, {"push", r.bets_pushed}}},
          {"legs_resolved", r.legs_resolved},
          {"parlays", {{"won", r.parlays_won}, {"lost", r.parlays_lost}, {"push", r.parlays_pushed}}},
          {"total_credited", money(r.total_credited)}};
}

template <typename T> json to_json_array(const std::vector<T> &items) {
  json arr = json::array();
  for (const auto &item : items)
    arr.push_back(to_json(item));
  return arr;
}

inline json to_json(const UserBets &u) {
  return {{"bets", to_json_array(u.bets)}, {"parlays", to_json_array(u.parlays)}};
}

} // namespace codec
