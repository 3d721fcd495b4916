#pragma once

// ============================================================================
// 定点数
// - Cents:  金额, 1 = 0.01
// - Odds:   小数赔率 * 100 (1.91 -> 191)
// - Points: 盘口 * 10 (-3.5 -> -35)
// - Qty:    份额 * 1000, 支持碎股
// ============================================================================

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

#include "errors.hpp"

namespace fixed {

using Cents = int64_t;
using Odds = int64_t;
using Points = int64_t;
using Qty = int64_t;

static constexpr int64_t CENTS_PER_UNIT = 100;
static constexpr int64_t ODDS_SCALE = 100;
static constexpr int64_t POINTS_SCALE = 10;
static constexpr int64_t QTY_SCALE = 1000;

// 赔率上限 1000.00
static constexpr Odds MAX_ODDS = 1000 * ODDS_SCALE;

// 串关连乘的中间精度 (1e-6 cent)
static constexpr int64_t PAYOUT_PRECISION = 1000000;

// 四舍五入 (远离零)
inline int64_t div_round(__int128 num, __int128 den) {
  if (den < 0) {
    num = -num;
    den = -den;
  }
  __int128 half = den / 2;
  __int128 q = num >= 0 ? (num + half) / den : (num - half) / den;
  if (q > std::numeric_limits<int64_t>::max() || q < std::numeric_limits<int64_t>::min()) {
    throw LedgerError(ErrorKind::InvalidArgument, "fixed-point overflow");
  }
  return static_cast<int64_t>(q);
}

// 向下取整, den > 0
inline int64_t div_floor(__int128 num, __int128 den) {
  __int128 q = num / den;
  if (num % den != 0 && num < 0)
    --q;
  if (q > std::numeric_limits<int64_t>::max() || q < std::numeric_limits<int64_t>::min()) {
    throw LedgerError(ErrorKind::InvalidArgument, "fixed-point overflow");
  }
  return static_cast<int64_t>(q);
}

// 向上取整, den > 0
inline int64_t div_ceil(__int128 num, __int128 den) { return -div_floor(-num, den); }

// 单价 * 数量 -> 金额 (四舍五入, 用于盈亏与统计)
inline Cents notional(Cents unit_price, Qty qty) {
  return div_round(static_cast<__int128>(unit_price) * qty, QTY_SCALE);
}

// 实际划转的现金: 买入扣款向上取整, 卖出入账向下取整, 不足一分的零头归账本
inline Cents purchase_cost(Cents unit_price, Qty qty) {
  return div_ceil(static_cast<__int128>(unit_price) * qty, QTY_SCALE);
}

inline Cents sale_proceeds(Cents unit_price, Qty qty) {
  return div_floor(static_cast<__int128>(unit_price) * qty, QTY_SCALE);
}

// stake * Π(odds), 腿之间保留 1e-6 cent 精度, 最后一次性舍入
inline Cents payout(Cents stake, const std::vector<Odds> &legs) {
  __int128 acc = static_cast<__int128>(stake) * PAYOUT_PRECISION;
  for (Odds o : legs) {
    if (o <= 0 || o > MAX_ODDS) {
      throw LedgerError(ErrorKind::InvalidSelection, "odds out of range: " + std::to_string(o));
    }
    __int128 next = acc * o;
    acc = next / ODDS_SCALE + ((next % ODDS_SCALE) * 2 >= ODDS_SCALE ? 1 : 0);
    if (acc > static_cast<__int128>(std::numeric_limits<int64_t>::max()) * PAYOUT_PRECISION) {
      throw LedgerError(ErrorKind::InvalidStake, "potential payout overflows");
    }
  }
  return div_round(acc, PAYOUT_PRECISION);
}

inline Cents payout(Cents stake, Odds odds) {
  return payout(stake, std::vector<Odds>{odds});
}

// 组合赔率 (仅用于展示)
inline double combined_odds(const std::vector<Odds> &legs) {
  double d = 1.0;
  for (Odds o : legs)
    d *= static_cast<double>(o) / ODDS_SCALE;
  return d;
}

// ----------------------------------------------------------------------------
// 十进制 <-> 定点
// ----------------------------------------------------------------------------

inline int64_t from_decimal(double value, int64_t scale) {
  if (!std::isfinite(value)) {
    throw LedgerError(ErrorKind::InvalidArgument, "non-finite decimal value");
  }
  double scaled = value * static_cast<double>(scale);
  if (std::fabs(scaled) >= 9.0e18) {
    throw LedgerError(ErrorKind::InvalidArgument, "decimal value out of range");
  }
  return static_cast<int64_t>(std::llround(scaled));
}

// 精确解析 "12.34" / "-3.5" / "7", 小数位超出 scale 时四舍五入
inline int64_t parse_decimal(const std::string &text, int64_t scale) {
  if (text.empty())
    throw LedgerError(ErrorKind::InvalidArgument, "empty decimal");

  size_t i = 0;
  bool negative = false;
  if (text[i] == '-' || text[i] == '+') {
    negative = text[i] == '-';
    ++i;
  }

  __int128 whole = 0;
  __int128 frac = 0;
  __int128 frac_den = 1;
  bool seen_digit = false;
  bool seen_dot = false;
  for (; i < text.size(); ++i) {
    char c = text[i];
    if (c == '.' && !seen_dot) {
      seen_dot = true;
      continue;
    }
    if (c < '0' || c > '9')
      throw LedgerError(ErrorKind::InvalidArgument, "malformed decimal: " + text);
    seen_digit = true;
    if (!seen_dot) {
      whole = whole * 10 + (c - '0');
    } else if (frac_den < 1000000000000LL) {
      frac = frac * 10 + (c - '0');
      frac_den *= 10;
    }
    if (whole > std::numeric_limits<int64_t>::max())
      throw LedgerError(ErrorKind::InvalidArgument, "decimal out of range: " + text);
  }
  if (!seen_digit)
    throw LedgerError(ErrorKind::InvalidArgument, "malformed decimal: " + text);

  __int128 scaled = whole * scale + div_round(frac * scale, frac_den);
  if (scaled > std::numeric_limits<int64_t>::max())
    throw LedgerError(ErrorKind::InvalidArgument, "decimal out of range: " + text);
  return negative ? -static_cast<int64_t>(scaled) : static_cast<int64_t>(scaled);
}

inline std::string to_decimal(int64_t value, int64_t scale) {
  int digits = 0;
  for (int64_t s = scale; s > 1; s /= 10)
    ++digits;

  bool negative = value < 0;
  uint64_t mag = negative ? 0 - static_cast<uint64_t>(value) : static_cast<uint64_t>(value);
  std::string whole = std::to_string(mag / static_cast<uint64_t>(scale));
  if (digits == 0)
    return (negative ? "-" : "") + whole;

  std::string frac = std::to_string(mag % static_cast<uint64_t>(scale));
  frac.insert(0, static_cast<size_t>(digits) - frac.size(), '0');
  return (negative ? "-" : "") + whole + "." + frac;
}

inline Cents cents(double units) { return from_decimal(units, CENTS_PER_UNIT); }
inline Odds odds(double decimal_odds) { return from_decimal(decimal_odds, ODDS_SCALE); }
inline Points points(double line) { return from_decimal(line, POINTS_SCALE); }
inline Qty shares(double count) { return from_decimal(count, QTY_SCALE); }

inline std::string format_cents(Cents c) { return to_decimal(c, CENTS_PER_UNIT); }
inline std::string format_qty(Qty q) { return to_decimal(q, QTY_SCALE); }

} // namespace fixed
