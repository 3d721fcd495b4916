#pragma once

// ============================================================================
// GameOutcome - 终场比分 -> 三类盘口的判定
//   moneyline:  比分高者胜, 平局 push
//   spread:     主队 home + spread 与 away 比较, 相等 push
//   over/under: 总分与 total_line 比较, 相等 push
// 盘口以 1/10 分存储, 比较全部在整数上完成
// ============================================================================

#include "../core/model.hpp"

namespace betting {

using model::Grade;

enum class LineResult { Home, Away, Even };

struct GameOutcome {
  int home_score = 0;
  int away_score = 0;
  fixed::Points spread = 0;
  fixed::Points total_line = 0;

  GameOutcome(int home, int away, fixed::Points spread_line, fixed::Points total)
      : home_score(home), away_score(away), spread(spread_line), total_line(total) {}

  static GameOutcome of(const model::Game &g, int home, int away) {
    return GameOutcome(home, away, g.spread, g.total_line);
  }

  LineResult winner() const {
    if (home_score > away_score)
      return LineResult::Home;
    if (away_score > home_score)
      return LineResult::Away;
    return LineResult::Even;
  }

  LineResult spread_cover() const {
    int64_t home = static_cast<int64_t>(home_score) * fixed::POINTS_SCALE + spread;
    int64_t away = static_cast<int64_t>(away_score) * fixed::POINTS_SCALE;
    if (home > away)
      return LineResult::Home;
    if (home < away)
      return LineResult::Away;
    return LineResult::Even;
  }

  // Home = over, Away = under
  LineResult total() const {
    int64_t sum = (static_cast<int64_t>(home_score) + away_score) * fixed::POINTS_SCALE;
    if (sum > total_line)
      return LineResult::Home;
    if (sum < total_line)
      return LineResult::Away;
    return LineResult::Even;
  }

  Grade grade(const model::Selection &s) const {
    switch (s.type) {
    case model::BetType::Moneyline:
      return grade_side(winner(), s.pick == model::Pick::Home);
    case model::BetType::Spread:
      return grade_side(spread_cover(), s.pick == model::Pick::Home);
    case model::BetType::OverUnder:
      return grade_side(total(), s.pick == model::Pick::Over);
    }
    return Grade::Push;
  }

private:
  static Grade grade_side(LineResult result, bool picked_first) {
    if (result == LineResult::Even)
      return Grade::Push;
    bool first = result == LineResult::Home;
    return first == picked_first ? Grade::Won : Grade::Lost;
  }
};

// pick 与 bet_type 是否匹配
inline bool valid_selection(const model::Selection &s) {
  switch (s.type) {
  case model::BetType::Moneyline:
  case model::BetType::Spread:
    return s.pick == model::Pick::Home || s.pick == model::Pick::Away;
  case model::BetType::OverUnder:
    return s.pick == model::Pick::Over || s.pick == model::Pick::Under;
  }
  return false;
}

// 下注时锁定的赔率: moneyline 取比赛赔率, 其余取标准赔率
inline fixed::Odds quoted_odds(const model::Game &g, const model::Selection &s, fixed::Odds standard_odds) {
  if (s.type == model::BetType::Moneyline)
    return s.pick == model::Pick::Home ? g.home_odds : g.away_odds;
  return standard_odds;
}

} // namespace betting
