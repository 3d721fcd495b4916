/**
 * Settlement orchestrator: exactly-once, report, atomicity
 */

#include <string>
#include <vector>

#include "test_support.hpp"

using model::BetStatus;
using model::BetType;
using model::Pick;

namespace {

struct Slate {
    TestExchange t;
    int64_t game = 0;

    // 24-20 场次的六种投注
    Slate() {
        for (const char *u : {"alice", "bob", "carol", "dave", "erin", "frank"})
            t.adult(u, 100000);
        game = t.game(191, 200, -35, 455);
        t.ex.bets().place_bet("alice", {game, BetType::Moneyline, Pick::Home}, 1000);
        t.ex.bets().place_bet("bob", {game, BetType::Moneyline, Pick::Away}, 1000);
        t.ex.bets().place_bet("carol", {game, BetType::Spread, Pick::Home}, 1000);
        t.ex.bets().place_bet("dave", {game, BetType::Spread, Pick::Away}, 1000);
        t.ex.bets().place_bet("erin", {game, BetType::OverUnder, Pick::Over}, 1000);
        t.ex.bets().place_bet("frank", {game, BetType::OverUnder, Pick::Under}, 1000);
    }

    std::vector<fixed::Cents> balances() {
        std::vector<fixed::Cents> out;
        for (const char *u : {"alice", "bob", "carol", "dave", "erin", "frank"})
            out.push_back(t.balance(u));
        return out;
    }
};

} // namespace

TEST(settle_reports_and_pays) {
    Slate s;
    auto report = s.t.ex.settlement().settle_game(s.game, 24, 20);

    ASSERT_EQ(report.bets_won, 3);
    ASSERT_EQ(report.bets_lost, 3);
    ASSERT_EQ(report.bets_pushed, 0);
    ASSERT_EQ(report.total_credited, 3 * 1910);

    ASSERT_EQ(s.t.balance("alice"), 99000 + 1910); // moneyline home
    ASSERT_EQ(s.t.balance("bob"), 99000);
    ASSERT_EQ(s.t.balance("carol"), 99000 + 1910); // 24 - 3.5 = 20.5 > 20
    ASSERT_EQ(s.t.balance("dave"), 99000);
    ASSERT_EQ(s.t.balance("erin"), 99000);         // 44 < 45.5
    ASSERT_EQ(s.t.balance("frank"), 99000 + 1910);

    auto g = s.t.ex.games().get_game(s.game);
    ASSERT_TRUE(g.status == model::GameStatus::Completed);
    ASSERT_EQ(*g.home_score, 24);
    ASSERT_EQ(*g.away_score, 20);
}

TEST(away_side_covers_when_home_falls_short) {
    Slate s;
    s.t.ex.settlement().settle_game(s.game, 20, 24);
    ASSERT_EQ(s.t.balance("carol"), 99000);
    ASSERT_EQ(s.t.balance("dave"), 99000 + 1910);
    ASSERT_EQ(s.t.balance("bob"), 99000 + 2000);
}

TEST(second_settlement_is_rejected_without_effect) {
    Slate s;
    s.t.ex.settlement().settle_game(s.game, 24, 20);
    auto after_first = s.balances();

    ASSERT_THROWS_KIND(s.t.ex.settlement().settle_game(s.game, 0, 50), ErrorKind::AlreadySettled);
    ASSERT_TRUE(s.balances() == after_first);

    auto g = s.t.ex.games().get_game(s.game);
    ASSERT_EQ(*g.home_score, 24);
    ASSERT_TRUE(s.t.ex.bets().user_bets("alice")[0].status == BetStatus::Won);
}

TEST(tie_pushes_moneyline) {
    Slate s;
    auto report = s.t.ex.settlement().settle_game(s.game, 21, 21);
    // moneyline x2 push, spread: 21 - 3.5 < 21 away covers, total 42 < 45.5 under
    ASSERT_EQ(report.bets_pushed, 2);
    ASSERT_EQ(report.bets_won, 2);
    ASSERT_EQ(report.bets_lost, 2);
    ASSERT_EQ(s.t.balance("alice"), 100000);
    ASSERT_EQ(s.t.balance("bob"), 100000);
    ASSERT_EQ(s.t.balance("dave"), 99000 + 1910);
}

TEST(settlement_is_all_or_nothing) {
    Slate s;
    // frank 的账户消失, 派彩失败 -> 整场结算回滚
    s.t.db.transact([&](Database::Tx &tx) { tx.exec("DELETE FROM accounts WHERE user_id = 'frank'"); });

    ASSERT_THROWS_KIND(s.t.ex.settlement().settle_game(s.game, 24, 20), ErrorKind::NotFound);
    ASSERT_EQ(s.t.balance("alice"), 99000);
    ASSERT_TRUE(s.t.ex.games().get_game(s.game).status == model::GameStatus::Scheduled);
    ASSERT_TRUE(s.t.ex.bets().user_bets("alice")[0].status == BetStatus::Pending);

    // 恢复后重试, 只派彩一次
    s.t.ex.open_account("frank", "Frank", 99000);
    auto report = s.t.ex.settlement().settle_game(s.game, 24, 20);
    ASSERT_EQ(report.bets_won, 3);
    ASSERT_EQ(s.t.balance("alice"), 99000 + 1910);
    ASSERT_EQ(s.t.balance("frank"), 99000 + 1910);
}

TEST(settlement_argument_errors) {
    TestExchange t;
    ASSERT_THROWS_KIND(t.ex.settlement().settle_game(404, 1, 0), ErrorKind::NotFound);
    int64_t g = t.game();
    ASSERT_THROWS_KIND(t.ex.settlement().settle_game(g, -1, 0), ErrorKind::InvalidArgument);
    ASSERT_TRUE(t.ex.games().get_game(g).status == model::GameStatus::Scheduled);
}

TEST(upcoming_games_excludes_settled) {
    TestExchange t;
    int64_t g1 = t.game();
    int64_t g2 = t.game();
    ASSERT_EQ(t.ex.games().upcoming_games().size(), 2u);
    t.ex.settlement().settle_game(g1, 3, 2);
    auto upcoming = t.ex.games().upcoming_games();
    ASSERT_EQ(upcoming.size(), 1u);
    ASSERT_EQ(upcoming[0].id, g2);
    ASSERT_THROWS_KIND(t.ex.games().get_game(999), ErrorKind::NotFound);
}

int main() {
    std::cout << "=== Settlement Tests ===\n";

    RUN_TEST(settle_reports_and_pays);
    RUN_TEST(away_side_covers_when_home_falls_short);
    RUN_TEST(second_settlement_is_rejected_without_effect);
    RUN_TEST(tie_pushes_moneyline);
    RUN_TEST(settlement_is_all_or_nothing);
    RUN_TEST(settlement_argument_errors);
    RUN_TEST(upcoming_games_excludes_settled);

    std::cout << "\nAll settlement tests passed\n";
    return 0;
}
