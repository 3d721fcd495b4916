/**
 * Account ledger, holdings registry, transaction log and buy/sell execution
 */

#include <vector>

#include "test_support.hpp"

using model::Side;

// === Accounts ===

TEST(open_account_and_deposit) {
    TestExchange t;
    auto a = t.ex.open_account("alice", "Alice", 100000);
    ASSERT_EQ(a.balance, 100000);
    ASSERT_EQ(a.username, std::string("Alice"));
    ASSERT_FALSE(a.verified_adult);

    ASSERT_EQ(t.ex.accounts().deposit("alice", 2550), 102550);
    ASSERT_EQ(t.balance("alice"), 102550);
}

TEST(open_account_uses_configured_initial_balance) {
    TestExchange t;
    auto a = t.ex.open_account("bob", "");
    ASSERT_EQ(a.balance, t.config.initial_balance);
    ASSERT_EQ(a.username, std::string("bob"));
}

TEST(duplicate_and_unknown_accounts) {
    TestExchange t;
    t.ex.open_account("alice", "Alice", 0);
    ASSERT_THROWS_KIND(t.ex.open_account("alice", "Again", 0), ErrorKind::InvalidArgument);
    ASSERT_THROWS_KIND(t.ex.accounts().account("nobody"), ErrorKind::NotFound);
    ASSERT_THROWS_KIND(t.ex.accounts().deposit("nobody", 100), ErrorKind::NotFound);
    ASSERT_THROWS_KIND(t.ex.accounts().deposit("alice", 0), ErrorKind::InvalidArgument);
}

TEST(debit_never_overdraws) {
    TestExchange t;
    t.ex.open_account("alice", "Alice", 1000);

    ASSERT_THROWS_KIND(t.db.transact([&](Database::Tx &tx) { t.ex.accounts().debit(tx, "alice", 1001); }),
                       ErrorKind::InsufficientFunds);
    ASSERT_EQ(t.balance("alice"), 1000);

    t.db.transact([&](Database::Tx &tx) {
        t.ex.accounts().debit(tx, "alice", 0);
        t.ex.accounts().debit(tx, "alice", 1000);
    });
    ASSERT_EQ(t.balance("alice"), 0);
}

TEST(failed_unit_of_work_rolls_back) {
    TestExchange t;
    t.ex.open_account("alice", "Alice", 1000);

    // credit 成功后 debit 失败: 整个事务回滚
    ASSERT_THROWS_KIND(t.db.transact([&](Database::Tx &tx) {
                           t.ex.accounts().credit(tx, "alice", 500);
                           t.ex.accounts().debit(tx, "alice", 5000);
                       }),
                       ErrorKind::InsufficientFunds);
    ASSERT_EQ(t.balance("alice"), 1000);
}

TEST(age_verification) {
    TestExchange t;
    t.ex.open_account("kid", "Kid", 0);
    t.ex.open_account("adult", "Adult", 0);

    ASSERT_FALSE(t.ex.verify_age("kid", "2015-06-01"));
    ASSERT_FALSE(t.ex.accounts().account("kid").verified_adult);
    ASSERT_TRUE(t.ex.verify_age("adult", "1980-02-29"));
    ASSERT_TRUE(t.ex.accounts().account("adult").verified_adult);

    ASSERT_THROWS_KIND(t.ex.verify_age("adult", "1980-13-01"), ErrorKind::InvalidArgument);
    ASSERT_THROWS_KIND(t.ex.verify_age("adult", "yesterday"), ErrorKind::InvalidArgument);

    using Ledger = ledger::AccountLedger;
    ASSERT_EQ(Ledger::age_on("2000-06-15", {2021, 6, 14}), 20);
    ASSERT_EQ(Ledger::age_on("2000-06-15", {2021, 6, 15}), 21);
}

// === Holdings ===

TEST(holdings_increase_decrease_prune) {
    TestExchange t;
    t.ex.open_account("alice", "Alice", 0);
    auto mahomes = player("Patrick Mahomes");

    t.db.transact([&](Database::Tx &tx) {
        t.ex.holdings().increase(tx, "alice", mahomes, 1500);
        t.ex.holdings().increase(tx, "alice", mahomes, 500);
    });
    ASSERT_EQ(t.held("alice", mahomes), 2000);

    ASSERT_THROWS_KIND(t.db.transact([&](Database::Tx &tx) { t.ex.holdings().decrease(tx, "alice", mahomes, 2001); }),
                       ErrorKind::InsufficientHoldings);
    ASSERT_EQ(t.held("alice", mahomes), 2000);

    t.db.transact([&](Database::Tx &tx) { t.ex.holdings().decrease(tx, "alice", mahomes, 2000); });
    ASSERT_EQ(t.held("alice", mahomes), 0);
    ASSERT_TRUE(t.ex.holdings().holdings("alice").empty());
    ASSERT_EQ(t.db.get_table_count("holdings"), 0);
}

TEST(asset_types_are_distinct) {
    TestExchange t;
    t.ex.open_account("alice", "Alice", 0);
    t.db.transact([&](Database::Tx &tx) { t.ex.holdings().increase(tx, "alice", player("Chiefs"), 1000); });
    ASSERT_EQ(t.held("alice", team_fund("Chiefs")), 0);
    ASSERT_EQ(t.held("alice", player("Chiefs")), 1000);
}

// === Buy / Sell ===

TEST(buy_debits_and_records) {
    TestExchange t;
    t.ex.open_account("alice", "Alice", 100000);
    auto r = t.ex.trades().execute_trade("alice", player("Josh Allen"), Side::Buy, 2500, fixed::shares(2));

    ASSERT_EQ(r.cash_delta, -5000);
    ASSERT_EQ(r.balance_after, 95000);
    ASSERT_EQ(r.holding_after, 2000);
    ASSERT_EQ(t.balance("alice"), 95000);

    auto history = t.ex.log().history("alice");
    ASSERT_EQ(history.size(), 1u);
    ASSERT_TRUE(history[0].kind == model::TxKind::Buy);
    ASSERT_EQ(history[0].unit_price, 2500);
    ASSERT_EQ(history[0].quantity, 2000);
}

TEST(buy_without_funds_has_no_effect) {
    TestExchange t;
    t.ex.open_account("alice", "Alice", 1000);
    ASSERT_THROWS_KIND(t.ex.trades().execute_trade("alice", player("Josh Allen"), Side::Buy, 2500, fixed::shares(1)),
                       ErrorKind::InsufficientFunds);
    ASSERT_EQ(t.balance("alice"), 1000);
    ASSERT_EQ(t.held("alice", player("Josh Allen")), 0);
    ASSERT_TRUE(t.ex.log().history("alice").empty());
}

TEST(oversell_has_no_effect) {
    TestExchange t;
    t.ex.open_account("alice", "Alice", 100000);
    auto allen = player("Josh Allen");
    t.ex.trades().execute_trade("alice", allen, Side::Buy, 2500, fixed::shares(1));

    ASSERT_THROWS_KIND(t.ex.trades().execute_trade("alice", allen, Side::Sell, 3000, fixed::shares(2)),
                       ErrorKind::InsufficientHoldings);
    ASSERT_THROWS_KIND(t.ex.trades().execute_trade("alice", player("Nobody"), Side::Sell, 3000, fixed::shares(1)),
                       ErrorKind::InsufficientHoldings);

    ASSERT_EQ(t.balance("alice"), 97500);
    ASSERT_EQ(t.held("alice", allen), 1000);
    ASSERT_EQ(t.ex.log().history("alice").size(), 1u);
}

TEST(trade_argument_validation) {
    TestExchange t;
    t.ex.open_account("alice", "Alice", 100000);
    ASSERT_THROWS_KIND(t.ex.trades().execute_trade("alice", player("X"), Side::Buy, 0, 1000), ErrorKind::InvalidArgument);
    ASSERT_THROWS_KIND(t.ex.trades().execute_trade("alice", player("X"), Side::Buy, 100, 0), ErrorKind::InvalidArgument);
    ASSERT_THROWS_KIND(t.ex.trades().execute_trade("alice", player(""), Side::Buy, 100, 1000), ErrorKind::InvalidArgument);
    ASSERT_THROWS_KIND(t.ex.trades().execute_trade("ghost", player("X"), Side::Buy, 100, 1000), ErrorKind::NotFound);
    ASSERT_THROWS_KIND(t.ex.trades().execute_trade("ghost", player("X"), Side::Sell, 100, 1000), ErrorKind::NotFound);
}

TEST(replay_matches_signed_deltas) {
    TestExchange t;
    const fixed::Cents start = 100000;
    t.ex.open_account("alice", "Alice", start);

    struct Op {
        model::AssetRef asset;
        Side side;
        fixed::Cents price;
        fixed::Qty qty;
    };
    auto a = player("A");
    auto b = team_fund("B");
    std::vector<Op> ops = {
        {a, Side::Buy, 2500, 2000},   {b, Side::Buy, 1000, 500},    {a, Side::Sell, 3000, 1000},
        {a, Side::Sell, 3000, 5000},  {a, Side::Buy, 100000, 2000}, {b, Side::Sell, 1200, 500},
        {b, Side::Sell, 1200, 1},     {a, Side::Buy, 333, 333},
    };

    fixed::Cents cash = start;
    fixed::Qty qty_a = 0;
    fixed::Qty qty_b = 0;
    int accepted = 0;
    for (const auto &op : ops) {
        try {
            auto r = t.ex.trades().execute_trade("alice", op.asset, op.side, op.price, op.qty);
            cash += r.cash_delta;
            fixed::Qty signed_qty = op.side == Side::Buy ? op.qty : -op.qty;
            (op.asset == a ? qty_a : qty_b) += signed_qty;
            ++accepted;
        } catch (const LedgerError &e) {
            ASSERT_TRUE(e.kind() == ErrorKind::InsufficientFunds || e.kind() == ErrorKind::InsufficientHoldings);
        }
        ASSERT_TRUE(t.balance("alice") >= 0);
        ASSERT_EQ(t.balance("alice"), cash);
        ASSERT_EQ(t.held("alice", a), qty_a);
        ASSERT_EQ(t.held("alice", b), qty_b);
    }

    ASSERT_EQ(accepted, 5);
    // 100000 - 5000 - 500 + 3000 + 600 - 111 (3.33 x 0.333 = 1.10889)
    ASSERT_EQ(cash, 97989);
    ASSERT_EQ(static_cast<int>(t.ex.log().history("alice").size()), accepted);
}

TEST(sub_cent_trades_never_create_cash) {
    TestExchange t;
    const fixed::Cents start = 10000;
    t.ex.open_account("alice", "Alice", start);
    auto dust = player("Dust");

    // 0.001 份 @ 4.99 = 0.499 cent, 每笔至少扣 0.01
    for (int i = 0; i < 100; ++i) {
        auto r = t.ex.trades().execute_trade("alice", dust, Side::Buy, 499, 1);
        ASSERT_EQ(r.cash_delta, -1);
    }
    ASSERT_EQ(t.balance("alice"), start - 100);
    ASSERT_EQ(t.held("alice", dust), 100);

    auto tiny = t.ex.trades().execute_trade("alice", dust, Side::Sell, 499, 1);
    ASSERT_EQ(tiny.cash_delta, 0);
    // 0.099 x 4.99 = 49.401 cent
    auto rest = t.ex.trades().execute_trade("alice", dust, Side::Sell, 499, 99);
    ASSERT_EQ(rest.cash_delta, 49);

    ASSERT_EQ(t.held("alice", dust), 0);
    ASSERT_EQ(t.balance("alice"), start - 100 + 49);
    ASSERT_TRUE(t.balance("alice") < start);
}

// === Cost basis ===

TEST(average_cost_profit_loss) {
    TestExchange t;
    t.ex.open_account("alice", "Alice", 100000);
    auto kelce = player("Travis Kelce");
    t.ex.trades().execute_trade("alice", kelce, Side::Buy, 1000, fixed::shares(1));
    t.ex.trades().execute_trade("alice", kelce, Side::Buy, 2000, fixed::shares(1));

    auto r = t.ex.trades().execute_trade("alice", kelce, Side::Sell, 3000, fixed::shares(1));
    ASSERT_EQ(r.cost_basis, 1500);
    ASSERT_EQ(r.profit_loss, 1500);

    auto history = t.ex.log().history("alice");
    ASSERT_TRUE(history[0].kind == model::TxKind::Sell);
    ASSERT_EQ(history[0].profit_loss, 1500);
    ASSERT_EQ(history[0].cost_basis, 1500);
}

TEST(average_cost_is_quantity_weighted) {
    TestExchange t;
    t.ex.open_account("alice", "Alice", 1000000);
    auto k = player("K");
    t.ex.trades().execute_trade("alice", k, Side::Buy, 1000, fixed::shares(3));
    t.ex.trades().execute_trade("alice", k, Side::Buy, 2000, fixed::shares(1));

    // (10 x 3 + 20 x 1) / 4 = 12.50
    auto r = t.ex.trades().execute_trade("alice", k, Side::Sell, 1000, fixed::shares(2));
    ASSERT_EQ(r.cost_basis, 1250);
    ASSERT_EQ(r.profit_loss, -500);
}

TEST(performance_summary) {
    TestExchange t;
    t.ex.open_account("alice", "Alice", 100000);
    auto k = player("K");
    auto f = team_fund("F");
    t.ex.trades().execute_trade("alice", k, Side::Buy, 1000, fixed::shares(2));
    t.ex.trades().execute_trade("alice", f, Side::Buy, 500, fixed::shares(4));
    t.ex.trades().execute_trade("alice", k, Side::Sell, 1500, fixed::shares(2));
    t.ex.trades().execute_trade("alice", f, Side::Sell, 400, fixed::shares(1));

    // 补两条历史卖出: 10 天前 / 40 天前
    int64_t now = now_ms();
    auto backdated = [&](const model::AssetRef &asset, int days_ago, fixed::Cents pnl) {
        model::Transaction tx;
        tx.ts = now - days_ago * ledger::MS_PER_DAY;
        tx.user_id = "alice";
        tx.kind = model::TxKind::Sell;
        tx.asset = asset;
        tx.unit_price = 1000;
        tx.quantity = fixed::shares(1);
        tx.cost_basis = 1000 - pnl;
        tx.profit_loss = pnl;
        t.db.transact([&](Database::Tx &w) { return t.ex.log().record(w, tx); });
    };
    backdated(k, 10, 700);
    backdated(f, 40, -200);

    auto s = t.ex.log().summary("alice", now);
    ASSERT_EQ(s.buy_count, 2);
    ASSERT_EQ(s.sell_count, 4);
    ASSERT_EQ(s.total_invested, 4000);
    ASSERT_EQ(s.total_sold, 5400);
    ASSERT_EQ(s.realized_pnl, 1400);
    ASSERT_EQ(s.pnl_by_asset_type["player"], 1700);
    ASSERT_EQ(s.pnl_by_asset_type["team_fund"], -300);
    ASSERT_EQ(s.count_by_asset_type["player"], 3);
    ASSERT_EQ(s.count_by_asset_type["team_fund"], 3);
    ASSERT_TRUE(s.last_transaction_at > 0);

    ASSERT_EQ(s.weekly_pnl, 900);
    ASSERT_EQ(s.monthly_pnl, 1600);
    ASSERT_EQ(s.weekly_count, 4);
    ASSERT_EQ(s.monthly_count, 5);
}

int main() {
    std::cout << "=== Ledger Tests ===\n";

    RUN_TEST(open_account_and_deposit);
    RUN_TEST(open_account_uses_configured_initial_balance);
    RUN_TEST(duplicate_and_unknown_accounts);
    RUN_TEST(debit_never_overdraws);
    RUN_TEST(failed_unit_of_work_rolls_back);
    RUN_TEST(age_verification);

    RUN_TEST(holdings_increase_decrease_prune);
    RUN_TEST(asset_types_are_distinct);

    RUN_TEST(buy_debits_and_records);
    RUN_TEST(buy_without_funds_has_no_effect);
    RUN_TEST(oversell_has_no_effect);
    RUN_TEST(trade_argument_validation);
    RUN_TEST(replay_matches_signed_deltas);
    RUN_TEST(sub_cent_trades_never_create_cash);

    RUN_TEST(average_cost_profit_loss);
    RUN_TEST(average_cost_is_quantity_weighted);
    RUN_TEST(performance_summary);

    std::cout << "\nAll ledger tests passed\n";
    return 0;
}
