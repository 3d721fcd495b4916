/**
 * P2P trade offers: swap, re-validation at acceptance, authorization, transfer logging
 */

#include <optional>
#include <string>
#include <vector>

#include "test_support.hpp"

using model::OfferAsset;
using model::OfferStatus;
using model::Side;
using model::TxKind;

namespace {

const model::AssetRef MAHOMES = player("Patrick Mahomes");
const model::AssetRef ALLEN = player("Josh Allen");
const model::AssetRef CHIEFS = team_fund("Chiefs");

// alice: 2 Mahomes @ 50.00, bob: 3 Allen @ 40.00
void seed(TestExchange &t) {
    t.ex.open_account("alice", "Alice", 100000);
    t.ex.open_account("bob", "Bob", 100000);
    t.ex.open_account("carol", "Carol", 100000);
    t.ex.trades().execute_trade("alice", MAHOMES, Side::Buy, 5000, fixed::shares(2));
    t.ex.trades().execute_trade("bob", ALLEN, Side::Buy, 4000, fixed::shares(3));
}

std::vector<OfferAsset> assets(const model::AssetRef &a, double qty) { return {{a, fixed::shares(qty)}}; }

} // namespace

TEST(accept_swaps_atomically) {
    TestExchange t;
    seed(t);
    auto offer = t.ex.offers().create_offer("alice", assets(MAHOMES, 1), assets(ALLEN, 2), std::string("bob"), "swap?");
    ASSERT_TRUE(offer.status == OfferStatus::Pending);

    auto done = t.ex.offers().accept_offer(offer.id, "bob");
    ASSERT_TRUE(done.status == OfferStatus::Accepted);

    ASSERT_EQ(t.held("alice", MAHOMES), 1000);
    ASSERT_EQ(t.held("alice", ALLEN), 2000);
    ASSERT_EQ(t.held("bob", MAHOMES), 1000);
    ASSERT_EQ(t.held("bob", ALLEN), 1000);
    ASSERT_EQ(t.balance("alice"), 90000);
    ASSERT_EQ(t.balance("bob"), 88000);

    auto stored = t.ex.offers().get_offer(offer.id);
    ASSERT_TRUE(stored.status == OfferStatus::Accepted);
    ASSERT_EQ(stored.offered.size(), 1u);
    ASSERT_EQ(stored.requested.size(), 1u);
    ASSERT_EQ(stored.note, std::string("swap?"));
}

TEST(transfers_are_logged_with_giver_cost) {
    TestExchange t;
    seed(t);
    auto offer = t.ex.offers().create_offer("alice", assets(MAHOMES, 1), assets(ALLEN, 2), std::string("bob"));
    t.ex.offers().accept_offer(offer.id, "bob");

    auto alice = t.ex.log().history("alice");
    int trade_in = 0;
    int trade_out = 0;
    for (const auto &tx : alice) {
        if (tx.kind == TxKind::TradeIn) {
            ++trade_in;
            ASSERT_TRUE(tx.asset == ALLEN);
            ASSERT_EQ(tx.unit_price, 4000);
            ASSERT_TRUE(tx.offer_id && *tx.offer_id == offer.id);
        }
        if (tx.kind == TxKind::TradeOut) {
            ++trade_out;
            ASSERT_TRUE(tx.asset == MAHOMES);
            ASSERT_EQ(tx.quantity, 1000);
        }
    }
    ASSERT_EQ(trade_in, 1);
    ASSERT_EQ(trade_out, 1);

    // 收到的 Allen 以转出方均价 40.00 计成本
    auto r = t.ex.trades().execute_trade("alice", ALLEN, Side::Sell, 4500, fixed::shares(2));
    ASSERT_EQ(r.cost_basis, 4000);
    ASSERT_EQ(r.profit_loss, 1000);

    auto s = t.ex.log().summary("bob");
    ASSERT_EQ(s.trade_in_count, 1);
    ASSERT_EQ(s.trade_out_count, 1);
}

TEST(unpriced_transfer_falls_back_to_sale_price) {
    TestExchange t;
    seed(t);
    auto rookie = player("Rookie");
    t.db.transact([&](Database::Tx &tx) { t.ex.holdings().increase(tx, "bob", rookie, 1000); });

    auto offer = t.ex.offers().create_offer("bob", assets(rookie, 1), assets(MAHOMES, 1), std::nullopt);
    t.ex.offers().accept_offer(offer.id, "alice");

    auto r = t.ex.trades().execute_trade("alice", rookie, Side::Sell, 1000, fixed::shares(1));
    ASSERT_EQ(r.cost_basis, 1000);
    ASSERT_EQ(r.profit_loss, 0);
}

TEST(stale_offer_leaves_everything_untouched) {
    TestExchange t;
    seed(t);
    auto offer = t.ex.offers().create_offer("alice", assets(MAHOMES, 2), assets(ALLEN, 1), std::string("bob"));

    // 发起方在接受前卖掉了一部分
    t.ex.trades().execute_trade("alice", MAHOMES, Side::Sell, 5000, fixed::shares(1));

    ASSERT_THROWS_KIND(t.ex.offers().accept_offer(offer.id, "bob"), ErrorKind::StaleOffer);
    ASSERT_EQ(t.held("alice", MAHOMES), 1000);
    ASSERT_EQ(t.held("bob", ALLEN), 3000);
    ASSERT_EQ(t.held("bob", MAHOMES), 0);
    ASSERT_TRUE(t.ex.offers().get_offer(offer.id).status == OfferStatus::Pending);
    ASSERT_EQ(t.ex.log().summary("bob").trade_in_count, 0);

    // 保持 pending, 由发起方手动撤销
    auto cancelled = t.ex.offers().cancel_offer(offer.id, "alice");
    ASSERT_TRUE(cancelled.status == OfferStatus::Cancelled);
}

TEST(acceptor_short_of_requested_assets) {
    TestExchange t;
    seed(t);
    auto offer = t.ex.offers().create_offer("alice", assets(MAHOMES, 1), assets(ALLEN, 3), std::string("bob"));

    // 接受方持仓在创建后减少
    t.ex.trades().execute_trade("bob", ALLEN, Side::Sell, 4000, fixed::shares(1));

    ASSERT_THROWS_KIND(t.ex.offers().accept_offer(offer.id, "bob"), ErrorKind::InsufficientHoldings);
    ASSERT_EQ(t.held("alice", MAHOMES), 2000);
    ASSERT_EQ(t.held("alice", ALLEN), 0);
    ASSERT_EQ(t.held("bob", ALLEN), 2000);
    ASSERT_EQ(t.held("bob", MAHOMES), 0);
    ASSERT_TRUE(t.ex.offers().get_offer(offer.id).status == OfferStatus::Pending);
}

TEST(who_may_accept_reject_cancel) {
    TestExchange t;
    seed(t);
    auto named = t.ex.offers().create_offer("alice", assets(MAHOMES, 1), assets(ALLEN, 1), std::string("bob"));

    ASSERT_THROWS_KIND(t.ex.offers().accept_offer(named.id, "carol"), ErrorKind::NotAuthorized);
    ASSERT_THROWS_KIND(t.ex.offers().accept_offer(named.id, "alice"), ErrorKind::NotAuthorized);
    ASSERT_THROWS_KIND(t.ex.offers().reject_offer(named.id, "alice"), ErrorKind::NotAuthorized);
    ASSERT_THROWS_KIND(t.ex.offers().cancel_offer(named.id, "bob"), ErrorKind::NotAuthorized);
    ASSERT_THROWS_KIND(t.ex.offers().accept_offer(named.id + 50, "bob"), ErrorKind::NotFound);

    auto rejected = t.ex.offers().reject_offer(named.id, "bob");
    ASSERT_TRUE(rejected.status == OfferStatus::Rejected);
    ASSERT_THROWS_KIND(t.ex.offers().accept_offer(named.id, "bob"), ErrorKind::StaleOffer);
    ASSERT_THROWS_KIND(t.ex.offers().cancel_offer(named.id, "alice"), ErrorKind::StaleOffer);
    ASSERT_EQ(t.held("alice", MAHOMES), 2000);

    // 公开报价: 任何非发起方都可接受, 但不能被拒绝
    t.db.transact([&](Database::Tx &tx) { t.ex.holdings().increase(tx, "carol", ALLEN, 1000); });
    auto open = t.ex.offers().create_offer("alice", assets(MAHOMES, 1), assets(ALLEN, 1), std::nullopt);
    ASSERT_THROWS_KIND(t.ex.offers().reject_offer(open.id, "carol"), ErrorKind::NotAuthorized);
    auto accepted = t.ex.offers().accept_offer(open.id, "carol");
    ASSERT_TRUE(accepted.counterparty && *accepted.counterparty == "carol");
    ASSERT_EQ(t.held("carol", MAHOMES), 1000);
    ASSERT_EQ(t.held("carol", ALLEN), 0);
}

TEST(create_offer_validation) {
    TestExchange t;
    seed(t);
    auto &offers = t.ex.offers();
    std::optional<std::string> bob = std::string("bob");

    ASSERT_THROWS_KIND(offers.create_offer("alice", assets(MAHOMES, 3), assets(ALLEN, 1), bob),
                       ErrorKind::InsufficientHoldings);
    ASSERT_THROWS_KIND(offers.create_offer("alice", {}, assets(ALLEN, 1), bob), ErrorKind::InvalidArgument);
    ASSERT_THROWS_KIND(offers.create_offer("alice", assets(MAHOMES, 1), {}, bob), ErrorKind::InvalidArgument);
    ASSERT_THROWS_KIND(offers.create_offer("alice", assets(MAHOMES, 1), assets(MAHOMES, 1), bob),
                       ErrorKind::InvalidArgument);
    ASSERT_THROWS_KIND(offers.create_offer("alice", {{MAHOMES, 500}, {MAHOMES, 500}}, assets(ALLEN, 1), bob),
                       ErrorKind::InvalidArgument);
    ASSERT_THROWS_KIND(offers.create_offer("alice", {{MAHOMES, 0}}, assets(ALLEN, 1), bob),
                       ErrorKind::InvalidArgument);
    ASSERT_THROWS_KIND(offers.create_offer("alice", assets(MAHOMES, 1), assets(ALLEN, 1), std::string("alice")),
                       ErrorKind::InvalidArgument);
    ASSERT_THROWS_KIND(offers.create_offer("alice", assets(MAHOMES, 1), assets(ALLEN, 1), std::string("nobody")),
                       ErrorKind::NotFound);

    // 同名不同类型视为不同资产
    offers.create_offer("alice", assets(MAHOMES, 1), assets(team_fund("Patrick Mahomes"), 1), bob);
    ASSERT_EQ(t.db.get_table_count("trade_offers"), 1);
}

TEST(pending_offers_view) {
    TestExchange t;
    seed(t);
    auto to_bob = t.ex.offers().create_offer("alice", assets(MAHOMES, 1), assets(ALLEN, 1), std::string("bob"));
    auto open = t.ex.offers().create_offer("bob", assets(ALLEN, 1), assets(MAHOMES, 1), std::nullopt);
    auto to_carol = t.ex.offers().create_offer("bob", assets(ALLEN, 1), assets(CHIEFS, 1), std::string("carol"));

    auto for_alice = t.ex.offers().pending_offers("alice");
    ASSERT_EQ(for_alice.size(), 2u); // 自己发出的 + bob 的公开报价
    for (const auto &o : for_alice) {
        ASSERT_TRUE(o.id == to_bob.id || o.id == open.id);
        ASSERT_EQ(o.offered.size(), 1u);
        ASSERT_EQ(o.requested.size(), 1u);
    }

    ASSERT_EQ(t.ex.offers().pending_offers("bob").size(), 3u);
    ASSERT_EQ(t.ex.offers().pending_offers("carol").size(), 2u);

    t.ex.offers().cancel_offer(to_carol.id, "bob");
    ASSERT_EQ(t.ex.offers().pending_offers("carol").size(), 1u);
}

int main() {
    std::cout << "=== Trade Offer Tests ===\n";

    RUN_TEST(accept_swaps_atomically);
    RUN_TEST(transfers_are_logged_with_giver_cost);
    RUN_TEST(unpriced_transfer_falls_back_to_sale_price);
    RUN_TEST(stale_offer_leaves_everything_untouched);
    RUN_TEST(acceptor_short_of_requested_assets);
    RUN_TEST(who_may_accept_reject_cancel);
    RUN_TEST(create_offer_validation);
    RUN_TEST(pending_offers_view);

    std::cout << "\nAll trade offer tests passed\n";
    return 0;
}
