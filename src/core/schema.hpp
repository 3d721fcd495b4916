#pragma once

// 表结构 (DuckDB DDL)
// 数据类型规范:
// - 金额:   BIGINT, 单位 cent
// - 赔率:   BIGINT, 小数赔率 * 100
// - 盘口:   BIGINT, 分值 * 10
// - 份额:   BIGINT, 份额 * 1000
// - 时间戳: BIGINT (Unix 毫秒)
// - 枚举:   VARCHAR (小写 snake_case)

#include <array>

namespace schema {

namespace ddl {

inline const char *ACCOUNTS = R"(
CREATE TABLE IF NOT EXISTS accounts (
    user_id VARCHAR PRIMARY KEY,
    username VARCHAR NOT NULL,
    balance BIGINT NOT NULL CHECK (balance >= 0),
    birthdate VARCHAR,
    verified_adult BOOLEAN NOT NULL DEFAULT FALSE,
    created_at BIGINT NOT NULL
);
)";

inline const char *HOLDINGS = R"(
CREATE TABLE IF NOT EXISTS holdings (
    user_id VARCHAR NOT NULL,
    asset_type VARCHAR NOT NULL,
    asset_name VARCHAR NOT NULL,
    quantity BIGINT NOT NULL CHECK (quantity >= 0),
    PRIMARY KEY (user_id, asset_type, asset_name)
);
)";

inline const char *TRANSACTION_SEQ = "CREATE SEQUENCE IF NOT EXISTS transaction_id_seq START 1;";

// 只追加, 从不修改
inline const char *TRANSACTIONS = R"(
CREATE TABLE IF NOT EXISTS transactions (
    id BIGINT PRIMARY KEY DEFAULT nextval('transaction_id_seq'),
    ts BIGINT NOT NULL,
    user_id VARCHAR NOT NULL,
    kind VARCHAR NOT NULL,
    asset_type VARCHAR NOT NULL,
    asset_name VARCHAR NOT NULL,
    unit_price BIGINT NOT NULL,
    quantity BIGINT NOT NULL,
    cost_basis BIGINT NOT NULL,
    profit_loss BIGINT NOT NULL,
    offer_id BIGINT
);
)";

inline const char *GAME_SEQ = "CREATE SEQUENCE IF NOT EXISTS game_id_seq START 1;";

inline const char *GAMES = R"(
CREATE TABLE IF NOT EXISTS games (
    id BIGINT PRIMARY KEY DEFAULT nextval('game_id_seq'),
    home_team VARCHAR NOT NULL,
    away_team VARCHAR NOT NULL,
    scheduled_at BIGINT NOT NULL,
    home_odds BIGINT NOT NULL,
    away_odds BIGINT NOT NULL,
    spread BIGINT NOT NULL,
    total_line BIGINT NOT NULL,
    status VARCHAR NOT NULL DEFAULT 'scheduled',
    home_score INTEGER,
    away_score INTEGER,
    settled_at BIGINT
);
)";

inline const char *BET_SEQ = "CREATE SEQUENCE IF NOT EXISTS bet_id_seq START 1;";

inline const char *BETS = R"(
CREATE TABLE IF NOT EXISTS bets (
    id BIGINT PRIMARY KEY DEFAULT nextval('bet_id_seq'),
    user_id VARCHAR NOT NULL,
    game_id BIGINT NOT NULL,
    bet_type VARCHAR NOT NULL,
    pick VARCHAR NOT NULL,
    stake BIGINT NOT NULL CHECK (stake > 0),
    odds BIGINT NOT NULL,
    potential_payout BIGINT NOT NULL,
    status VARCHAR NOT NULL DEFAULT 'pending',
    placed_at BIGINT NOT NULL,
    settled_at BIGINT
);
)";

inline const char *PARLAY_SEQ = "CREATE SEQUENCE IF NOT EXISTS parlay_id_seq START 1;";

inline const char *PARLAYS = R"(
CREATE TABLE IF NOT EXISTS parlays (
    id BIGINT PRIMARY KEY DEFAULT nextval('parlay_id_seq'),
    user_id VARCHAR NOT NULL,
    stake BIGINT NOT NULL CHECK (stake > 0),
    potential_payout BIGINT NOT NULL,
    status VARCHAR NOT NULL DEFAULT 'pending',
    created_at BIGINT NOT NULL,
    settled_at BIGINT
);
)";

inline const char *PARLAY_LEG_SEQ = "CREATE SEQUENCE IF NOT EXISTS parlay_leg_id_seq START 1;";

inline const char *PARLAY_LEGS = R"(
CREATE TABLE IF NOT EXISTS parlay_legs (
    id BIGINT PRIMARY KEY DEFAULT nextval('parlay_leg_id_seq'),
    parlay_id BIGINT NOT NULL,
    game_id BIGINT NOT NULL,
    bet_type VARCHAR NOT NULL,
    pick VARCHAR NOT NULL,
    odds BIGINT NOT NULL,
    status VARCHAR NOT NULL DEFAULT 'pending'
);
)";

inline const char *OFFER_SEQ = "CREATE SEQUENCE IF NOT EXISTS trade_offer_id_seq START 1;";

inline const char *TRADE_OFFERS = R"(
CREATE TABLE IF NOT EXISTS trade_offers (
    id BIGINT PRIMARY KEY DEFAULT nextval('trade_offer_id_seq'),
    initiator VARCHAR NOT NULL,
    counterparty VARCHAR,
    status VARCHAR NOT NULL DEFAULT 'pending',
    note VARCHAR,
    created_at BIGINT NOT NULL,
    updated_at BIGINT NOT NULL
);
)";

// side: 'offered' (发起方给出) / 'requested' (发起方索取)
inline const char *TRADE_OFFER_ASSETS = R"(
CREATE TABLE IF NOT EXISTS trade_offer_assets (
    offer_id BIGINT NOT NULL,
    side VARCHAR NOT NULL,
    asset_type VARCHAR NOT NULL,
    asset_name VARCHAR NOT NULL,
    quantity BIGINT NOT NULL CHECK (quantity > 0)
);
)";

inline const char *INDEXES[] = {
    "CREATE INDEX IF NOT EXISTS idx_transactions_user ON transactions(user_id)",
    "CREATE INDEX IF NOT EXISTS idx_bets_game ON bets(game_id)",
    "CREATE INDEX IF NOT EXISTS idx_bets_user ON bets(user_id)",
    "CREATE INDEX IF NOT EXISTS idx_parlay_legs_game ON parlay_legs(game_id)",
    "CREATE INDEX IF NOT EXISTS idx_parlay_legs_parlay ON parlay_legs(parlay_id)",
    "CREATE INDEX IF NOT EXISTS idx_trade_offer_assets_offer ON trade_offer_assets(offer_id)",
};

inline const std::array<const char *, 21> ALL = {
    ACCOUNTS, HOLDINGS,
    TRANSACTION_SEQ, TRANSACTIONS,
    GAME_SEQ, GAMES,
    BET_SEQ, BETS,
    PARLAY_SEQ, PARLAYS,
    PARLAY_LEG_SEQ, PARLAY_LEGS,
    OFFER_SEQ, TRADE_OFFERS, TRADE_OFFER_ASSETS,
    INDEXES[0], INDEXES[1], INDEXES[2], INDEXES[3], INDEXES[4], INDEXES[5],
};

} // namespace ddl

} // namespace schema
