#pragma once

#include "ports/output/ITradeRepository.hpp"
#include "settings/DbSettings.hpp"
#include "adapters/secondary/serialization/TradeJsonMapper.hpp"
#include "domain/exceptions/TradeBookException.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <memory>

namespace tradebook::adapters::secondary {

/**
 * @brief PostgreSQL хранилище сделок
 *
 * commitGroup() и resetUser() выполняются одной транзакцией pqxx::work.
 * UPDATE привязки ордера обязан затронуть ровно одну строку, иначе
 * транзакция не фиксируется и бросается AtomicityFailureException.
 * Аллокации и список ордеров хранятся в JSONB через TradeJsonMapper.
 */
class PostgresTradeRepository : public ports::output::ITradeRepository {
public:
    explicit PostgresTradeRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        initSchema();
    }

    std::vector<domain::Trade> findOpenTrades(const std::string& userId) override {
        return query(SELECT_COLUMNS + " WHERE user_id = $1 AND status = 'OPEN' ORDER BY account_id, symbol, entry_at, id",
                     userId, "findOpenTrades");
    }

    std::vector<domain::Trade> findByUserId(const std::string& userId) override {
        return query(SELECT_COLUMNS + " WHERE user_id = $1 ORDER BY account_id, symbol, entry_at, id",
                     userId, "findByUserId");
    }

    std::optional<domain::Trade> findById(const std::string& id) override {
        auto trades = query(SELECT_COLUMNS + " WHERE id = $1", id, "findById");
        if (trades.empty()) {
            return std::nullopt;
        }
        return trades.front();
    }

    void commitGroup(const domain::GroupCommit& commit) override {
        try {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work txn(c);

            for (const auto& trade : commit.trades) {
                upsertTrade(txn, trade);
            }

            for (const auto& tag : commit.tags) {
                auto result = txn.exec_params(
                    "UPDATE orders SET used_in_trade = TRUE, trade_id = $1 WHERE id = $2 AND user_id = $3",
                    tag.tradeId, tag.orderId, commit.userId);
                if (result.affected_rows() != 1) {
                    throw domain::AtomicityFailureException(
                        "tagging order " + tag.orderId + " affected " + std::to_string(result.affected_rows())
                        + " rows in " + commit.key.toString());
                }
            }

            txn.commit();
            std::cout << "[PostgresTradeRepo] Committed " << commit.trades.size() << " trades, "
                      << commit.tags.size() << " order tags for " << commit.key.toString() << std::endl;
        } catch (const domain::AtomicityFailureException& e) {
            std::cerr << "[PostgresTradeRepo] commitGroup() rolled back: " << e.what() << std::endl;
            throw;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresTradeRepo] commitGroup() failed: " << e.what() << std::endl;
            throw domain::AtomicityFailureException(commit.key.toString() + ": " + e.what());
        }
    }

    void resetUser(const std::string& userId) override {
        try {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work txn(c);
            auto deleted = txn.exec_params("DELETE FROM trades WHERE user_id = $1", userId);
            txn.exec_params(
                "UPDATE orders SET used_in_trade = FALSE, trade_id = NULL WHERE user_id = $1", userId);
            txn.commit();
            std::cout << "[PostgresTradeRepo] Reset user " << userId << ": "
                      << deleted.affected_rows() << " trades deleted" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresTradeRepo] resetUser() failed: " << e.what() << std::endl;
            throw domain::AtomicityFailureException("reset of user " + userId + ": " + e.what());
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;

    void initSchema() {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS trades (
                    id VARCHAR(64) PRIMARY KEY,
                    user_id VARCHAR(64) NOT NULL,
                    account_id VARCHAR(64) NOT NULL,
                    symbol VARCHAR(64) NOT NULL,
                    asset_class VARCHAR(16) NOT NULL,
                    side VARCHAR(8) NOT NULL,
                    status VARCHAR(8) NOT NULL,
                    open_quantity NUMERIC(28,8) NOT NULL,
                    close_quantity NUMERIC(28,8) NOT NULL,
                    avg_entry_price NUMERIC(28,8) NOT NULL,
                    avg_exit_price NUMERIC(28,8),
                    realized_pnl NUMERIC(28,8) NOT NULL,
                    commissions_total NUMERIC(28,8) NOT NULL,
                    fees_total NUMERIC(28,8) NOT NULL,
                    executions_count INTEGER NOT NULL,
                    cost_basis NUMERIC(28,8) NOT NULL,
                    proceeds NUMERIC(28,8) NOT NULL,
                    open_cost NUMERIC(28,8) NOT NULL,
                    open_charges NUMERIC(28,8) NOT NULL,
                    entry_at TIMESTAMPTZ NOT NULL,
                    exit_at TIMESTAMPTZ,
                    time_in_trade_seconds BIGINT,
                    holding_period VARCHAR(16) NOT NULL,
                    market_session VARCHAR(16) NOT NULL,
                    orders_in_trade JSONB NOT NULL DEFAULT '[]',
                    allocations JSONB NOT NULL DEFAULT '[]',
                    updated_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
                );

                CREATE INDEX IF NOT EXISTS idx_trades_user_status
                ON trades(user_id, status);
            )");

            txn.commit();
            std::cout << "[PostgresTradeRepo] Schema initialized in " << settings_->getName() << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresTradeRepo] initSchema error: " << e.what() << std::endl;
            throw;
        }
    }

    inline static const std::string SELECT_COLUMNS = R"(
        SELECT id, user_id, account_id, symbol, asset_class, side, status,
               open_quantity::text AS open_quantity, close_quantity::text AS close_quantity,
               avg_entry_price::text AS avg_entry_price, avg_exit_price::text AS avg_exit_price,
               realized_pnl::text AS realized_pnl,
               commissions_total::text AS commissions_total, fees_total::text AS fees_total,
               executions_count,
               cost_basis::text AS cost_basis, proceeds::text AS proceeds,
               open_cost::text AS open_cost, open_charges::text AS open_charges,
               (EXTRACT(EPOCH FROM entry_at) * 1000000)::BIGINT AS entry_at_us,
               (EXTRACT(EPOCH FROM exit_at) * 1000000)::BIGINT AS exit_at_us,
               time_in_trade_seconds, holding_period, market_session,
               orders_in_trade::text AS orders_in_trade, allocations::text AS allocations
        FROM trades
    )";

    std::vector<domain::Trade> query(const std::string& sql, const std::string& param, const char* operation) {
        std::vector<domain::Trade> trades;
        try {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::read_transaction txn(c);
            auto result = txn.exec_params(sql, param);
            for (const auto& row : result) {
                trades.push_back(rowToTrade(row));
            }
        } catch (const std::exception& e) {
            std::cerr << "[PostgresTradeRepo] " << operation << "() failed: " << e.what() << std::endl;
            throw;
        }
        return trades;
    }

    static void upsertTrade(pqxx::work& txn, const domain::Trade& trade) {
        std::optional<std::string> avgExitPrice;
        if (trade.avgExitPrice) avgExitPrice = trade.avgExitPrice->toString();
        std::optional<std::string> exitAt;
        if (trade.exitAt) exitAt = trade.exitAt->toString();

        txn.exec_params(
            R"(
                INSERT INTO trades (
                    id, user_id, account_id, symbol, asset_class, side, status,
                    open_quantity, close_quantity, avg_entry_price, avg_exit_price,
                    realized_pnl, commissions_total, fees_total, executions_count,
                    cost_basis, proceeds, open_cost, open_charges,
                    entry_at, exit_at, time_in_trade_seconds, holding_period, market_session,
                    orders_in_trade, allocations, updated_at
                )
                VALUES ($1, $2, $3, $4, $5, $6, $7,
                        $8::numeric, $9::numeric, $10::numeric, $11::numeric,
                        $12::numeric, $13::numeric, $14::numeric, $15,
                        $16::numeric, $17::numeric, $18::numeric, $19::numeric,
                        $20::timestamptz, $21::timestamptz, $22, $23, $24,
                        $25::jsonb, $26::jsonb, NOW())
                ON CONFLICT (id) DO UPDATE SET
                    status = EXCLUDED.status,
                    open_quantity = EXCLUDED.open_quantity,
                    close_quantity = EXCLUDED.close_quantity,
                    avg_entry_price = EXCLUDED.avg_entry_price,
                    avg_exit_price = EXCLUDED.avg_exit_price,
                    realized_pnl = EXCLUDED.realized_pnl,
                    commissions_total = EXCLUDED.commissions_total,
                    fees_total = EXCLUDED.fees_total,
                    executions_count = EXCLUDED.executions_count,
                    cost_basis = EXCLUDED.cost_basis,
                    proceeds = EXCLUDED.proceeds,
                    open_cost = EXCLUDED.open_cost,
                    open_charges = EXCLUDED.open_charges,
                    entry_at = EXCLUDED.entry_at,
                    exit_at = EXCLUDED.exit_at,
                    time_in_trade_seconds = EXCLUDED.time_in_trade_seconds,
                    holding_period = EXCLUDED.holding_period,
                    market_session = EXCLUDED.market_session,
                    orders_in_trade = EXCLUDED.orders_in_trade,
                    allocations = EXCLUDED.allocations,
                    updated_at = NOW()
            )",
            trade.id,
            trade.userId,
            trade.accountId,
            trade.symbol,
            domain::toString(trade.assetClass),
            domain::toString(trade.side),
            domain::toString(trade.status),
            trade.openQuantity.toString(),
            trade.closeQuantity.toString(),
            trade.avgEntryPrice.toString(),
            avgExitPrice,
            trade.realizedPnl.toString(),
            trade.commissionsTotal.toString(),
            trade.feesTotal.toString(),
            trade.executionsCount,
            trade.costBasis.toString(),
            trade.proceeds.toString(),
            trade.openCost.toString(),
            trade.openCharges.toString(),
            trade.entryAt.toString(),
            exitAt,
            trade.timeInTradeSeconds,
            domain::toString(trade.holdingPeriod),
            domain::toString(trade.marketSession),
            nlohmann::json(trade.ordersInTrade).dump(),
            TradeJsonMapper::allocationsToJson(trade.allocations).dump()
        );
    }

    static domain::Trade rowToTrade(const pqxx::row& row) {
        domain::Trade trade;
        trade.id = row["id"].as<std::string>();
        trade.userId = row["user_id"].as<std::string>();
        trade.accountId = row["account_id"].as<std::string>();
        trade.symbol = row["symbol"].as<std::string>();
        trade.assetClass = domain::assetClassFromString(row["asset_class"].as<std::string>());
        trade.side = domain::tradeSideFromString(row["side"].as<std::string>());
        trade.status = domain::tradeStatusFromString(row["status"].as<std::string>());
        trade.openQuantity = decimalColumn(row["open_quantity"]);
        trade.closeQuantity = decimalColumn(row["close_quantity"]);
        trade.avgEntryPrice = decimalColumn(row["avg_entry_price"]);
        if (!row["avg_exit_price"].is_null()) {
            trade.avgExitPrice = decimalColumn(row["avg_exit_price"]);
        }
        trade.realizedPnl = decimalColumn(row["realized_pnl"]);
        trade.commissionsTotal = decimalColumn(row["commissions_total"]);
        trade.feesTotal = decimalColumn(row["fees_total"]);
        trade.executionsCount = row["executions_count"].as<int>();
        trade.costBasis = decimalColumn(row["cost_basis"]);
        trade.proceeds = decimalColumn(row["proceeds"]);
        trade.openCost = decimalColumn(row["open_cost"]);
        trade.openCharges = decimalColumn(row["open_charges"]);
        trade.entryAt = domain::Timestamp::fromUnixMicros(row["entry_at_us"].as<int64_t>());
        if (!row["exit_at_us"].is_null()) {
            trade.exitAt = domain::Timestamp::fromUnixMicros(row["exit_at_us"].as<int64_t>());
        }
        if (!row["time_in_trade_seconds"].is_null()) {
            trade.timeInTradeSeconds = row["time_in_trade_seconds"].as<int64_t>();
        }
        trade.holdingPeriod = domain::holdingPeriodFromString(row["holding_period"].as<std::string>());
        trade.marketSession = domain::marketSessionFromString(row["market_session"].as<std::string>());
        trade.ordersInTrade = nlohmann::json::parse(row["orders_in_trade"].as<std::string>())
            .get<std::vector<std::string>>();
        trade.allocations = TradeJsonMapper::allocationsFromJson(
            nlohmann::json::parse(row["allocations"].as<std::string>()));
        return trade;
    }

    static domain::Decimal decimalColumn(const pqxx::field& field) {
        return domain::Decimal::fromString(field.as<std::string>());
    }
};

} // namespace tradebook::adapters::secondary
