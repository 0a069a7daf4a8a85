#pragma once

#include "ports/output/IOrderRepository.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <memory>

namespace tradebook::adapters::secondary {

/**
 * @brief PostgreSQL реализация репозитория исполнений
 *
 * Соединение на каждый вызов, таблица создаётся в конструкторе.
 * Десятичные значения читаются из NUMERIC как текст, время как
 * микросекунды Unix epoch.
 * Ошибки чтения логируются и пробрасываются: пересборка без ордеров
 * не должна выглядеть как пересборка пустой истории.
 */
class PostgresOrderRepository : public ports::output::IOrderRepository {
public:
    explicit PostgresOrderRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        initSchema();
    }

    void save(const domain::Order& order) override {
        try {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work txn(c);
            txn.exec_params(
                R"(
                    INSERT INTO orders (
                        id, user_id, account_id, symbol, asset_class, side,
                        quantity, price, commission, fees,
                        executed_at, cancelled_at, sequence
                    )
                    VALUES ($1, $2, $3, $4, $5, $6,
                            $7::numeric, $8::numeric, $9::numeric, $10::numeric,
                            $11::timestamptz, $12::timestamptz, $13)
                    ON CONFLICT (id) DO NOTHING
                )",
                order.id,
                order.userId,
                order.accountId,
                order.symbol,
                domain::toString(order.assetClass),
                domain::toString(order.side),
                order.quantity.toString(),
                order.price.toString(),
                order.commission.toString(),
                order.fees.toString(),
                optionalTimestamp(order.executedAt),
                optionalTimestamp(order.cancelledAt),
                order.sequence
            );
            txn.commit();
            std::cout << "[PostgresOrderRepo] Saved order: " << order.id << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresOrderRepo] save() failed: " << e.what() << std::endl;
            throw;
        }
    }

    std::optional<domain::Order> findById(const std::string& id) override {
        try {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work txn(c);
            auto result = txn.exec_params(SELECT_COLUMNS + " WHERE id = $1", id);
            txn.commit();
            if (result.empty()) {
                return std::nullopt;
            }
            return rowToOrder(result[0]);
        } catch (const std::exception& e) {
            std::cerr << "[PostgresOrderRepo] findById() failed: " << e.what() << std::endl;
            throw;
        }
    }

    std::vector<domain::Order> findByIds(const std::string& userId,
                                         const std::vector<std::string>& ids) override {
        std::vector<domain::Order> orders;
        try {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::read_transaction txn(c);
            for (const auto& id : ids) {
                auto result = txn.exec_params(SELECT_COLUMNS + " WHERE id = $1 AND user_id = $2", id, userId);
                if (!result.empty()) {
                    orders.push_back(rowToOrder(result[0]));
                }
            }
            txn.commit();
        } catch (const std::exception& e) {
            std::cerr << "[PostgresOrderRepo] findByIds() failed: " << e.what() << std::endl;
            throw;
        }
        return orders;
    }

    std::vector<domain::Order> fetchUnconsumedOrders(const std::string& userId) override {
        return query(SELECT_COLUMNS + " WHERE user_id = $1 AND used_in_trade = FALSE ORDER BY sequence, id",
                     userId, "fetchUnconsumedOrders");
    }

    std::vector<domain::Order> fetchAllOrders(const std::string& userId) override {
        return query(SELECT_COLUMNS + " WHERE user_id = $1 ORDER BY sequence, id",
                     userId, "fetchAllOrders");
    }

    std::vector<std::string> findUserIds() override {
        std::vector<std::string> users;
        try {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::read_transaction txn(c);
            auto result = txn.exec("SELECT DISTINCT user_id FROM orders ORDER BY user_id");
            for (const auto& row : result) {
                users.push_back(row[0].as<std::string>());
            }
        } catch (const std::exception& e) {
            std::cerr << "[PostgresOrderRepo] findUserIds() failed: " << e.what() << std::endl;
            throw;
        }
        return users;
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;

    void initSchema() {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS orders (
                    id VARCHAR(64) PRIMARY KEY,
                    user_id VARCHAR(64) NOT NULL,
                    account_id VARCHAR(64) NOT NULL,
                    symbol VARCHAR(64) NOT NULL,
                    asset_class VARCHAR(16) NOT NULL DEFAULT 'EQUITY',
                    side VARCHAR(4) NOT NULL,
                    quantity NUMERIC(28,8) NOT NULL,
                    price NUMERIC(28,8) NOT NULL,
                    commission NUMERIC(28,8) NOT NULL DEFAULT 0,
                    fees NUMERIC(28,8) NOT NULL DEFAULT 0,
                    executed_at TIMESTAMPTZ,
                    cancelled_at TIMESTAMPTZ,
                    sequence BIGINT NOT NULL DEFAULT 0,
                    used_in_trade BOOLEAN NOT NULL DEFAULT FALSE,
                    trade_id VARCHAR(64),
                    created_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
                );

                CREATE INDEX IF NOT EXISTS idx_orders_user_unconsumed
                ON orders(user_id, used_in_trade);
            )");

            txn.commit();
            std::cout << "[PostgresOrderRepo] Schema initialized in " << settings_->getName() << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresOrderRepo] initSchema error: " << e.what() << std::endl;
            throw;
        }
    }

    inline static const std::string SELECT_COLUMNS = R"(
        SELECT id, user_id, account_id, symbol, asset_class, side,
               quantity::text AS quantity, price::text AS price,
               commission::text AS commission, fees::text AS fees,
               (EXTRACT(EPOCH FROM executed_at) * 1000000)::BIGINT AS executed_at_us,
               (EXTRACT(EPOCH FROM cancelled_at) * 1000000)::BIGINT AS cancelled_at_us,
               sequence, used_in_trade, trade_id
        FROM orders
    )";

    std::vector<domain::Order> query(const std::string& sql, const std::string& userId, const char* operation) {
        std::vector<domain::Order> orders;
        try {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::read_transaction txn(c);
            auto result = txn.exec_params(sql, userId);
            for (const auto& row : result) {
                orders.push_back(rowToOrder(row));
            }
        } catch (const std::exception& e) {
            std::cerr << "[PostgresOrderRepo] " << operation << "() failed: " << e.what() << std::endl;
            throw;
        }
        return orders;
    }

    static std::optional<std::string> optionalTimestamp(const std::optional<domain::Timestamp>& ts) {
        if (!ts) return std::nullopt;
        return ts->toString();
    }

    static std::optional<domain::Timestamp> timestampColumn(const pqxx::field& field) {
        if (field.is_null()) return std::nullopt;
        return domain::Timestamp::fromUnixMicros(field.as<int64_t>());
    }

    static domain::Order rowToOrder(const pqxx::row& row) {
        domain::Order order;
        order.id = row["id"].as<std::string>();
        order.userId = row["user_id"].as<std::string>();
        order.accountId = row["account_id"].as<std::string>();
        order.symbol = row["symbol"].as<std::string>();
        order.assetClass = domain::assetClassFromString(row["asset_class"].as<std::string>());
        order.side = domain::orderSideFromString(row["side"].as<std::string>());
        order.quantity = domain::Decimal::fromString(row["quantity"].as<std::string>());
        order.price = domain::Decimal::fromString(row["price"].as<std::string>());
        order.commission = domain::Decimal::fromString(row["commission"].as<std::string>());
        order.fees = domain::Decimal::fromString(row["fees"].as<std::string>());
        order.executedAt = timestampColumn(row["executed_at_us"]);
        order.cancelledAt = timestampColumn(row["cancelled_at_us"]);
        order.sequence = row["sequence"].as<int64_t>();
        order.usedInTrade = row["used_in_trade"].as<bool>();
        if (!row["trade_id"].is_null()) {
            order.tradeId = row["trade_id"].as<std::string>();
        }
        return order;
    }
};

} // namespace tradebook::adapters::secondary
