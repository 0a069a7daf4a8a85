#pragma once

#include "domain/Trade.hpp"
#include "domain/RebuildResult.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace tradebook::adapters::secondary {

/**
 * @brief Преобразование сделок и итогов пересборки в JSON и обратно
 *
 * Десятичные значения пишутся строками ("150.25"), чтобы не терять
 * точность на double. Время в ISO 8601 UTC. Ключи в snake_case.
 * Используется для отчёта CLI и для JSONB-колонок в PostgreSQL.
 */
class TradeJsonMapper {
public:
    static nlohmann::json toJson(const domain::OrderAllocation& allocation) {
        return {
            {"order_id", allocation.orderId},
            {"role", domain::toString(allocation.role)},
            {"quantity", allocation.quantity.toString()},
            {"order_quantity", allocation.orderQuantity.toString()},
            {"price", allocation.price.toString()},
            {"commission", allocation.commission.toString()},
            {"fees", allocation.fees.toString()},
            {"executed_at", allocation.executedAt.toString()}
        };
    }

    static nlohmann::json allocationsToJson(const std::vector<domain::OrderAllocation>& allocations) {
        nlohmann::json array = nlohmann::json::array();
        for (const auto& allocation : allocations) {
            array.push_back(toJson(allocation));
        }
        return array;
    }

    /**
     * @throws nlohmann::json::exception или std::invalid_argument для некорректного JSON
     */
    static std::vector<domain::OrderAllocation> allocationsFromJson(const nlohmann::json& array) {
        std::vector<domain::OrderAllocation> allocations;
        for (const auto& item : array) {
            domain::OrderAllocation allocation;
            allocation.orderId = item.at("order_id").get<std::string>();
            allocation.role = domain::allocationRoleFromString(item.at("role").get<std::string>());
            allocation.quantity = decimalAt(item, "quantity");
            allocation.orderQuantity = item.contains("order_quantity")
                ? decimalAt(item, "order_quantity") : allocation.quantity;
            allocation.price = decimalAt(item, "price");
            allocation.commission = decimalAt(item, "commission");
            allocation.fees = decimalAt(item, "fees");
            allocation.executedAt = domain::Timestamp::fromString(item.at("executed_at").get<std::string>());
            allocations.push_back(allocation);
        }
        return allocations;
    }

    static nlohmann::json toJson(const domain::Trade& trade) {
        nlohmann::json json = {
            {"id", trade.id},
            {"user_id", trade.userId},
            {"account_id", trade.accountId},
            {"symbol", trade.symbol},
            {"asset_class", domain::toString(trade.assetClass)},
            {"side", domain::toString(trade.side)},
            {"status", domain::toString(trade.status)},
            {"open_quantity", trade.openQuantity.toString()},
            {"close_quantity", trade.closeQuantity.toString()},
            {"avg_entry_price", trade.avgEntryPrice.toString()},
            {"avg_exit_price", optionalDecimal(trade.avgExitPrice)},
            {"realized_pnl", trade.realizedPnl.toString()},
            {"commissions_total", trade.commissionsTotal.toString()},
            {"fees_total", trade.feesTotal.toString()},
            {"executions_count", trade.executionsCount},
            {"cost_basis", trade.costBasis.toString()},
            {"proceeds", trade.proceeds.toString()},
            {"open_cost", trade.openCost.toString()},
            {"open_charges", trade.openCharges.toString()},
            {"entry_at", trade.entryAt.toString()},
            {"exit_at", trade.exitAt ? nlohmann::json(trade.exitAt->toString()) : nlohmann::json(nullptr)},
            {"time_in_trade_seconds", trade.timeInTradeSeconds
                ? nlohmann::json(*trade.timeInTradeSeconds) : nlohmann::json(nullptr)},
            {"holding_period", domain::toString(trade.holdingPeriod)},
            {"market_session", domain::toString(trade.marketSession)},
            {"orders_in_trade", trade.ordersInTrade},
            {"allocations", allocationsToJson(trade.allocations)}
        };
        return json;
    }

    static domain::Trade tradeFromJson(const nlohmann::json& json) {
        domain::Trade trade;
        trade.id = json.at("id").get<std::string>();
        trade.userId = json.at("user_id").get<std::string>();
        trade.accountId = json.at("account_id").get<std::string>();
        trade.symbol = json.at("symbol").get<std::string>();
        trade.assetClass = domain::assetClassFromString(json.value("asset_class", "OTHER"));
        trade.side = domain::tradeSideFromString(json.at("side").get<std::string>());
        trade.status = domain::tradeStatusFromString(json.at("status").get<std::string>());
        trade.openQuantity = decimalAt(json, "open_quantity");
        trade.closeQuantity = decimalAt(json, "close_quantity");
        trade.avgEntryPrice = decimalAt(json, "avg_entry_price");
        if (!json.at("avg_exit_price").is_null()) {
            trade.avgExitPrice = decimalAt(json, "avg_exit_price");
        }
        trade.realizedPnl = decimalAt(json, "realized_pnl");
        trade.commissionsTotal = decimalAt(json, "commissions_total");
        trade.feesTotal = decimalAt(json, "fees_total");
        trade.executionsCount = json.at("executions_count").get<int>();
        trade.costBasis = decimalAt(json, "cost_basis");
        trade.proceeds = decimalAt(json, "proceeds");
        trade.openCost = decimalAt(json, "open_cost");
        trade.openCharges = decimalAt(json, "open_charges");
        trade.entryAt = domain::Timestamp::fromString(json.at("entry_at").get<std::string>());
        if (!json.at("exit_at").is_null()) {
            trade.exitAt = domain::Timestamp::fromString(json.at("exit_at").get<std::string>());
        }
        if (!json.at("time_in_trade_seconds").is_null()) {
            trade.timeInTradeSeconds = json.at("time_in_trade_seconds").get<int64_t>();
        }
        trade.holdingPeriod = domain::holdingPeriodFromString(json.at("holding_period").get<std::string>());
        trade.marketSession = domain::marketSessionFromString(json.at("market_session").get<std::string>());
        trade.ordersInTrade = json.at("orders_in_trade").get<std::vector<std::string>>();
        trade.allocations = allocationsFromJson(json.at("allocations"));
        return trade;
    }

    static nlohmann::json toJson(const domain::RebuildResult& result) {
        nlohmann::json trades = nlohmann::json::array();
        for (const auto& trade : result.trades) {
            trades.push_back(toJson(trade));
        }

        nlohmann::json skipped = nlohmann::json::array();
        for (const auto& order : result.skippedOrders) {
            skipped.push_back({
                {"order_id", order.orderId},
                {"account_id", order.accountId},
                {"symbol", order.symbol},
                {"reason", domain::toString(order.reason)}
            });
        }

        nlohmann::json problems = nlohmann::json::array();
        for (const auto& problem : result.problems) {
            problems.push_back({
                {"account_id", problem.accountId},
                {"symbol", problem.symbol},
                {"kind", domain::toString(problem.kind)},
                {"message", problem.message}
            });
        }

        return {
            {"user_id", result.userId},
            {"scope", domain::toString(result.scope)},
            {"started_at", result.startedAt.toString()},
            {"finished_at", result.finishedAt.toString()},
            {"requires_reconciliation", result.requiresReconciliation()},
            {"trades", trades},
            {"skipped_orders", skipped},
            {"problems", problems}
        };
    }

private:
    static nlohmann::json optionalDecimal(const std::optional<domain::Decimal>& value) {
        return value ? nlohmann::json(value->toString()) : nlohmann::json(nullptr);
    }

    static domain::Decimal decimalAt(const nlohmann::json& json, const char* key) {
        const auto& value = json.at(key);
        if (value.is_string()) {
            return domain::Decimal::fromString(value.get<std::string>());
        }
        if (value.is_number_integer()) {
            return domain::Decimal(value.get<int64_t>());
        }
        return domain::Decimal::fromDouble(value.get<double>());
    }
};

} // namespace tradebook::adapters::secondary
