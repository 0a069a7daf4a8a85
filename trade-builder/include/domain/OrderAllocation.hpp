#pragma once

#include "enums/AllocationRole.hpp"
#include "Decimal.hpp"
#include "Timestamp.hpp"
#include <string>

namespace tradebook::domain {

/**
 * @brief Часть ордера, отнесённая к сделке
 *
 * Неразделённый ордер даёт одну аллокацию на весь объём и все комиссии.
 * Ордер разворота даёт по аллокации в каждой из двух сделок; их
 * количества и доли комиссий в сумме равны значениям ордера.
 */
struct OrderAllocation {
    std::string orderId;
    AllocationRole role = AllocationRole::ENTRY;
    Decimal quantity;         ///< Объём этой части
    Decimal orderQuantity;    ///< Полный объём исходного ордера
    Decimal price;
    Decimal commission;       ///< Доля комиссии ордера
    Decimal fees;             ///< Доля сборов ордера
    Timestamp executedAt;

    bool isSplit() const {
        return quantity != orderQuantity;
    }

    bool operator==(const OrderAllocation& other) const {
        return orderId == other.orderId && role == other.role
            && quantity == other.quantity && orderQuantity == other.orderQuantity
            && price == other.price && commission == other.commission
            && fees == other.fees && executedAt == other.executedAt;
    }

    bool operator!=(const OrderAllocation& other) const {
        return !(*this == other);
    }
};

} // namespace tradebook::domain
