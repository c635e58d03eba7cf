#pragma once

#include <string>
#include <variant>
#include <vector>
#include "bloomstock/bom.hpp"
#include "bloomstock/database.hpp"
#include "bloomstock/types.hpp"

namespace bloomstock {

/// Deduct exactly what the order's reservations hold.
struct FromReservations {
    std::vector<ReservationDetail> reservations;
};

/// Orders without reservations: deduct the BOM expansion of their line items.
struct FromOrderItems {
    std::vector<Requirement> requirements;
};

using DeductionSource = std::variant<FromReservations, FromOrderItems>;

/// One warehouse decrement, independent of where it came from.
struct Deduction {
    Id warehouse_item_id = 0;
    std::string warehouse_item_name;
    Quantity quantity = 0;
    std::string description;
    /// Order lines behind the deduction; only known on the order-items path.
    std::string needed_for;
};

/**
 * Reduce a source to the list of decrements it implies.
 */
std::vector<Deduction> plan_deductions(const DeductionSource& source, const Order& order);

/**
 * Turns an assembled order's holds into permanent stock decrements.
 */
class DeductionConverter {
public:
    explicit DeductionConverter(Database& db) : db_(db) {}

    /**
     * Deduct stock for an order and write one sale audit row per item.
     * All-or-nothing: any shortfall aborts before a single row changes.
     *
     * @throws NotFoundError if the order does not exist
     * @throws InsufficientStockError if on-hand stock no longer covers a deduction
     * @throws ReservationError if the order has neither reservations nor line items,
     *         or its stock was already deducted
     */
    std::vector<WarehouseOperation> convert(Id order_id);

private:
    DeductionSource load_source(const Order& order);

    Database& db_;
};

}  // namespace bloomstock
