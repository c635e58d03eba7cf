#pragma once

#include <unordered_map>
#include <vector>
#include "bloomstock/database.hpp"
#include "bloomstock/types.hpp"

namespace bloomstock {

/// A reservation together with the order it belongs to.
struct OrderedReservation {
    OrderReservation reservation;
    std::string order_number;
    OrderStatus order_status = OrderStatus::New;
    Timestamp order_created_at;
};

/**
 * Table of outstanding holds. Row-level access only; the invariants live
 * in ReservationManager and DeductionConverter.
 */
class ReservationLedger {
public:
    explicit ReservationLedger(Database& db) : db_(db) {}

    /// Sum of reserved quantity per warehouse item, across all orders.
    std::unordered_map<Id, Quantity> reserved_totals(const std::vector<Id>& warehouse_item_ids);
    std::unordered_map<Id, Quantity> reserved_totals();

    OrderReservation insert(Id order_id, Id warehouse_item_id, Quantity quantity, Timestamp created_at);

    std::vector<ReservationDetail> for_order(Id order_id);

    /// Delete every reservation of the order; returns the number removed.
    int remove_for_order(Id order_id);

    /// Delete reservations by id; returns the number removed.
    int remove(const std::vector<Id>& reservation_ids);

    /// Reservations whose order was created before cutoff and is in one of the statuses.
    std::vector<OrderedReservation> held_by_orders(Timestamp cutoff, const std::vector<OrderStatus>& statuses);

    /// Every reservation with its order, for statistics.
    std::vector<OrderedReservation> all();

private:
    std::vector<OrderedReservation> read_ordered(Statement& stmt);

    Database& db_;
};

}  // namespace bloomstock
