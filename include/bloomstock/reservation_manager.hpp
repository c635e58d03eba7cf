#pragma once

#include <vector>
#include "bloomstock/database.hpp"
#include "bloomstock/types.hpp"

namespace bloomstock {

/**
 * Creates and releases reservation holds.
 *
 * Every call runs in its own immediate transaction, so the availability
 * re-check and the inserts it guards are atomic with respect to other
 * connections writing the same database.
 */
class ReservationManager {
public:
    explicit ReservationManager(Database& db) : db_(db) {}

    /**
     * Reserve the BOM-expanded requirement of requests for an order.
     *
     * @param validate re-run the batch availability check under the write lock
     * @return the created reservation rows, one per distinct warehouse item
     * @throws NotFoundError if the order does not exist
     * @throws InsufficientStockError if validate is set and any product falls short
     * @throws ReservationError if the order already holds reservations, or on
     *         an unexpected persistence failure
     */
    std::vector<OrderReservation> create(Id order_id, const std::vector<ItemRequest>& requests, bool validate);

    /**
     * Delete every reservation of the order. Returns the number released;
     * zero when the order holds nothing.
     */
    int release(Id order_id);

    std::vector<ReservationDetail> reservations_for(Id order_id);

private:
    Database& db_;
};

}  // namespace bloomstock
