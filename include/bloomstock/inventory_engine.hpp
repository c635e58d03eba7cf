#pragma once

#include <vector>
#include "bloomstock/availability.hpp"
#include "bloomstock/cleanup_sweeper.hpp"
#include "bloomstock/database.hpp"
#include "bloomstock/inventory_summary.hpp"
#include "bloomstock/types.hpp"

namespace bloomstock {

/// What an order status change did to inventory.
struct StatusTransitionResult {
    enum class Action { None, Deducted, Released };

    Action action = Action::None;
    std::vector<WarehouseOperation> operations;
    int released = 0;
};

/**
 * Library boundary of the reservation and availability engine.
 *
 * Bound to one connection; create one engine per thread or per request.
 */
class InventoryEngine {
public:
    explicit InventoryEngine(Database& db) : db_(db) {}

    ProductAvailability check_availability(Id product_id, Quantity quantity);
    BatchAvailability check_batch_availability(const std::vector<ItemRequest>& requests);

    std::vector<OrderReservation> create_reservation(Id order_id, const std::vector<ItemRequest>& requests,
                                                     bool validate = true);
    int release_reservations(Id order_id);
    std::vector<ReservationDetail> order_reservations(Id order_id);

    std::vector<WarehouseOperation> convert_reservations_to_deductions(Id order_id);

    InventorySummary inventory_summary();

    CleanupStats cleanup_expired_reservations(int max_age_hours = kDefaultCleanupMaxAgeHours, bool dry_run = true);
    ReservationStatistics reservation_statistics();

    ItemAvailability item_availability(Id warehouse_item_id);
    Quantity product_max_quantity(Id product_id);
    std::vector<AvailabilityWarning> validate_order_items(const std::vector<ItemRequest>& requests);

    /**
     * React to a status change made by the order state machine: entering
     * assembled deducts stock, entering cancelled releases holds, anything
     * else leaves inventory untouched.
     */
    StatusTransitionResult on_status_changed(Id order_id, OrderStatus old_status, OrderStatus new_status);

private:
    Database& db_;
};

}  // namespace bloomstock
