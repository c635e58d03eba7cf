#include "bloomstock/inventory_engine.hpp"
#include "bloomstock/deduction_converter.hpp"
#include "bloomstock/logging.hpp"
#include "bloomstock/reservation_manager.hpp"

namespace bloomstock {

ProductAvailability InventoryEngine::check_availability(Id product_id, Quantity quantity) {
    return AvailabilityCalculator(db_).check_product(product_id, quantity);
}

BatchAvailability InventoryEngine::check_batch_availability(const std::vector<ItemRequest>& requests) {
    return AvailabilityCalculator(db_).check_batch(requests);
}

std::vector<OrderReservation> InventoryEngine::create_reservation(Id order_id, const std::vector<ItemRequest>& requests,
                                                                  bool validate) {
    return ReservationManager(db_).create(order_id, requests, validate);
}

int InventoryEngine::release_reservations(Id order_id) {
    return ReservationManager(db_).release(order_id);
}

std::vector<ReservationDetail> InventoryEngine::order_reservations(Id order_id) {
    return ReservationManager(db_).reservations_for(order_id);
}

std::vector<WarehouseOperation> InventoryEngine::convert_reservations_to_deductions(Id order_id) {
    return DeductionConverter(db_).convert(order_id);
}

InventorySummary InventoryEngine::inventory_summary() {
    return build_inventory_summary(db_);
}

CleanupStats InventoryEngine::cleanup_expired_reservations(int max_age_hours, bool dry_run) {
    return CleanupSweeper(db_).sweep(max_age_hours, dry_run);
}

ReservationStatistics InventoryEngine::reservation_statistics() {
    return CleanupSweeper(db_).statistics();
}

ItemAvailability InventoryEngine::item_availability(Id warehouse_item_id) {
    return AvailabilityCalculator(db_).item_availability(warehouse_item_id);
}

Quantity InventoryEngine::product_max_quantity(Id product_id) {
    return AvailabilityCalculator(db_).max_quantity(product_id);
}

std::vector<AvailabilityWarning> InventoryEngine::validate_order_items(const std::vector<ItemRequest>& requests) {
    return AvailabilityCalculator(db_).validate_items(requests);
}

StatusTransitionResult InventoryEngine::on_status_changed(Id order_id, OrderStatus old_status, OrderStatus new_status) {
    StatusTransitionResult result;
    if (old_status == new_status) return result;

    if (new_status == OrderStatus::Assembled) {
        result.action = StatusTransitionResult::Action::Deducted;
        result.operations = convert_reservations_to_deductions(order_id);
    } else if (new_status == OrderStatus::Cancelled) {
        result.action = StatusTransitionResult::Action::Released;
        result.released = release_reservations(order_id);
    }

    log_debug("engine", "status_transition_handled",
              {{"order_id", order_id},
               {"from", to_string(old_status)},
               {"to", to_string(new_status)}});
    return result;
}

}  // namespace bloomstock
