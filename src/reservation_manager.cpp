#include "bloomstock/reservation_manager.hpp"
#include "bloomstock/availability.hpp"
#include "bloomstock/bom.hpp"
#include "bloomstock/errors.hpp"
#include "bloomstock/logging.hpp"
#include "bloomstock/order_directory.hpp"
#include "bloomstock/recipe_catalog.hpp"
#include "bloomstock/reservation_ledger.hpp"
#include "bloomstock/warehouse_store.hpp"

namespace bloomstock {

std::vector<OrderReservation> ReservationManager::create(Id order_id, const std::vector<ItemRequest>& requests,
                                                         bool validate) {
    auto coalesced = coalesce(requests);

    try {
        Transaction tx(db_, TransactionMode::Immediate);
        OrderDirectory(db_).require(order_id);

        ReservationLedger ledger(db_);
        if (!ledger.for_order(order_id).empty()) {
            throw ReservationError("Reservations already exist for order " + std::to_string(order_id));
        }

        auto lines = RecipeCatalog(db_).lines_for(coalesced.product_ids());
        auto requirements = expand(as_demand(coalesced.items), lines);

        std::vector<Id> item_ids;
        for (const auto& requirement : requirements) item_ids.push_back(requirement.item.id);
        WarehouseStore(db_).lock(item_ids);

        if (validate) {
            auto availability = AvailabilityCalculator(db_).check_batch_within_transaction(requests);
            if (!availability.available) {
                auto shortfalls = availability.shortfalls();
                log_warn("reservation", "reservation_rejected",
                         {{"order_id", order_id}, {"reason", describe(shortfalls)}});
                throw InsufficientStockError("Insufficient stock: " + describe(shortfalls), std::move(shortfalls));
            }

            // Products are checked one by one; products sharing an item must also fit together.
            auto held = ledger.reserved_totals(item_ids);
            for (const auto& requirement : requirements) {
                auto it = held.find(requirement.item.id);
                Quantity effective = requirement.item.quantity - (it == held.end() ? 0 : it->second);
                if (requirement.total > effective) {
                    StockShortfall shortfall{requirement.item.id, requirement.item.name, requirement.total, effective};
                    log_warn("reservation", "reservation_rejected",
                             {{"order_id", order_id}, {"reason", describe(shortfall)}});
                    throw InsufficientStockError(shortfall);
                }
            }
        }

        auto now = std::chrono::system_clock::now();
        std::vector<OrderReservation> created;
        for (const auto& requirement : requirements) {
            created.push_back(ledger.insert(order_id, requirement.item.id, requirement.total, now));
        }
        tx.commit();

        log_info("reservation", "reservations_created",
                 {{"order_id", order_id}, {"count", created.size()}, {"validated", validate}});
        return created;
    } catch (const StorageError& e) {
        throw ReservationError(std::string("Failed to create reservations: ") + e.what(), e.is_retryable());
    }
}

int ReservationManager::release(Id order_id) {
    try {
        Transaction tx(db_, TransactionMode::Immediate);
        int released = ReservationLedger(db_).remove_for_order(order_id);
        tx.commit();

        if (released > 0) {
            log_info("reservation", "reservations_released", {{"order_id", order_id}, {"count", released}});
        }
        return released;
    } catch (const StorageError& e) {
        throw ReservationError(std::string("Failed to release reservations: ") + e.what(), e.is_retryable());
    }
}

std::vector<ReservationDetail> ReservationManager::reservations_for(Id order_id) {
    Transaction tx(db_, TransactionMode::Deferred);
    auto details = ReservationLedger(db_).for_order(order_id);
    tx.commit();
    return details;
}

}  // namespace bloomstock
