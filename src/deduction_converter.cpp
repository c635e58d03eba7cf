#include "bloomstock/deduction_converter.hpp"
#include "bloomstock/errors.hpp"
#include "bloomstock/logging.hpp"
#include "bloomstock/order_directory.hpp"
#include "bloomstock/recipe_catalog.hpp"
#include "bloomstock/reservation_ledger.hpp"
#include "bloomstock/warehouse_store.hpp"
#include <map>
#include <sstream>

namespace bloomstock {

std::vector<Deduction> plan_deductions(const DeductionSource& source, const Order& order) {
    std::vector<Deduction> deductions;

    if (const auto* held = std::get_if<FromReservations>(&source)) {
        std::map<Id, Deduction> by_item;
        for (const auto& detail : held->reservations) {
            auto& deduction = by_item[detail.reservation.warehouse_item_id];
            deduction.warehouse_item_id = detail.reservation.warehouse_item_id;
            deduction.warehouse_item_name = detail.warehouse_item_name;
            deduction.quantity += detail.reservation.reserved_quantity;
            deduction.description = "Order Assembly - #" + order.order_number + " (from reservation)";
        }
        for (auto& [item_id, deduction] : by_item) deductions.push_back(std::move(deduction));
        return deductions;
    }

    const auto& legacy = std::get<FromOrderItems>(source);
    for (const auto& requirement : legacy.requirements) {
        std::ostringstream details;
        std::ostringstream products;
        for (size_t i = 0; i < requirement.contributions.size(); ++i) {
            const auto& c = requirement.contributions[i];
            if (i > 0) {
                details << "; ";
                products << ", ";
            }
            details << c.product_name << " x" << c.order_quantity << " (needs " << c.needed << ")";
            products << c.product_name << " (x" << c.order_quantity << ")";
        }
        deductions.push_back({requirement.item.id, requirement.item.name, requirement.total,
                              "Order Assembly - #" + order.order_number + " - " + details.str(),
                              products.str()});
    }
    return deductions;
}

std::vector<WarehouseOperation> DeductionConverter::convert(Id order_id) {
    try {
        Transaction tx(db_, TransactionMode::Immediate);
        auto order = OrderDirectory(db_).require(order_id);
        auto source = load_source(order);
        auto deductions = plan_deductions(source, order);

        WarehouseStore store(db_);
        std::vector<Id> item_ids;
        for (const auto& deduction : deductions) item_ids.push_back(deduction.warehouse_item_id);
        store.lock(item_ids);

        // Stock may have moved out-of-band since the hold was taken.
        for (const auto& deduction : deductions) {
            auto item = store.find(deduction.warehouse_item_id);
            if (!item) {
                throw NotFoundError("Warehouse item " + std::to_string(deduction.warehouse_item_id) + " not found");
            }
            if (item->quantity < deduction.quantity) {
                StockShortfall shortfall{item->id, item->name, deduction.quantity, item->quantity,
                                         deduction.needed_for};
                log_warn("deduction", "deduction_aborted",
                         {{"order_id", order.id}, {"reason", describe(shortfall)}});
                throw InsufficientStockError(shortfall);
            }
        }

        auto now = std::chrono::system_clock::now();
        std::vector<WarehouseOperation> operations;
        for (const auto& deduction : deductions) {
            WarehouseOperation operation;
            operation.warehouse_item_id = deduction.warehouse_item_id;
            operation.type = OperationType::Sale;
            operation.quantity_change = -deduction.quantity;
            operation.balance_after = store.apply_delta(deduction.warehouse_item_id, -deduction.quantity);
            operation.description = deduction.description;
            operation.order_id = order.id;
            operation.created_at = now;
            operations.push_back(store.record(std::move(operation)));
        }

        if (std::holds_alternative<FromReservations>(source)) {
            ReservationLedger(db_).remove_for_order(order.id);
        }
        tx.commit();

        log_info("deduction", "order_stock_deducted",
                 {{"order_id", order.id},
                  {"order_number", order.order_number},
                  {"operations", operations.size()},
                  {"source", std::holds_alternative<FromReservations>(source) ? "reservations" : "order_items"}});
        return operations;
    } catch (const StorageError& e) {
        throw ReservationError(std::string("Failed to convert reservations to deductions: ") + e.what(),
                               e.is_retryable());
    }
}

DeductionSource DeductionConverter::load_source(const Order& order) {
    auto reservations = ReservationLedger(db_).for_order(order.id);
    if (!reservations.empty()) {
        return FromReservations{std::move(reservations)};
    }

    for (const auto& operation : WarehouseStore(db_).operations_for_order(order.id)) {
        if (operation.type == OperationType::Sale) {
            throw ReservationError("Stock for order " + order.order_number + " was already deducted");
        }
    }

    if (order.items.empty()) {
        throw ReservationError("Order " + order.order_number + " has no items to assemble");
    }

    log_warn("deduction", "no_reservations_using_order_items",
             {{"order_id", order.id}, {"order_number", order.order_number}});

    std::vector<Id> product_ids;
    for (const auto& item : order.items) product_ids.push_back(item.product_id);
    auto lines = RecipeCatalog(db_).lines_for(product_ids);
    return FromOrderItems{expand(order.items, lines)};
}

}  // namespace bloomstock
