#include "bloomstock/inventory_summary.hpp"
#include "bloomstock/reservation_ledger.hpp"
#include "bloomstock/warehouse_store.hpp"

namespace bloomstock {

InventorySummary build_inventory_summary(Database& db) {
    Transaction tx(db, TransactionMode::Deferred);
    auto items = WarehouseStore(db).list();
    auto reserved = ReservationLedger(db).reserved_totals();
    tx.commit();

    InventorySummary summary;
    summary.total_items = static_cast<int>(items.size());

    for (const auto& item : items) {
        auto it = reserved.find(item.id);
        Quantity reserved_quantity = it == reserved.end() ? 0 : it->second;

        InventoryItemSummary detail;
        detail.id = item.id;
        detail.name = item.name;
        detail.total_quantity = item.quantity;
        detail.reserved_quantity = reserved_quantity;
        detail.available_quantity = item.quantity - reserved_quantity;
        detail.min_quantity = item.min_quantity;
        detail.is_low_stock = detail.available_quantity <= item.low_stock_threshold();
        detail.cost_price = item.cost_price;
        detail.retail_price = item.retail_price;
        detail.total_value = item.quantity * item.cost_price;

        summary.total_stock_value += detail.total_value;
        summary.total_reserved_quantity += reserved_quantity;
        if (reserved_quantity > 0) summary.items_with_reservations++;
        if (detail.is_low_stock) summary.low_stock_items++;
        summary.items.push_back(std::move(detail));
    }
    return summary;
}

}  // namespace bloomstock
