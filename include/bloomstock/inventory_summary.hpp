#pragma once

#include <optional>
#include <vector>
#include "bloomstock/database.hpp"
#include "bloomstock/types.hpp"

namespace bloomstock {

struct InventoryItemSummary {
    Id id = 0;
    std::string name;
    Quantity total_quantity = 0;
    Quantity reserved_quantity = 0;
    Quantity available_quantity = 0;
    std::optional<Quantity> min_quantity;
    bool is_low_stock = false;
    Money cost_price = 0;
    Money retail_price = 0;
    Money total_value = 0;
};

struct InventorySummary {
    int total_items = 0;
    Money total_stock_value = 0;
    int low_stock_items = 0;
    int items_with_reservations = 0;
    Quantity total_reserved_quantity = 0;
    std::vector<InventoryItemSummary> items;
};

/// Stock, reservation and valuation report over every live warehouse item.
InventorySummary build_inventory_summary(Database& db);

}  // namespace bloomstock
