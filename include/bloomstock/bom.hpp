#pragma once

#include <unordered_map>
#include <vector>
#include "bloomstock/types.hpp"

namespace bloomstock {

using LinesByProduct = std::unordered_map<Id, std::vector<RecipeLine>>;

/// Overflow-checked quantity arithmetic; throws InvalidArgumentError instead of wrapping.
Quantity checked_add(Quantity a, Quantity b);
Quantity checked_multiply(Quantity a, Quantity b);

/// Item requests with duplicate products merged.
struct CoalescedRequests {
    /// One entry per product, in first-seen order, quantities summed.
    std::vector<ItemRequest> items;
    /// Product id of every repeated occurrence.
    std::vector<Id> duplicates;

    std::vector<Id> product_ids() const;
};

/**
 * Merge duplicate products by summing their quantities.
 * Throws InvalidArgumentError for a non-positive quantity.
 */
CoalescedRequests coalesce(const std::vector<ItemRequest>& requests);

/// One product's share of a warehouse item requirement.
struct Contribution {
    Id product_id = 0;
    std::string product_name;
    Quantity order_quantity = 0;
    Quantity per_unit = 0;
    Quantity needed = 0;
};

/// Total quantity of one warehouse item consumed by a set of products.
struct Requirement {
    WarehouseItem item;
    Quantity total = 0;
    std::vector<Contribution> contributions;
};

/**
 * BOM-expand product demand into per-item requirements, ordered by item id.
 * Optional lines and products without recipe lines contribute nothing.
 */
std::vector<Requirement> expand(const std::vector<OrderItem>& demand, const LinesByProduct& lines);

std::vector<OrderItem> as_demand(const std::vector<ItemRequest>& requests);

}  // namespace bloomstock
