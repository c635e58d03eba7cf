#pragma once

#include <unordered_map>
#include <vector>
#include "bloomstock/bom.hpp"
#include "bloomstock/database.hpp"
#include "bloomstock/shortfall.hpp"
#include "bloomstock/types.hpp"

namespace bloomstock {

struct IngredientAvailability {
    Id warehouse_item_id = 0;
    std::string name;
    Quantity required = 0;
    /// Effective availability: on hand minus reserved by all orders.
    Quantity available = 0;
    Quantity reserved = 0;
    bool sufficient = false;
    bool optional = false;
};

struct ProductAvailability {
    Id product_id = 0;
    std::string product_name;
    Quantity quantity_requested = 0;
    bool available = false;
    Quantity max_quantity = 0;
    std::vector<IngredientAvailability> ingredients;
};

struct BatchAvailability {
    bool available = true;
    std::vector<ProductAvailability> items;
    std::vector<AvailabilityWarning> warnings;

    /// Warnings that make the batch unavailable (everything except duplicates).
    std::vector<AvailabilityWarning> shortfalls() const;
};

struct ItemAvailability {
    Id warehouse_item_id = 0;
    std::string name;
    Quantity total = 0;
    Quantity reserved = 0;
    Quantity available = 0;
};

/**
 * Evaluate one product against already-loaded data.
 * product is null when the id is unknown.
 */
ProductAvailability evaluate_product(Id product_id, const Product* product, Quantity requested,
                                     const std::vector<RecipeLine>& lines,
                                     const std::unordered_map<Id, Quantity>& reserved);

/**
 * Read-only availability checks. Never writes and never throws
 * InsufficientStockError; shortfalls are reported as data.
 */
class AvailabilityCalculator {
public:
    explicit AvailabilityCalculator(Database& db) : db_(db) {}

    ProductAvailability check_product(Id product_id, Quantity quantity);

    BatchAvailability check_batch(const std::vector<ItemRequest>& requests);

    /// check_batch() for a caller that already holds a transaction.
    BatchAvailability check_batch_within_transaction(const std::vector<ItemRequest>& requests);

    /// On-hand, reserved and effective quantity of one warehouse item.
    ItemAvailability item_availability(Id warehouse_item_id);

    /// Largest producible quantity of a product right now.
    Quantity max_quantity(Id product_id);

    /// Shortfall warnings for a batch, empty when everything is available.
    std::vector<AvailabilityWarning> validate_items(const std::vector<ItemRequest>& requests);

private:
    Database& db_;
};

}  // namespace bloomstock
