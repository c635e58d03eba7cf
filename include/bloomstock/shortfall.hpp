#pragma once

#include <string>
#include <vector>
#include "bloomstock/types.hpp"

namespace bloomstock {

/**
 * A structured availability warning.
 *
 * Batch checks report problems as values; callers format them for display
 * with describe().
 */
struct AvailabilityWarning {
    enum class Kind { DuplicateProduct, ProductNotFound, ProductDisabled, InsufficientStock, OutOfStock };

    Kind kind = Kind::InsufficientStock;
    Id product_id = 0;
    std::string product_name;
    Quantity requested = 0;
    Quantity max_available = 0;

    /// True for warnings that make a batch unavailable.
    bool is_shortfall() const { return kind != Kind::DuplicateProduct; }
};

/**
 * A warehouse item that cannot cover a committed deduction.
 */
struct StockShortfall {
    Id warehouse_item_id = 0;
    std::string warehouse_item_name;
    Quantity required = 0;
    Quantity available = 0;
    /// Products drawing on the item, e.g. "Rose bouquet (x2), Mix (x1)". Empty when unknown.
    std::string needed_for;
};

std::string describe(const AvailabilityWarning& warning);
std::string describe(const StockShortfall& shortfall);

/// Human-readable rendering of every warning, joined with "; ".
std::string describe(const std::vector<AvailabilityWarning>& warnings);

}  // namespace bloomstock
