#include "bloomstock/shortfall.hpp"
#include <sstream>

namespace bloomstock {

std::string describe(const AvailabilityWarning& warning) {
    std::ostringstream ss;
    switch (warning.kind) {
        case AvailabilityWarning::Kind::DuplicateProduct:
            ss << "Duplicate product " << warning.product_id << " found in order, quantities combined";
            break;
        case AvailabilityWarning::Kind::ProductNotFound:
            ss << "Product " << warning.product_id << " not found";
            break;
        case AvailabilityWarning::Kind::ProductDisabled:
            ss << "Product '" << warning.product_name << "' is disabled";
            break;
        case AvailabilityWarning::Kind::InsufficientStock:
            ss << "Product '" << warning.product_name << "' requested: " << warning.requested
               << ", maximum available: " << warning.max_available;
            break;
        case AvailabilityWarning::Kind::OutOfStock:
            ss << "Product '" << warning.product_name << "' is out of stock";
            break;
    }
    return ss.str();
}

std::string describe(const StockShortfall& shortfall) {
    std::ostringstream ss;
    ss << "Insufficient stock for " << shortfall.warehouse_item_name
       << ". Required: " << shortfall.required << ", Available: " << shortfall.available;
    if (!shortfall.needed_for.empty()) ss << ". Needed for products: " << shortfall.needed_for;
    return ss.str();
}

std::string describe(const std::vector<AvailabilityWarning>& warnings) {
    std::string joined;
    for (const auto& warning : warnings) {
        if (!joined.empty()) joined += "; ";
        joined += describe(warning);
    }
    return joined;
}

}  // namespace bloomstock
