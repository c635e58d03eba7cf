#include "bloomstock/availability.hpp"
#include "bloomstock/errors.hpp"
#include "bloomstock/logging.hpp"
#include "bloomstock/recipe_catalog.hpp"
#include "bloomstock/reservation_ledger.hpp"
#include "bloomstock/warehouse_store.hpp"
#include <algorithm>
#include <iterator>
#include <limits>
#include <unordered_set>

namespace bloomstock {

namespace {

constexpr const char* kUnknownProductName = "Unknown Product";

AvailabilityWarning shortfall_for(const ProductAvailability& availability, const Product* product) {
    AvailabilityWarning warning;
    warning.product_id = availability.product_id;
    warning.product_name = availability.product_name;
    warning.requested = availability.quantity_requested;
    warning.max_available = availability.max_quantity;

    if (!product) {
        warning.kind = AvailabilityWarning::Kind::ProductNotFound;
    } else if (!product->enabled) {
        warning.kind = AvailabilityWarning::Kind::ProductDisabled;
    } else if (availability.max_quantity > 0) {
        warning.kind = AvailabilityWarning::Kind::InsufficientStock;
    } else {
        warning.kind = AvailabilityWarning::Kind::OutOfStock;
    }
    return warning;
}

}  // anonymous namespace

std::vector<AvailabilityWarning> BatchAvailability::shortfalls() const {
    std::vector<AvailabilityWarning> result;
    std::copy_if(warnings.begin(), warnings.end(), std::back_inserter(result),
                 [](const AvailabilityWarning& w) { return w.is_shortfall(); });
    return result;
}

ProductAvailability evaluate_product(Id product_id, const Product* product, Quantity requested,
                                     const std::vector<RecipeLine>& lines,
                                     const std::unordered_map<Id, Quantity>& reserved) {
    ProductAvailability result;
    result.product_id = product_id;
    result.quantity_requested = requested;

    if (!product) {
        result.product_name = kUnknownProductName;
        return result;
    }
    result.product_name = product->name;
    if (!product->enabled) return result;

    if (lines.empty()) {
        result.available = true;
        result.max_quantity = kUnconstrainedCeiling;
        return result;
    }

    Quantity max_quantity = std::numeric_limits<Quantity>::max();
    bool constrained = false;
    bool all_sufficient = true;

    for (const auto& line : lines) {
        auto it = reserved.find(line.item.id);
        Quantity reserved_quantity = it == reserved.end() ? 0 : it->second;
        Quantity effective = line.item.quantity - reserved_quantity;
        Quantity required = checked_multiply(line.quantity_per_unit, requested);
        bool sufficient = effective >= required || line.optional;

        if (!line.optional) {
            Quantity for_line = effective > 0 ? effective / line.quantity_per_unit : 0;
            max_quantity = std::min(max_quantity, for_line);
            constrained = true;
            if (!sufficient) all_sufficient = false;
        }

        result.ingredients.push_back(
            {line.item.id, line.item.name, required, effective, reserved_quantity, sufficient, line.optional});
    }

    // Only optional lines: nothing gates this product.
    result.max_quantity = constrained ? max_quantity : kUnconstrainedCeiling;
    result.available = all_sufficient && result.max_quantity >= requested;
    return result;
}

ProductAvailability AvailabilityCalculator::check_product(Id product_id, Quantity quantity) {
    if (quantity <= 0) throw InvalidArgumentError("Requested quantity must be positive");

    Transaction tx(db_, TransactionMode::Deferred);
    RecipeCatalog catalog(db_);

    auto product = catalog.find_product(product_id);
    std::vector<RecipeLine> lines;
    std::unordered_map<Id, Quantity> reserved;
    if (product && product->enabled) {
        lines = catalog.lines_for(product_id);
        std::vector<Id> item_ids;
        for (const auto& line : lines) item_ids.push_back(line.item.id);
        reserved = ReservationLedger(db_).reserved_totals(item_ids);
    }
    tx.commit();

    return evaluate_product(product_id, product ? &*product : nullptr, quantity, lines, reserved);
}

BatchAvailability AvailabilityCalculator::check_batch(const std::vector<ItemRequest>& requests) {
    Transaction tx(db_, TransactionMode::Deferred);
    auto result = check_batch_within_transaction(requests);
    tx.commit();
    return result;
}

BatchAvailability AvailabilityCalculator::check_batch_within_transaction(const std::vector<ItemRequest>& requests) {
    BatchAvailability result;
    if (requests.empty()) return result;

    auto coalesced = coalesce(requests);
    for (auto product_id : coalesced.duplicates) {
        AvailabilityWarning warning;
        warning.kind = AvailabilityWarning::Kind::DuplicateProduct;
        warning.product_id = product_id;
        result.warnings.push_back(warning);
        log_warn("availability", "duplicate_product_in_request", {{"product_id", product_id}});
    }

    auto product_ids = coalesced.product_ids();
    RecipeCatalog catalog(db_);
    auto products = catalog.find_products(product_ids);
    auto lines = catalog.lines_for(product_ids);

    std::unordered_set<Id> item_id_set;
    for (const auto& [product_id, product_lines] : lines) {
        for (const auto& line : product_lines) item_id_set.insert(line.item.id);
    }
    std::vector<Id> item_ids(item_id_set.begin(), item_id_set.end());
    auto reserved = ReservationLedger(db_).reserved_totals(item_ids);

    static const std::vector<RecipeLine> kNoLines;
    for (const auto& request : coalesced.items) {
        auto product_it = products.find(request.product_id);
        const Product* product = product_it == products.end() ? nullptr : &product_it->second;
        auto lines_it = lines.find(request.product_id);
        const auto& product_lines = lines_it == lines.end() ? kNoLines : lines_it->second;

        auto availability = evaluate_product(request.product_id, product, request.quantity, product_lines, reserved);
        if (!availability.available) {
            result.available = false;
            result.warnings.push_back(shortfall_for(availability, product));
        }
        result.items.push_back(std::move(availability));
    }
    return result;
}

ItemAvailability AvailabilityCalculator::item_availability(Id warehouse_item_id) {
    Transaction tx(db_, TransactionMode::Deferred);
    auto item = WarehouseStore(db_).find(warehouse_item_id);
    if (!item) {
        throw NotFoundError("Warehouse item " + std::to_string(warehouse_item_id) + " not found");
    }
    auto reserved = ReservationLedger(db_).reserved_totals({warehouse_item_id});
    tx.commit();

    ItemAvailability result;
    result.warehouse_item_id = item->id;
    result.name = item->name;
    result.total = item->quantity;
    auto it = reserved.find(warehouse_item_id);
    result.reserved = it == reserved.end() ? 0 : it->second;
    result.available = result.total - result.reserved;
    return result;
}

Quantity AvailabilityCalculator::max_quantity(Id product_id) {
    return check_product(product_id, 1).max_quantity;
}

std::vector<AvailabilityWarning> AvailabilityCalculator::validate_items(const std::vector<ItemRequest>& requests) {
    auto batch = check_batch(requests);
    if (batch.available) return {};
    return batch.shortfalls();
}

}  // namespace bloomstock
