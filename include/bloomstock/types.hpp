#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace bloomstock {

using Id = int64_t;
using Quantity = int64_t;
using Money = int64_t;
using Timestamp = std::chrono::system_clock::time_point;

/// Ceiling reported for products that have no recipe lines.
constexpr Quantity kUnconstrainedCeiling = 9999;

/// Threshold used when a warehouse item has no minimum quantity set.
constexpr Quantity kDefaultMinQuantity = 10;

/// Order lifecycle states, owned by the external order state machine.
enum class OrderStatus { New, Paid, Accepted, Assembled, InDelivery, Delivered, Cancelled };

enum class OperationType { Sale, Delivery, Writeoff, PriceChange, Inventory };

std::string to_string(OrderStatus status);
std::string to_string(OperationType type);
OrderStatus parse_order_status(const std::string& value);
OperationType parse_operation_type(const std::string& value);

struct WarehouseItem {
    Id id = 0;
    std::string name;
    Quantity quantity = 0;
    std::optional<Quantity> min_quantity;
    Money cost_price = 0;
    Money retail_price = 0;
    int64_t version = 0;

    // A minimum of 0 counts as unset.
    Quantity low_stock_threshold() const {
        return min_quantity && *min_quantity > 0 ? *min_quantity : kDefaultMinQuantity;
    }
};

struct Product {
    Id id = 0;
    std::string name;
    bool enabled = true;
};

/// One BOM line joined to the warehouse item it consumes.
struct RecipeLine {
    Id product_id = 0;
    Quantity quantity_per_unit = 0;
    bool optional = false;
    WarehouseItem item;
};

struct OrderItem {
    Id product_id = 0;
    std::string product_name;
    Quantity quantity = 0;
};

struct Order {
    Id id = 0;
    std::string order_number;
    OrderStatus status = OrderStatus::New;
    Timestamp created_at;
    std::vector<OrderItem> items;
};

struct OrderReservation {
    Id id = 0;
    Id order_id = 0;
    Id warehouse_item_id = 0;
    Quantity reserved_quantity = 0;
    Timestamp created_at;
};

/// Reservation row joined with the warehouse item it holds.
struct ReservationDetail {
    OrderReservation reservation;
    std::string warehouse_item_name;
};

struct WarehouseOperation {
    Id id = 0;
    Id warehouse_item_id = 0;
    OperationType type = OperationType::Sale;
    Quantity quantity_change = 0;
    Quantity balance_after = 0;
    std::string description;
    std::optional<Id> order_id;
    Timestamp created_at;
};

struct ItemRequest {
    Id product_id = 0;
    Quantity quantity = 0;
};

int64_t to_epoch_seconds(Timestamp tp);
Timestamp from_epoch_seconds(int64_t seconds);

}  // namespace bloomstock
