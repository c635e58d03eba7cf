#include "bloomstock/types.hpp"
#include "bloomstock/errors.hpp"

namespace bloomstock {

std::string to_string(OrderStatus status) {
    switch (status) {
        case OrderStatus::New: return "new";
        case OrderStatus::Paid: return "paid";
        case OrderStatus::Accepted: return "accepted";
        case OrderStatus::Assembled: return "assembled";
        case OrderStatus::InDelivery: return "in_delivery";
        case OrderStatus::Delivered: return "delivered";
        case OrderStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

std::string to_string(OperationType type) {
    switch (type) {
        case OperationType::Sale: return "sale";
        case OperationType::Delivery: return "delivery";
        case OperationType::Writeoff: return "writeoff";
        case OperationType::PriceChange: return "price_change";
        case OperationType::Inventory: return "inventory";
    }
    return "unknown";
}

OrderStatus parse_order_status(const std::string& value) {
    if (value == "new") return OrderStatus::New;
    if (value == "paid") return OrderStatus::Paid;
    if (value == "accepted") return OrderStatus::Accepted;
    if (value == "assembled") return OrderStatus::Assembled;
    if (value == "in_delivery") return OrderStatus::InDelivery;
    if (value == "delivered") return OrderStatus::Delivered;
    if (value == "cancelled") return OrderStatus::Cancelled;
    throw InvalidArgumentError("Unknown order status: " + value);
}

OperationType parse_operation_type(const std::string& value) {
    if (value == "sale") return OperationType::Sale;
    if (value == "delivery") return OperationType::Delivery;
    if (value == "writeoff") return OperationType::Writeoff;
    if (value == "price_change") return OperationType::PriceChange;
    if (value == "inventory") return OperationType::Inventory;
    throw InvalidArgumentError("Unknown warehouse operation type: " + value);
}

int64_t to_epoch_seconds(Timestamp tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

Timestamp from_epoch_seconds(int64_t seconds) {
    return Timestamp(std::chrono::seconds(seconds));
}

}  // namespace bloomstock
