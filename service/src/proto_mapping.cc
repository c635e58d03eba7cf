#include "proto_mapping.hpp"
#include "bloomstock/shortfall.hpp"

namespace bloomstock {

namespace {

void set_timestamp(Timestamp tp, google::protobuf::Timestamp* out) {
    out->set_seconds(to_epoch_seconds(tp));
    out->set_nanos(0);
}

v1::AvailabilityWarning::Kind kind_to_proto(AvailabilityWarning::Kind kind) {
    switch (kind) {
        case AvailabilityWarning::Kind::DuplicateProduct:
            return v1::AvailabilityWarning::DUPLICATE_PRODUCT;
        case AvailabilityWarning::Kind::ProductNotFound:
            return v1::AvailabilityWarning::PRODUCT_NOT_FOUND;
        case AvailabilityWarning::Kind::ProductDisabled:
            return v1::AvailabilityWarning::PRODUCT_DISABLED;
        case AvailabilityWarning::Kind::InsufficientStock:
            return v1::AvailabilityWarning::INSUFFICIENT_STOCK;
        case AvailabilityWarning::Kind::OutOfStock:
            return v1::AvailabilityWarning::OUT_OF_STOCK;
    }
    return v1::AvailabilityWarning::KIND_UNSPECIFIED;
}

}  // namespace

std::vector<ItemRequest> from_proto(const google::protobuf::RepeatedPtrField<v1::ItemRequest>& items) {
    std::vector<ItemRequest> requests;
    requests.reserve(items.size());
    for (const auto& item : items) {
        requests.push_back(ItemRequest{item.product_id(), item.quantity()});
    }
    return requests;
}

void to_proto(const ProductAvailability& in, v1::ProductAvailability* out) {
    out->set_product_id(in.product_id);
    out->set_product_name(in.product_name);
    out->set_quantity_requested(in.quantity_requested);
    out->set_available(in.available);
    out->set_max_quantity(in.max_quantity);
    for (const auto& ingredient : in.ingredients) {
        auto* row = out->add_ingredients();
        row->set_warehouse_item_id(ingredient.warehouse_item_id);
        row->set_name(ingredient.name);
        row->set_required(ingredient.required);
        row->set_available(ingredient.available);
        row->set_reserved(ingredient.reserved);
        row->set_sufficient(ingredient.sufficient);
        row->set_optional(ingredient.optional);
    }
}

void to_proto(const AvailabilityWarning& in, v1::AvailabilityWarning* out) {
    out->set_kind(kind_to_proto(in.kind));
    out->set_product_id(in.product_id);
    out->set_product_name(in.product_name);
    out->set_requested(in.requested);
    out->set_max_available(in.max_available);
    out->set_message(describe(in));
}

void to_proto(const BatchAvailability& in, v1::BatchAvailability* out) {
    out->set_available(in.available);
    for (const auto& item : in.items) to_proto(item, out->add_items());
    for (const auto& warning : in.warnings) to_proto(warning, out->add_warnings());
}

void to_proto(const ItemAvailability& in, v1::ItemAvailability* out) {
    out->set_warehouse_item_id(in.warehouse_item_id);
    out->set_name(in.name);
    out->set_total(in.total);
    out->set_reserved(in.reserved);
    out->set_available(in.available);
}

void to_proto(const ReservationDetail& in, v1::Reservation* out) {
    out->set_id(in.reservation.id);
    out->set_order_id(in.reservation.order_id);
    out->set_warehouse_item_id(in.reservation.warehouse_item_id);
    out->set_warehouse_item_name(in.warehouse_item_name);
    out->set_reserved_quantity(in.reservation.reserved_quantity);
    set_timestamp(in.reservation.created_at, out->mutable_created_at());
}

void to_proto(const WarehouseOperation& in, v1::WarehouseOperation* out) {
    out->set_id(in.id);
    out->set_warehouse_item_id(in.warehouse_item_id);
    out->set_operation_type(to_string(in.type));
    out->set_quantity_change(in.quantity_change);
    out->set_balance_after(in.balance_after);
    out->set_description(in.description);
    if (in.order_id) out->set_order_id(*in.order_id);
    set_timestamp(in.created_at, out->mutable_created_at());
}

void to_proto(const StatusTransitionResult& in, v1::OrderStatusChangedResponse* out) {
    switch (in.action) {
        case StatusTransitionResult::Action::None:
            out->set_action(v1::OrderStatusChangedResponse::NONE);
            break;
        case StatusTransitionResult::Action::Deducted:
            out->set_action(v1::OrderStatusChangedResponse::DEDUCTED);
            break;
        case StatusTransitionResult::Action::Released:
            out->set_action(v1::OrderStatusChangedResponse::RELEASED);
            break;
    }
    for (const auto& op : in.operations) to_proto(op, out->add_operations());
    out->set_released(in.released);
}

void to_proto(const InventorySummary& in, v1::InventorySummary* out) {
    out->set_total_items(in.total_items);
    out->set_total_stock_value(in.total_stock_value);
    out->set_low_stock_items(in.low_stock_items);
    out->set_items_with_reservations(in.items_with_reservations);
    out->set_total_reserved_quantity(in.total_reserved_quantity);
    for (const auto& item : in.items) {
        auto* row = out->add_items();
        row->set_id(item.id);
        row->set_name(item.name);
        row->set_total_quantity(item.total_quantity);
        row->set_reserved_quantity(item.reserved_quantity);
        row->set_available_quantity(item.available_quantity);
        if (item.min_quantity) row->set_min_quantity(*item.min_quantity);
        row->set_is_low_stock(item.is_low_stock);
        row->set_cost_price(item.cost_price);
        row->set_retail_price(item.retail_price);
        row->set_total_value(item.total_value);
    }
}

void to_proto(const CleanupStats& in, v1::CleanupStats* out) {
    out->set_orders_found(in.orders_found);
    out->set_reservations_found(in.reservations_found);
    out->set_reservations_deleted(in.reservations_deleted);
}

void to_proto(const ReservationStatistics& in, v1::ReservationStatistics* out) {
    out->set_total(in.total);
    auto* by_status = out->mutable_by_order_status();
    for (const auto& [status, count] : in.by_order_status) (*by_status)[status] = count;
    out->set_under_one_hour(in.under_one_hour);
    out->set_one_to_24_hours(in.one_to_24_hours);
    out->set_one_to_7_days(in.one_to_7_days);
    out->set_over_7_days(in.over_7_days);
}

}  // namespace bloomstock
