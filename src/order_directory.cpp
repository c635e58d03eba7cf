#include "bloomstock/order_directory.hpp"
#include "bloomstock/errors.hpp"

namespace bloomstock {

std::optional<Order> OrderDirectory::find(Id order_id) {
    auto header = db_.prepare("SELECT id, order_number, status, created_at FROM orders WHERE id = ?");
    header.bind(1, order_id);
    if (!header.step()) return std::nullopt;

    Order order;
    order.id = header.column_int64(0);
    order.order_number = header.column_text(1);
    order.status = parse_order_status(header.column_text(2));
    order.created_at = from_epoch_seconds(header.column_int64(3));

    auto items = db_.prepare(
        "SELECT product_id, product_name, quantity FROM order_item WHERE order_id = ? ORDER BY id");
    items.bind(1, order_id);
    while (items.step()) {
        order.items.push_back({items.column_int64(0), items.column_text(1), items.column_int64(2)});
    }
    return order;
}

Order OrderDirectory::require(Id order_id) {
    auto order = find(order_id);
    if (!order) throw NotFoundError("Order " + std::to_string(order_id) + " not found");
    return std::move(*order);
}

}  // namespace bloomstock
