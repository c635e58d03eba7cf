#include "bloomstock/warehouse_store.hpp"
#include "bloomstock/errors.hpp"
#include <algorithm>

namespace bloomstock {

std::string WarehouseStore::item_columns(const std::string& alias) {
    const std::string p = alias.empty() ? "" : alias + ".";
    return p + "id, " + p + "name, " + p + "quantity, " + p + "min_quantity, " +
           p + "cost_price, " + p + "retail_price, " + p + "version";
}

WarehouseItem WarehouseStore::read_item(const Statement& stmt, int first_column) {
    WarehouseItem item;
    item.id = stmt.column_int64(first_column);
    item.name = stmt.column_text(first_column + 1);
    item.quantity = stmt.column_int64(first_column + 2);
    if (!stmt.column_is_null(first_column + 3)) {
        item.min_quantity = stmt.column_int64(first_column + 3);
    }
    item.cost_price = stmt.column_int64(first_column + 4);
    item.retail_price = stmt.column_int64(first_column + 5);
    item.version = stmt.column_int64(first_column + 6);
    return item;
}

std::optional<WarehouseItem> WarehouseStore::find(Id id) {
    auto stmt = db_.prepare("SELECT " + item_columns("") +
                            " FROM warehouse_item WHERE id = ? AND is_deleted = 0");
    stmt.bind(1, id);
    if (!stmt.step()) return std::nullopt;
    return read_item(stmt, 0);
}

std::vector<WarehouseItem> WarehouseStore::list() {
    auto stmt = db_.prepare("SELECT " + item_columns("") +
                            " FROM warehouse_item WHERE is_deleted = 0 ORDER BY id");
    std::vector<WarehouseItem> items;
    while (stmt.step()) {
        items.push_back(read_item(stmt, 0));
    }
    return items;
}

void WarehouseStore::lock(std::vector<Id> ids) {
    std::sort(ids.begin(), ids.end());
    ids.erase(std::unique(ids.begin(), ids.end()), ids.end());

    auto stmt = db_.prepare(
        "UPDATE warehouse_item SET version = version + 1 WHERE id = ? AND is_deleted = 0");
    for (auto id : ids) {
        stmt.reset();
        stmt.bind(1, id);
        stmt.execute();
        if (db_.changes() == 0) {
            throw NotFoundError("Warehouse item " + std::to_string(id) + " not found");
        }
    }
}

Quantity WarehouseStore::apply_delta(Id id, Quantity delta) {
    auto update = db_.prepare("UPDATE warehouse_item SET quantity = quantity + ? WHERE id = ?");
    update.bind(1, delta).bind(2, id);
    update.execute();
    if (db_.changes() == 0) {
        throw NotFoundError("Warehouse item " + std::to_string(id) + " not found");
    }

    auto select = db_.prepare("SELECT quantity FROM warehouse_item WHERE id = ?");
    select.bind(1, id);
    select.step();
    return select.column_int64(0);
}

WarehouseOperation WarehouseStore::record(WarehouseOperation operation) {
    auto stmt = db_.prepare(
        "INSERT INTO warehouse_operation (warehouse_item_id, operation_type, quantity_change, "
        "balance_after, description, order_id, created_at) VALUES (?, ?, ?, ?, ?, ?, ?)");
    stmt.bind(1, operation.warehouse_item_id)
        .bind(2, to_string(operation.type))
        .bind(3, operation.quantity_change)
        .bind(4, operation.balance_after)
        .bind(5, operation.description);
    if (operation.order_id) {
        stmt.bind(6, *operation.order_id);
    } else {
        stmt.bind_null(6);
    }
    stmt.bind(7, to_epoch_seconds(operation.created_at));
    stmt.execute();

    operation.id = db_.last_insert_rowid();
    return operation;
}

std::vector<WarehouseOperation> WarehouseStore::operations_for_order(Id order_id) {
    auto stmt = db_.prepare(
        "SELECT id, warehouse_item_id, operation_type, quantity_change, balance_after, description, "
        "order_id, created_at FROM warehouse_operation WHERE order_id = ? ORDER BY id");
    stmt.bind(1, order_id);
    return read_operations(stmt);
}

std::vector<WarehouseOperation> WarehouseStore::operations_for_item(Id warehouse_item_id) {
    auto stmt = db_.prepare(
        "SELECT id, warehouse_item_id, operation_type, quantity_change, balance_after, description, "
        "order_id, created_at FROM warehouse_operation WHERE warehouse_item_id = ? ORDER BY id");
    stmt.bind(1, warehouse_item_id);
    return read_operations(stmt);
}

std::vector<WarehouseOperation> WarehouseStore::read_operations(Statement& stmt) {
    std::vector<WarehouseOperation> operations;
    while (stmt.step()) {
        WarehouseOperation op;
        op.id = stmt.column_int64(0);
        op.warehouse_item_id = stmt.column_int64(1);
        op.type = parse_operation_type(stmt.column_text(2));
        op.quantity_change = stmt.column_int64(3);
        op.balance_after = stmt.column_int64(4);
        op.description = stmt.column_text(5);
        if (!stmt.column_is_null(6)) op.order_id = stmt.column_int64(6);
        op.created_at = from_epoch_seconds(stmt.column_int64(7));
        operations.push_back(std::move(op));
    }
    return operations;
}

}  // namespace bloomstock
