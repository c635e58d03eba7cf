#include "bloomstock/schema.hpp"

namespace bloomstock {

namespace {

constexpr const char* kSchema = R"SQL(
CREATE TABLE IF NOT EXISTS product (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    name TEXT NOT NULL,
    enabled INTEGER NOT NULL DEFAULT 1
);

CREATE TABLE IF NOT EXISTS warehouse_item (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    name TEXT NOT NULL,
    quantity INTEGER NOT NULL DEFAULT 0 CHECK (quantity >= 0),
    min_quantity INTEGER CHECK (min_quantity IS NULL OR min_quantity >= 0),
    cost_price INTEGER NOT NULL DEFAULT 0,
    retail_price INTEGER NOT NULL DEFAULT 0,
    version INTEGER NOT NULL DEFAULT 0,
    is_deleted INTEGER NOT NULL DEFAULT 0
);

CREATE TABLE IF NOT EXISTS product_recipe (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    product_id INTEGER NOT NULL REFERENCES product(id),
    warehouse_item_id INTEGER NOT NULL REFERENCES warehouse_item(id),
    quantity INTEGER NOT NULL CHECK (quantity > 0),
    is_optional INTEGER NOT NULL DEFAULT 0,
    is_deleted INTEGER NOT NULL DEFAULT 0
);
CREATE INDEX IF NOT EXISTS idx_product_recipe_product ON product_recipe(product_id);

CREATE TABLE IF NOT EXISTS orders (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    order_number TEXT NOT NULL,
    status TEXT NOT NULL DEFAULT 'new',
    created_at INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_orders_status_created ON orders(status, created_at);

CREATE TABLE IF NOT EXISTS order_item (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    order_id INTEGER NOT NULL REFERENCES orders(id),
    product_id INTEGER NOT NULL REFERENCES product(id),
    product_name TEXT NOT NULL,
    quantity INTEGER NOT NULL CHECK (quantity >= 1)
);
CREATE INDEX IF NOT EXISTS idx_order_item_order ON order_item(order_id);

CREATE TABLE IF NOT EXISTS order_reservation (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    order_id INTEGER NOT NULL REFERENCES orders(id),
    warehouse_item_id INTEGER NOT NULL REFERENCES warehouse_item(id),
    reserved_quantity INTEGER NOT NULL CHECK (reserved_quantity > 0),
    created_at INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_order_reservation_order ON order_reservation(order_id);
CREATE INDEX IF NOT EXISTS idx_order_reservation_item ON order_reservation(warehouse_item_id);

CREATE TABLE IF NOT EXISTS warehouse_operation (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    warehouse_item_id INTEGER NOT NULL REFERENCES warehouse_item(id),
    operation_type TEXT NOT NULL,
    quantity_change INTEGER NOT NULL,
    balance_after INTEGER NOT NULL CHECK (balance_after >= 0),
    description TEXT NOT NULL,
    order_id INTEGER REFERENCES orders(id),
    created_at INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_warehouse_operation_item ON warehouse_operation(warehouse_item_id);
CREATE INDEX IF NOT EXISTS idx_warehouse_operation_order ON warehouse_operation(order_id);
)SQL";

}  // anonymous namespace

void apply_schema(Database& db) {
    db.exec(kSchema);
}

}  // namespace bloomstock
