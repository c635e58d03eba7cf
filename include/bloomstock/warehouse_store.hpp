#pragma once

#include <optional>
#include <vector>
#include "bloomstock/database.hpp"
#include "bloomstock/types.hpp"

namespace bloomstock {

/**
 * Authoritative on-hand quantities and the append-only operation log.
 */
class WarehouseStore {
public:
    /// Column list matching read_item(); prefix with a table alias when joining.
    static std::string item_columns(const std::string& alias);
    static WarehouseItem read_item(const Statement& stmt, int first_column);

    explicit WarehouseStore(Database& db) : db_(db) {}

    std::optional<WarehouseItem> find(Id id);
    std::vector<WarehouseItem> list();

    /**
     * Take the write position on each item, in ascending id order.
     * Bumps the version column; throws NotFoundError if an item is missing.
     * Must run inside an immediate transaction.
     */
    void lock(std::vector<Id> ids);

    /// Add delta to on-hand stock and return the resulting balance.
    Quantity apply_delta(Id id, Quantity delta);

    /// Append an audit row and return it with its id assigned.
    WarehouseOperation record(WarehouseOperation operation);

    std::vector<WarehouseOperation> operations_for_order(Id order_id);
    std::vector<WarehouseOperation> operations_for_item(Id warehouse_item_id);

private:
    std::vector<WarehouseOperation> read_operations(Statement& stmt);

    Database& db_;
};

}  // namespace bloomstock
