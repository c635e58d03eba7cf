#pragma once

#include <optional>
#include "bloomstock/database.hpp"
#include "bloomstock/types.hpp"

namespace bloomstock {

/**
 * Read-only view of orders owned by the order state machine.
 */
class OrderDirectory {
public:
    explicit OrderDirectory(Database& db) : db_(db) {}

    /// Order header and line items, or nullopt if the id is unknown.
    std::optional<Order> find(Id order_id);

    /// Same as find() but throws NotFoundError.
    Order require(Id order_id);

private:
    Database& db_;
};

}  // namespace bloomstock
