#pragma once

#include <optional>
#include <unordered_map>
#include <vector>
#include "bloomstock/database.hpp"
#include "bloomstock/types.hpp"

namespace bloomstock {

/**
 * Read-only product and BOM lookups.
 */
class RecipeCatalog {
public:
    explicit RecipeCatalog(Database& db) : db_(db) {}

    std::optional<Product> find_product(Id product_id);
    std::unordered_map<Id, Product> find_products(const std::vector<Id>& product_ids);

    /// Live recipe lines of one product joined to live warehouse items, ordered by line id.
    std::vector<RecipeLine> lines_for(Id product_id);

    /// Same as lines_for() for a set of products, in one query.
    std::unordered_map<Id, std::vector<RecipeLine>> lines_for(const std::vector<Id>& product_ids);

private:
    Database& db_;
};

}  // namespace bloomstock
