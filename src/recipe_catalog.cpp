#include "bloomstock/recipe_catalog.hpp"
#include "bloomstock/warehouse_store.hpp"

namespace bloomstock {

std::optional<Product> RecipeCatalog::find_product(Id product_id) {
    auto products = find_products({product_id});
    auto it = products.find(product_id);
    if (it == products.end()) return std::nullopt;
    return it->second;
}

std::unordered_map<Id, Product> RecipeCatalog::find_products(const std::vector<Id>& product_ids) {
    std::unordered_map<Id, Product> products;
    if (product_ids.empty()) return products;

    auto stmt = db_.prepare("SELECT id, name, enabled FROM product WHERE id IN (" +
                            placeholders(product_ids.size()) + ")");
    stmt.bind_all(1, product_ids);
    while (stmt.step()) {
        Product product;
        product.id = stmt.column_int64(0);
        product.name = stmt.column_text(1);
        product.enabled = stmt.column_int64(2) != 0;
        products.emplace(product.id, std::move(product));
    }
    return products;
}

std::vector<RecipeLine> RecipeCatalog::lines_for(Id product_id) {
    auto lines = lines_for(std::vector<Id>{product_id});
    auto it = lines.find(product_id);
    if (it == lines.end()) return {};
    return std::move(it->second);
}

std::unordered_map<Id, std::vector<RecipeLine>> RecipeCatalog::lines_for(const std::vector<Id>& product_ids) {
    std::unordered_map<Id, std::vector<RecipeLine>> lines;
    if (product_ids.empty()) return lines;

    auto stmt = db_.prepare(
        "SELECT r.product_id, r.quantity, r.is_optional, " + WarehouseStore::item_columns("w") +
        " FROM product_recipe r JOIN warehouse_item w ON w.id = r.warehouse_item_id"
        " WHERE r.is_deleted = 0 AND w.is_deleted = 0 AND r.product_id IN (" +
        placeholders(product_ids.size()) + ") ORDER BY r.product_id, r.id");
    stmt.bind_all(1, product_ids);
    while (stmt.step()) {
        RecipeLine line;
        line.product_id = stmt.column_int64(0);
        line.quantity_per_unit = stmt.column_int64(1);
        line.optional = stmt.column_int64(2) != 0;
        line.item = WarehouseStore::read_item(stmt, 3);
        lines[line.product_id].push_back(std::move(line));
    }
    return lines;
}

}  // namespace bloomstock
