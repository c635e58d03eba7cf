#include "bloomstock/bom.hpp"
#include "bloomstock/errors.hpp"
#include <limits>
#include <map>

namespace bloomstock {

namespace {

[[noreturn]] void throw_overflow(Quantity a, Quantity b, const char* op) {
    throw InvalidArgumentError("Quantity out of range: " + std::to_string(a) + " " + op + " " +
                               std::to_string(b));
}

}  // anonymous namespace

Quantity checked_add(Quantity a, Quantity b) {
    constexpr Quantity kMax = std::numeric_limits<Quantity>::max();
    constexpr Quantity kMin = std::numeric_limits<Quantity>::min();
    if ((b > 0 && a > kMax - b) || (b < 0 && a < kMin - b)) throw_overflow(a, b, "+");
    return a + b;
}

Quantity checked_multiply(Quantity a, Quantity b) {
    // Both operands are non-negative quantities.
    if (a < 0 || b < 0) throw_overflow(a, b, "*");
    if (a != 0 && b > std::numeric_limits<Quantity>::max() / a) throw_overflow(a, b, "*");
    return a * b;
}

std::vector<Id> CoalescedRequests::product_ids() const {
    std::vector<Id> ids;
    ids.reserve(items.size());
    for (const auto& item : items) ids.push_back(item.product_id);
    return ids;
}

CoalescedRequests coalesce(const std::vector<ItemRequest>& requests) {
    CoalescedRequests result;
    std::unordered_map<Id, size_t> position;

    for (const auto& request : requests) {
        if (request.quantity <= 0) {
            throw InvalidArgumentError("Quantity for product " + std::to_string(request.product_id) +
                                       " must be positive");
        }
        auto it = position.find(request.product_id);
        if (it == position.end()) {
            position.emplace(request.product_id, result.items.size());
            result.items.push_back(request);
        } else {
            auto& merged = result.items[it->second];
            merged.quantity = checked_add(merged.quantity, request.quantity);
            result.duplicates.push_back(request.product_id);
        }
    }
    return result;
}

std::vector<Requirement> expand(const std::vector<OrderItem>& demand, const LinesByProduct& lines) {
    std::map<Id, Requirement> by_item;

    for (const auto& entry : demand) {
        auto it = lines.find(entry.product_id);
        if (it == lines.end()) continue;

        for (const auto& line : it->second) {
            if (line.optional) continue;

            Quantity needed = checked_multiply(line.quantity_per_unit, entry.quantity);
            auto& requirement = by_item[line.item.id];
            requirement.item = line.item;
            requirement.total = checked_add(requirement.total, needed);
            requirement.contributions.push_back(
                {entry.product_id, entry.product_name, entry.quantity, line.quantity_per_unit, needed});
        }
    }

    std::vector<Requirement> requirements;
    requirements.reserve(by_item.size());
    for (auto& [item_id, requirement] : by_item) {
        if (requirement.total > 0) requirements.push_back(std::move(requirement));
    }
    return requirements;
}

std::vector<OrderItem> as_demand(const std::vector<ItemRequest>& requests) {
    std::vector<OrderItem> demand;
    demand.reserve(requests.size());
    for (const auto& request : requests) {
        demand.push_back({request.product_id, "", request.quantity});
    }
    return demand;
}

}  // namespace bloomstock
