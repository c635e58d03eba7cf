#pragma once

#include <map>
#include <string>
#include "bloomstock/database.hpp"
#include "bloomstock/types.hpp"

namespace bloomstock {

constexpr int kDefaultCleanupMaxAgeHours = 72;

struct CleanupStats {
    int orders_found = 0;
    int reservations_found = 0;
    int reservations_deleted = 0;
};

struct ReservationStatistics {
    int total = 0;
    /// Reservation count keyed by order status name.
    std::map<std::string, int> by_order_status;
    int under_one_hour = 0;
    int one_to_24_hours = 0;
    int one_to_7_days = 0;
    int over_7_days = 0;
};

/**
 * Backstop that reclaims holds of abandoned orders: orders older than the
 * threshold whose status is new (unpaid) or cancelled.
 */
class CleanupSweeper {
public:
    explicit CleanupSweeper(Database& db) : db_(db) {}

    CleanupStats sweep(int max_age_hours, bool dry_run);
    CleanupStats sweep(int max_age_hours, bool dry_run, Timestamp now);

    ReservationStatistics statistics();
    ReservationStatistics statistics(Timestamp now);

private:
    Database& db_;
};

}  // namespace bloomstock
