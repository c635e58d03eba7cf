#include "bloomstock/cleanup_sweeper.hpp"
#include "bloomstock/errors.hpp"
#include "bloomstock/logging.hpp"
#include "bloomstock/reservation_ledger.hpp"
#include <map>

namespace bloomstock {

namespace {

double hours_between(Timestamp from, Timestamp to) {
    return std::chrono::duration<double, std::ratio<3600>>(to - from).count();
}

}  // anonymous namespace

CleanupStats CleanupSweeper::sweep(int max_age_hours, bool dry_run) {
    return sweep(max_age_hours, dry_run, std::chrono::system_clock::now());
}

CleanupStats CleanupSweeper::sweep(int max_age_hours, bool dry_run, Timestamp now) {
    if (max_age_hours < 0) throw InvalidArgumentError("max_age_hours must not be negative");

    auto cutoff = now - std::chrono::hours(max_age_hours);
    CleanupStats stats;

    Transaction tx(db_, dry_run ? TransactionMode::Deferred : TransactionMode::Immediate);
    ReservationLedger ledger(db_);
    auto expired = ledger.held_by_orders(cutoff, {OrderStatus::New, OrderStatus::Cancelled});

    std::map<Id, int> per_order;
    std::vector<Id> reservation_ids;
    for (const auto& row : expired) {
        per_order[row.reservation.order_id]++;
        reservation_ids.push_back(row.reservation.id);
    }
    for (const auto& row : expired) {
        auto it = per_order.find(row.reservation.order_id);
        if (it == per_order.end() || it->second == 0) continue;
        log_info("cleanup", "expired_order_reservations",
                 {{"order_id", row.reservation.order_id},
                  {"order_number", row.order_number},
                  {"status", to_string(row.order_status)},
                  {"age_hours", hours_between(row.order_created_at, now)},
                  {"reservations", it->second}});
        it->second = 0;
    }
    stats.orders_found = static_cast<int>(per_order.size());
    stats.reservations_found = static_cast<int>(reservation_ids.size());

    if (!dry_run) {
        stats.reservations_deleted = ledger.remove(reservation_ids);
    }
    tx.commit();

    log_info("cleanup", dry_run ? "cleanup_dry_run" : "cleanup_completed",
             {{"max_age_hours", max_age_hours},
              {"orders_found", stats.orders_found},
              {"reservations_found", stats.reservations_found},
              {"reservations_deleted", stats.reservations_deleted}});
    return stats;
}

ReservationStatistics CleanupSweeper::statistics() {
    return statistics(std::chrono::system_clock::now());
}

ReservationStatistics CleanupSweeper::statistics(Timestamp now) {
    Transaction tx(db_, TransactionMode::Deferred);
    auto rows = ReservationLedger(db_).all();
    tx.commit();

    ReservationStatistics stats;
    stats.total = static_cast<int>(rows.size());
    for (const auto& row : rows) {
        stats.by_order_status[to_string(row.order_status)]++;

        double age = hours_between(row.reservation.created_at, now);
        if (age < 1) {
            stats.under_one_hour++;
        } else if (age < 24) {
            stats.one_to_24_hours++;
        } else if (age < 168) {
            stats.one_to_7_days++;
        } else {
            stats.over_7_days++;
        }
    }
    return stats;
}

}  // namespace bloomstock
