#include "bloomstock/reservation_ledger.hpp"

namespace bloomstock {

namespace {

constexpr const char* kOrderedColumns =
    "SELECT r.id, r.order_id, r.warehouse_item_id, r.reserved_quantity, r.created_at, "
    "o.order_number, o.status, o.created_at "
    "FROM order_reservation r JOIN orders o ON o.id = r.order_id";

}  // anonymous namespace

std::unordered_map<Id, Quantity> ReservationLedger::reserved_totals(const std::vector<Id>& warehouse_item_ids) {
    std::unordered_map<Id, Quantity> totals;
    if (warehouse_item_ids.empty()) return totals;

    auto stmt = db_.prepare(
        "SELECT warehouse_item_id, SUM(reserved_quantity) FROM order_reservation "
        "WHERE warehouse_item_id IN (" + placeholders(warehouse_item_ids.size()) + ") "
        "GROUP BY warehouse_item_id");
    stmt.bind_all(1, warehouse_item_ids);
    while (stmt.step()) {
        totals[stmt.column_int64(0)] = stmt.column_int64(1);
    }
    return totals;
}

std::unordered_map<Id, Quantity> ReservationLedger::reserved_totals() {
    std::unordered_map<Id, Quantity> totals;
    auto stmt = db_.prepare(
        "SELECT warehouse_item_id, SUM(reserved_quantity) FROM order_reservation GROUP BY warehouse_item_id");
    while (stmt.step()) {
        totals[stmt.column_int64(0)] = stmt.column_int64(1);
    }
    return totals;
}

OrderReservation ReservationLedger::insert(Id order_id, Id warehouse_item_id, Quantity quantity,
                                           Timestamp created_at) {
    auto stmt = db_.prepare(
        "INSERT INTO order_reservation (order_id, warehouse_item_id, reserved_quantity, created_at) "
        "VALUES (?, ?, ?, ?)");
    stmt.bind(1, order_id).bind(2, warehouse_item_id).bind(3, quantity).bind(4, to_epoch_seconds(created_at));
    stmt.execute();

    OrderReservation reservation;
    reservation.id = db_.last_insert_rowid();
    reservation.order_id = order_id;
    reservation.warehouse_item_id = warehouse_item_id;
    reservation.reserved_quantity = quantity;
    reservation.created_at = from_epoch_seconds(to_epoch_seconds(created_at));
    return reservation;
}

std::vector<ReservationDetail> ReservationLedger::for_order(Id order_id) {
    auto stmt = db_.prepare(
        "SELECT r.id, r.order_id, r.warehouse_item_id, r.reserved_quantity, r.created_at, w.name "
        "FROM order_reservation r JOIN warehouse_item w ON w.id = r.warehouse_item_id "
        "WHERE r.order_id = ? ORDER BY r.warehouse_item_id");
    stmt.bind(1, order_id);

    std::vector<ReservationDetail> details;
    while (stmt.step()) {
        ReservationDetail detail;
        detail.reservation.id = stmt.column_int64(0);
        detail.reservation.order_id = stmt.column_int64(1);
        detail.reservation.warehouse_item_id = stmt.column_int64(2);
        detail.reservation.reserved_quantity = stmt.column_int64(3);
        detail.reservation.created_at = from_epoch_seconds(stmt.column_int64(4));
        detail.warehouse_item_name = stmt.column_text(5);
        details.push_back(std::move(detail));
    }
    return details;
}

int ReservationLedger::remove_for_order(Id order_id) {
    auto stmt = db_.prepare("DELETE FROM order_reservation WHERE order_id = ?");
    stmt.bind(1, order_id);
    stmt.execute();
    return db_.changes();
}

int ReservationLedger::remove(const std::vector<Id>& reservation_ids) {
    if (reservation_ids.empty()) return 0;
    auto stmt = db_.prepare("DELETE FROM order_reservation WHERE id IN (" +
                            placeholders(reservation_ids.size()) + ")");
    stmt.bind_all(1, reservation_ids);
    stmt.execute();
    return db_.changes();
}

std::vector<OrderedReservation> ReservationLedger::held_by_orders(Timestamp cutoff,
                                                                  const std::vector<OrderStatus>& statuses) {
    if (statuses.empty()) return {};

    auto stmt = db_.prepare(std::string(kOrderedColumns) +
                            " WHERE o.created_at < ? AND o.status IN (" + placeholders(statuses.size()) +
                            ") ORDER BY r.order_id, r.id");
    stmt.bind(1, to_epoch_seconds(cutoff));
    int index = 2;
    for (auto status : statuses) {
        stmt.bind(index++, to_string(status));
    }
    return read_ordered(stmt);
}

std::vector<OrderedReservation> ReservationLedger::all() {
    auto stmt = db_.prepare(std::string(kOrderedColumns) + " ORDER BY r.id");
    return read_ordered(stmt);
}

std::vector<OrderedReservation> ReservationLedger::read_ordered(Statement& stmt) {
    std::vector<OrderedReservation> rows;
    while (stmt.step()) {
        OrderedReservation row;
        row.reservation.id = stmt.column_int64(0);
        row.reservation.order_id = stmt.column_int64(1);
        row.reservation.warehouse_item_id = stmt.column_int64(2);
        row.reservation.reserved_quantity = stmt.column_int64(3);
        row.reservation.created_at = from_epoch_seconds(stmt.column_int64(4));
        row.order_number = stmt.column_text(5);
        row.order_status = parse_order_status(stmt.column_text(6));
        row.order_created_at = from_epoch_seconds(stmt.column_int64(7));
        rows.push_back(std::move(row));
    }
    return rows;
}

}  // namespace bloomstock
