#include "inventory_service.hpp"
#include "grpc_status.hpp"
#include "proto_mapping.hpp"
#include "bloomstock/database.hpp"
#include "bloomstock/errors.hpp"
#include "bloomstock/logging.hpp"
#include <utility>

namespace bloomstock {

namespace {

class InventoryService final : public v1::InventoryEngine::Service {
public:
    explicit InventoryService(Config config) : config_(std::move(config)) {}

    grpc::Status CheckAvailability(grpc::ServerContext*, const v1::CheckAvailabilityRequest* request,
                                   v1::ProductAvailability* response) override {
        return run("CheckAvailability", [&](InventoryEngine& engine) {
            to_proto(engine.check_availability(request->product_id(), request->quantity()), response);
        });
    }

    grpc::Status CheckBatchAvailability(grpc::ServerContext*, const v1::CheckBatchAvailabilityRequest* request,
                                        v1::BatchAvailability* response) override {
        return run("CheckBatchAvailability", [&](InventoryEngine& engine) {
            to_proto(engine.check_batch_availability(from_proto(request->items())), response);
        });
    }

    grpc::Status ValidateOrderItems(grpc::ServerContext*, const v1::CheckBatchAvailabilityRequest* request,
                                    v1::ValidateOrderItemsResponse* response) override {
        return run("ValidateOrderItems", [&](InventoryEngine& engine) {
            for (const auto& warning : engine.validate_order_items(from_proto(request->items()))) {
                to_proto(warning, response->add_shortfalls());
            }
        });
    }

    grpc::Status GetProductMaxQuantity(grpc::ServerContext*, const v1::ProductRequest* request,
                                       v1::ProductMaxQuantity* response) override {
        return run("GetProductMaxQuantity", [&](InventoryEngine& engine) {
            response->set_product_id(request->product_id());
            response->set_max_quantity(engine.product_max_quantity(request->product_id()));
        });
    }

    grpc::Status GetItemAvailability(grpc::ServerContext*, const v1::WarehouseItemRequest* request,
                                     v1::ItemAvailability* response) override {
        return run("GetItemAvailability", [&](InventoryEngine& engine) {
            to_proto(engine.item_availability(request->warehouse_item_id()), response);
        });
    }

    grpc::Status CreateReservation(grpc::ServerContext*, const v1::CreateReservationRequest* request,
                                   v1::ReservationList* response) override {
        return run("CreateReservation", [&](InventoryEngine& engine) {
            log_info("inventory", "creating_reservation",
                     {{"order_id", request->order_id()}, {"items", request->items_size()}});
            engine.create_reservation(request->order_id(), from_proto(request->items()),
                                      !request->skip_validation());
            for (const auto& detail : engine.order_reservations(request->order_id())) {
                to_proto(detail, response->add_reservations());
            }
        });
    }

    grpc::Status ReleaseReservations(grpc::ServerContext*, const v1::OrderRequest* request,
                                     v1::ReleaseReservationsResponse* response) override {
        return run("ReleaseReservations", [&](InventoryEngine& engine) {
            response->set_released(engine.release_reservations(request->order_id()));
        });
    }

    grpc::Status GetOrderReservations(grpc::ServerContext*, const v1::OrderRequest* request,
                                      v1::ReservationList* response) override {
        return run("GetOrderReservations", [&](InventoryEngine& engine) {
            for (const auto& detail : engine.order_reservations(request->order_id())) {
                to_proto(detail, response->add_reservations());
            }
        });
    }

    grpc::Status ConvertReservationsToDeductions(grpc::ServerContext*, const v1::OrderRequest* request,
                                                 v1::DeductionResponse* response) override {
        return run("ConvertReservationsToDeductions", [&](InventoryEngine& engine) {
            for (const auto& op : engine.convert_reservations_to_deductions(request->order_id())) {
                to_proto(op, response->add_operations());
            }
        });
    }

    grpc::Status OrderStatusChanged(grpc::ServerContext*, const v1::OrderStatusChangedRequest* request,
                                    v1::OrderStatusChangedResponse* response) override {
        return run("OrderStatusChanged", [&](InventoryEngine& engine) {
            auto old_status = parse_order_status(request->old_status());
            auto new_status = parse_order_status(request->new_status());
            to_proto(engine.on_status_changed(request->order_id(), old_status, new_status), response);
        });
    }

    grpc::Status GetInventorySummary(grpc::ServerContext*, const v1::InventorySummaryRequest*,
                                     v1::InventorySummary* response) override {
        return run("GetInventorySummary", [&](InventoryEngine& engine) {
            to_proto(engine.inventory_summary(), response);
        });
    }

    grpc::Status CleanupExpiredReservations(grpc::ServerContext*, const v1::CleanupRequest* request,
                                            v1::CleanupStats* response) override {
        return run("CleanupExpiredReservations", [&](InventoryEngine& engine) {
            int hours = request->has_max_age_hours() ? request->max_age_hours() : config_.cleanup_max_age_hours;
            to_proto(engine.cleanup_expired_reservations(hours, !request->execute()), response);
        });
    }

    grpc::Status GetReservationStatistics(grpc::ServerContext*, const v1::ReservationStatisticsRequest*,
                                          v1::ReservationStatistics* response) override {
        return run("GetReservationStatistics", [&](InventoryEngine& engine) {
            to_proto(engine.reservation_statistics(), response);
        });
    }

private:
    // Each call gets its own connection; SQLite handles are not shared across threads.
    template <typename Fn>
    grpc::Status run(const char* rpc, Fn&& fn) {
        try {
            Database db(config_.db_path, config_.busy_timeout_ms);
            InventoryEngine engine(db);
            fn(engine);
            return grpc::Status::OK;
        } catch (const InventoryError& e) {
            auto status = to_grpc_status(e);
            log_warn("inventory", "rpc_failed",
                     {{"rpc", rpc}, {"code", static_cast<int>(status.error_code())}, {"error", e.what()}});
            return status;
        }
    }

    Config config_;
};

}  // namespace

std::unique_ptr<v1::InventoryEngine::Service> create_inventory_service(const Config& config) {
    return std::make_unique<InventoryService>(config);
}

}  // namespace bloomstock
