#pragma once

#include <vector>
#include "bloomstock/availability.hpp"
#include "bloomstock/cleanup_sweeper.hpp"
#include "bloomstock/inventory_engine.hpp"
#include "bloomstock/inventory_summary.hpp"
#include "bloomstock/types.hpp"
#include "bloomstock/inventory.pb.h"

namespace bloomstock {

std::vector<ItemRequest> from_proto(const google::protobuf::RepeatedPtrField<v1::ItemRequest>& items);

void to_proto(const ProductAvailability& in, v1::ProductAvailability* out);
void to_proto(const AvailabilityWarning& in, v1::AvailabilityWarning* out);
void to_proto(const BatchAvailability& in, v1::BatchAvailability* out);
void to_proto(const ItemAvailability& in, v1::ItemAvailability* out);
void to_proto(const ReservationDetail& in, v1::Reservation* out);
void to_proto(const WarehouseOperation& in, v1::WarehouseOperation* out);
void to_proto(const StatusTransitionResult& in, v1::OrderStatusChangedResponse* out);
void to_proto(const InventorySummary& in, v1::InventorySummary* out);
void to_proto(const CleanupStats& in, v1::CleanupStats* out);
void to_proto(const ReservationStatistics& in, v1::ReservationStatistics* out);

}  // namespace bloomstock
