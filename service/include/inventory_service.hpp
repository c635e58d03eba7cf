#pragma once

#include <memory>
#include "bloomstock/config.hpp"
#include "bloomstock/inventory.grpc.pb.h"

namespace bloomstock {

std::unique_ptr<v1::InventoryEngine::Service> create_inventory_service(const Config& config);

}  // namespace bloomstock
