#include "inventory_service.hpp"
#include "bloomstock/config.hpp"
#include "bloomstock/database.hpp"
#include "bloomstock/errors.hpp"
#include "bloomstock/logging.hpp"
#include "bloomstock/schema.hpp"
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <memory>

int main() {
    using namespace bloomstock;

    Config config;
    try {
        config = Config::from_env();
        set_log_level(config.log_level);

        Database db(config.db_path, config.busy_timeout_ms);
        apply_schema(db);
    } catch (const InventoryError& e) {
        log_error("server", "startup_failed", {{"error", e.what()}});
        return 1;
    }

    grpc::EnableDefaultHealthCheckService(true);

    auto service = create_inventory_service(config);

    grpc::ServerBuilder builder;
    builder.AddListeningPort(config.listen_address(), grpc::InsecureServerCredentials());
    builder.RegisterService(service.get());

    std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
    if (!server) {
        log_error("server", "listen_failed", {{"address", config.listen_address()}});
        return 1;
    }

    log_info("server", "inventory_engine_server_started",
             {{"port", config.port}, {"db_path", config.db_path}});

    server->Wait();

    return 0;
}
