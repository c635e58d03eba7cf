#include <gtest/gtest.h>
#include <sqlite3.h>
#include "grpc_status.hpp"

using namespace bloomstock;

TEST(GrpcStatusTest, NotFoundError_ShouldMapToNotFound) {
    auto status = to_grpc_status(NotFoundError("Order 9 not found"));
    EXPECT_EQ(status.error_code(), grpc::StatusCode::NOT_FOUND);
    EXPECT_EQ(status.error_message(), "Order 9 not found");
}

TEST(GrpcStatusTest, InsufficientStockError_ShouldMapToFailedPrecondition) {
    auto status = to_grpc_status(InsufficientStockError(StockShortfall{1, "Fern", 8, 5}));
    EXPECT_EQ(status.error_code(), grpc::StatusCode::FAILED_PRECONDITION);
}

TEST(GrpcStatusTest, InvalidArgumentError_ShouldMapToInvalidArgument) {
    auto status = to_grpc_status(InvalidArgumentError("Quantity must be positive"));
    EXPECT_EQ(status.error_code(), grpc::StatusCode::INVALID_ARGUMENT);
}

TEST(GrpcStatusTest, ReservationError_ShouldMapToInternalUnlessRetryable) {
    EXPECT_EQ(to_grpc_status(ReservationError("failed")).error_code(), grpc::StatusCode::INTERNAL);
    EXPECT_EQ(to_grpc_status(ReservationError("busy", true)).error_code(), grpc::StatusCode::UNAVAILABLE);
}

TEST(GrpcStatusTest, StorageError_WhenBusy_ShouldMapToUnavailable) {
    EXPECT_EQ(to_grpc_status(StorageError("locked", SQLITE_BUSY)).error_code(), grpc::StatusCode::UNAVAILABLE);
    EXPECT_EQ(to_grpc_status(StorageError("io", SQLITE_IOERR)).error_code(), grpc::StatusCode::INTERNAL);
}
