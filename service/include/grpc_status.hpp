#pragma once

#include <grpcpp/grpcpp.h>
#include "bloomstock/errors.hpp"

namespace bloomstock {

inline grpc::StatusCode to_grpc_code(const InventoryError& error) {
    switch (error.code()) {
        case ErrorCode::NotFound:
            return grpc::StatusCode::NOT_FOUND;
        case ErrorCode::InsufficientStock:
            return grpc::StatusCode::FAILED_PRECONDITION;
        case ErrorCode::InvalidArgument:
            return grpc::StatusCode::INVALID_ARGUMENT;
        case ErrorCode::Reservation:
        case ErrorCode::Storage:
            return error.is_retryable() ? grpc::StatusCode::UNAVAILABLE : grpc::StatusCode::INTERNAL;
        default:
            return grpc::StatusCode::UNKNOWN;
    }
}

inline grpc::Status to_grpc_status(const InventoryError& error) {
    return grpc::Status(to_grpc_code(error), error.what());
}

}  // namespace bloomstock
