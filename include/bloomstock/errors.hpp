#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include "bloomstock/shortfall.hpp"

namespace bloomstock {

enum class ErrorCode {
    NotFound,
    InsufficientStock,
    InvalidArgument,
    Reservation,
    Storage
};

/**
 * Base exception for all inventory engine errors.
 */
class InventoryError : public std::runtime_error {
public:
    InventoryError(const std::string& message, ErrorCode code)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }

    /**
     * Returns true if a referenced order, product or warehouse item is missing.
     */
    bool is_not_found() const { return code_ == ErrorCode::NotFound; }

    /**
     * Returns true if current stock cannot satisfy the requested change.
     * This is the one error callers are expected to branch on.
     */
    bool is_insufficient_stock() const { return code_ == ErrorCode::InsufficientStock; }

    /**
     * Returns true if the caller supplied malformed input.
     */
    bool is_invalid_argument() const { return code_ == ErrorCode::InvalidArgument; }

    /**
     * Returns true if repeating the call later may succeed (lock contention).
     */
    virtual bool is_retryable() const { return false; }

private:
    ErrorCode code_;
};

/**
 * Thrown when a referenced order, product or warehouse item does not exist.
 */
class NotFoundError : public InventoryError {
public:
    explicit NotFoundError(const std::string& message)
        : InventoryError(message, ErrorCode::NotFound) {}
};

/**
 * Thrown when a state change cannot be satisfied by current stock.
 */
class InsufficientStockError : public InventoryError {
public:
    InsufficientStockError(const std::string& message, std::vector<AvailabilityWarning> shortfalls)
        : InventoryError(message, ErrorCode::InsufficientStock), shortfalls_(std::move(shortfalls)) {}

    explicit InsufficientStockError(const StockShortfall& item_shortfall)
        : InventoryError(describe(item_shortfall), ErrorCode::InsufficientStock),
          item_shortfalls_{item_shortfall} {}

    /// Product-level shortfalls reported by a validated reservation.
    const std::vector<AvailabilityWarning>& shortfalls() const { return shortfalls_; }

    /// Warehouse-level shortfalls reported by a deduction.
    const std::vector<StockShortfall>& item_shortfalls() const { return item_shortfalls_; }

private:
    std::vector<AvailabilityWarning> shortfalls_;
    std::vector<StockShortfall> item_shortfalls_;
};

/**
 * Thrown when an input value is malformed.
 */
class InvalidArgumentError : public InventoryError {
public:
    explicit InvalidArgumentError(const std::string& message)
        : InventoryError(message, ErrorCode::InvalidArgument) {}
};

/**
 * Thrown when reservation create/release or conversion fails unexpectedly.
 */
class ReservationError : public InventoryError {
public:
    explicit ReservationError(const std::string& message, bool retryable = false)
        : InventoryError(message, ErrorCode::Reservation), retryable_(retryable) {}

    bool is_retryable() const override { return retryable_; }

private:
    bool retryable_;
};

/**
 * Thrown when the SQLite layer reports a failure.
 */
class StorageError : public InventoryError {
public:
    StorageError(const std::string& message, int sqlite_code)
        : InventoryError(message, ErrorCode::Storage), sqlite_code_(sqlite_code) {}

    int sqlite_code() const { return sqlite_code_; }

    bool is_retryable() const override;

private:
    int sqlite_code_;
};

}  // namespace bloomstock
