#include <gtest/gtest.h>
#include "bloomstock/errors.hpp"
#include "bloomstock/inventory_engine.hpp"
#include "test_database.hpp"

using namespace bloomstock;

class InventoryEngineTest : public DatabaseTest {
protected:
    void SetUp() override {
        DatabaseTest::SetUp();
        rose_ = add_item("Red rose", 100, 10, 120, 300);
        bouquet_ = add_product("Bouquet of 12 roses");
        add_recipe(bouquet_, rose_, 12);
        order_ = add_order("2001", OrderStatus::Paid, std::chrono::system_clock::now(),
                           {{bouquet_, "Bouquet of 12 roses", 2}});
    }

    Id rose_ = 0;
    Id bouquet_ = 0;
    Id order_ = 0;
};

// =============================================================================
// Order Lifecycle Tests
// =============================================================================

TEST_F(InventoryEngineTest, FullLifecycle_ReserveThenAssemble_ShouldMoveHoldIntoDeduction) {
    InventoryEngine engine(db());

    // Given
    auto batch = engine.check_batch_availability({{bouquet_, 2}});
    ASSERT_TRUE(batch.available);
    engine.create_reservation(order_, {{bouquet_, 2}});
    EXPECT_EQ(engine.item_availability(rose_).available, 76);

    // When
    auto result = engine.on_status_changed(order_, OrderStatus::Accepted, OrderStatus::Assembled);

    // Then
    EXPECT_EQ(result.action, StatusTransitionResult::Action::Deducted);
    ASSERT_EQ(result.operations.size(), 1u);
    EXPECT_EQ(result.operations[0].quantity_change, -24);
    EXPECT_EQ(on_hand(rose_), 76);
    EXPECT_TRUE(engine.order_reservations(order_).empty());
    EXPECT_EQ(engine.item_availability(rose_).available, 76);
}

TEST_F(InventoryEngineTest, OnStatusChanged_ToCancelled_ShouldReleaseHolds) {
    InventoryEngine engine(db());
    engine.create_reservation(order_, {{bouquet_, 2}});

    auto result = engine.on_status_changed(order_, OrderStatus::Paid, OrderStatus::Cancelled);

    EXPECT_EQ(result.action, StatusTransitionResult::Action::Released);
    EXPECT_EQ(result.released, 1);
    EXPECT_EQ(reserved(rose_), 0);
    EXPECT_EQ(on_hand(rose_), 100);
}

TEST_F(InventoryEngineTest, OnStatusChanged_ToOtherStatus_ShouldLeaveInventoryAlone) {
    InventoryEngine engine(db());
    engine.create_reservation(order_, {{bouquet_, 2}});

    auto result = engine.on_status_changed(order_, OrderStatus::Paid, OrderStatus::Accepted);

    EXPECT_EQ(result.action, StatusTransitionResult::Action::None);
    EXPECT_EQ(reserved(rose_), 24);
}

TEST_F(InventoryEngineTest, OnStatusChanged_WithUnchangedStatus_ShouldDoNothing) {
    InventoryEngine engine(db());

    auto result = engine.on_status_changed(order_, OrderStatus::Assembled, OrderStatus::Assembled);

    EXPECT_EQ(result.action, StatusTransitionResult::Action::None);
    EXPECT_EQ(on_hand(rose_), 100);
}

TEST_F(InventoryEngineTest, OnStatusChanged_ToAssembledWithoutReservations_ShouldUseOrderItems) {
    InventoryEngine engine(db());

    auto result = engine.on_status_changed(order_, OrderStatus::Accepted, OrderStatus::Assembled);

    EXPECT_EQ(result.action, StatusTransitionResult::Action::Deducted);
    EXPECT_EQ(on_hand(rose_), 76);
    ASSERT_EQ(result.operations.size(), 1u);
    EXPECT_EQ(result.operations[0].description, "Order Assembly - #2001 - Bouquet of 12 roses x2 (needs 24)");
}

TEST_F(InventoryEngineTest, OnStatusChanged_ToAssembledWithUnknownOrder_ShouldThrowNotFound) {
    InventoryEngine engine(db());

    EXPECT_THROW(engine.on_status_changed(777, OrderStatus::Accepted, OrderStatus::Assembled), NotFoundError);
}

// =============================================================================
// Facade Tests
// =============================================================================

TEST_F(InventoryEngineTest, Facade_ShouldExposeReportingOperations) {
    InventoryEngine engine(db());
    engine.create_reservation(order_, {{bouquet_, 1}});

    auto summary = engine.inventory_summary();
    EXPECT_EQ(summary.total_reserved_quantity, 12);
    EXPECT_EQ(summary.total_stock_value, 100 * 120);

    auto stats = engine.reservation_statistics();
    EXPECT_EQ(stats.total, 1);
    EXPECT_EQ(stats.by_order_status["paid"], 1);

    EXPECT_EQ(engine.product_max_quantity(bouquet_), 7);
    EXPECT_EQ(engine.check_availability(bouquet_, 7).available, true);
    EXPECT_EQ(engine.validate_order_items({{bouquet_, 8}}).size(), 1u);
}

TEST_F(InventoryEngineTest, CleanupExpiredReservations_ShouldDefaultToDryRun) {
    Id stale = add_order("2002", OrderStatus::New, hours_ago(100));
    add_reservation(stale, rose_, 12, hours_ago(100));
    InventoryEngine engine(db());

    auto preview = engine.cleanup_expired_reservations();
    EXPECT_EQ(preview.reservations_found, 1);
    EXPECT_EQ(preview.reservations_deleted, 0);

    auto executed = engine.cleanup_expired_reservations(kDefaultCleanupMaxAgeHours, false);
    EXPECT_EQ(executed.reservations_deleted, 1);
}
