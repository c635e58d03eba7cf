#include <gtest/gtest.h>
#include "bloomstock/availability.hpp"
#include "bloomstock/cleanup_sweeper.hpp"
#include "bloomstock/errors.hpp"
#include "test_database.hpp"

using namespace bloomstock;

class CleanupSweeperTest : public DatabaseTest {
protected:
    void SetUp() override {
        DatabaseTest::SetUp();
        rose_ = add_item("Red rose", 100);
        fern_ = add_item("Fern", 40);
        bouquet_ = add_product("Bouquet");
        add_recipe(bouquet_, rose_, 12);
        add_recipe(bouquet_, fern_, 5);
    }

    Id hold(const std::string& number, OrderStatus status, int age_hours) {
        Id order = add_order(number, status, hours_ago(age_hours));
        add_reservation(order, rose_, 96, hours_ago(age_hours));
        add_reservation(order, fern_, 40, hours_ago(age_hours));
        return order;
    }

    CleanupSweeper sweeper() { return CleanupSweeper(db()); }

    Id rose_ = 0;
    Id fern_ = 0;
    Id bouquet_ = 0;
};

// =============================================================================
// Sweep Tests
// =============================================================================

TEST_F(CleanupSweeperTest, Sweep_DryRun_ShouldReportWithoutDeleting) {
    hold("1001", OrderStatus::New, 100);

    auto stats = sweeper().sweep(72, true);

    EXPECT_EQ(stats.orders_found, 1);
    EXPECT_EQ(stats.reservations_found, 2);
    EXPECT_EQ(stats.reservations_deleted, 0);
    EXPECT_EQ(count_rows("order_reservation"), 2);
}

TEST_F(CleanupSweeperTest, Sweep_Execute_ShouldFreeStock) {
    // Given
    hold("1001", OrderStatus::New, 100);
    ASSERT_FALSE(AvailabilityCalculator(db()).check_product(bouquet_, 1).available);

    // When
    auto stats = sweeper().sweep(72, false);

    // Then
    EXPECT_EQ(stats.orders_found, 1);
    EXPECT_EQ(stats.reservations_found, 2);
    EXPECT_EQ(stats.reservations_deleted, 2);

    auto after = AvailabilityCalculator(db()).check_product(bouquet_, 1);
    EXPECT_TRUE(after.available);
    EXPECT_EQ(after.ingredients[0].available, 100);
    EXPECT_EQ(after.ingredients[1].available, 40);
}

TEST_F(CleanupSweeperTest, Sweep_ShouldIncludeOldCancelledOrders) {
    hold("1001", OrderStatus::Cancelled, 80);

    auto stats = sweeper().sweep(72, false);

    EXPECT_EQ(stats.reservations_deleted, 2);
}

TEST_F(CleanupSweeperTest, Sweep_ShouldSkipInFlightStatuses) {
    hold("1001", OrderStatus::Paid, 200);
    hold("1002", OrderStatus::Accepted, 200);
    hold("1003", OrderStatus::Assembled, 200);

    auto stats = sweeper().sweep(72, false);

    EXPECT_EQ(stats.orders_found, 0);
    EXPECT_EQ(count_rows("order_reservation"), 6);
}

TEST_F(CleanupSweeperTest, Sweep_ShouldSkipRecentOrders) {
    hold("1001", OrderStatus::New, 10);

    auto stats = sweeper().sweep(72, false);

    EXPECT_EQ(stats.reservations_found, 0);
    EXPECT_EQ(count_rows("order_reservation"), 2);
}

TEST_F(CleanupSweeperTest, Sweep_WithSeveralOrders_ShouldCountEachOrderOnce) {
    hold("1001", OrderStatus::New, 100);
    hold("1002", OrderStatus::Cancelled, 90);
    hold("1003", OrderStatus::New, 1);

    auto stats = sweeper().sweep(72, true);

    EXPECT_EQ(stats.orders_found, 2);
    EXPECT_EQ(stats.reservations_found, 4);
}

TEST_F(CleanupSweeperTest, Sweep_WithInjectedClock_ShouldUseIt) {
    Id order = add_order("1001", OrderStatus::New, from_epoch_seconds(1000000));
    add_reservation(order, rose_, 5, from_epoch_seconds(1000000));

    auto early = sweeper().sweep(72, true, from_epoch_seconds(1000000 + 71 * 3600));
    auto late = sweeper().sweep(72, true, from_epoch_seconds(1000000 + 73 * 3600));

    EXPECT_EQ(early.reservations_found, 0);
    EXPECT_EQ(late.reservations_found, 1);
}

TEST_F(CleanupSweeperTest, Sweep_WithNegativeAge_ShouldThrowInvalidArgument) {
    EXPECT_THROW(sweeper().sweep(-1, true), InvalidArgumentError);
}

// =============================================================================
// Statistics Tests
// =============================================================================

TEST_F(CleanupSweeperTest, Statistics_ShouldBucketByAgeAndStatus) {
    auto now = from_epoch_seconds(10000000);
    Id fresh = add_order("1001", OrderStatus::New, now);
    Id paid = add_order("1002", OrderStatus::Paid, now);
    add_reservation(fresh, rose_, 1, now - std::chrono::minutes(10));
    add_reservation(fresh, fern_, 1, now - std::chrono::hours(5));
    add_reservation(paid, rose_, 1, now - std::chrono::hours(30));
    add_reservation(paid, fern_, 1, now - std::chrono::hours(24 * 10));

    auto stats = sweeper().statistics(now);

    EXPECT_EQ(stats.total, 4);
    EXPECT_EQ(stats.under_one_hour, 1);
    EXPECT_EQ(stats.one_to_24_hours, 1);
    EXPECT_EQ(stats.one_to_7_days, 1);
    EXPECT_EQ(stats.over_7_days, 1);
    EXPECT_EQ(stats.by_order_status["new"], 2);
    EXPECT_EQ(stats.by_order_status["paid"], 2);
}

TEST_F(CleanupSweeperTest, Statistics_WithNoReservations_ShouldBeZero) {
    auto stats = sweeper().statistics();

    EXPECT_EQ(stats.total, 0);
    EXPECT_TRUE(stats.by_order_status.empty());
}
