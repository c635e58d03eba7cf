#include <gtest/gtest.h>
#include "bloomstock/bom.hpp"
#include "bloomstock/deduction_converter.hpp"
#include "bloomstock/errors.hpp"
#include "bloomstock/logging.hpp"
#include "bloomstock/reservation_manager.hpp"
#include "bloomstock/warehouse_store.hpp"
#include "test_database.hpp"

using namespace bloomstock;

class DeductionConverterTest : public DatabaseTest {
protected:
    void SetUp() override {
        DatabaseTest::SetUp();
        rose_ = add_item("Red rose", 100);
        fern_ = add_item("Fern", 40);
        ribbon_ = add_item("Ribbon", 5);

        arrangement_ = add_product("Arrangement");
        add_recipe(arrangement_, rose_, 3);
        add_recipe(arrangement_, fern_, 2);
        add_recipe(arrangement_, ribbon_, 1, true);
    }

    DeductionConverter converter() { return DeductionConverter(db()); }

    Id rose_ = 0;
    Id fern_ = 0;
    Id ribbon_ = 0;
    Id arrangement_ = 0;
};

// =============================================================================
// Reservation Path Tests
// =============================================================================

TEST_F(DeductionConverterTest, Convert_ShouldDeductReservedQuantitiesAndAudit) {
    // Given
    Id order = add_order("A-17", OrderStatus::Accepted);
    ReservationManager(db()).create(order, {{arrangement_, 4}}, true);

    // When
    auto operations = converter().convert(order);

    // Then
    ASSERT_EQ(operations.size(), 2u);
    EXPECT_EQ(operations[0].warehouse_item_id, rose_);
    EXPECT_EQ(operations[0].type, OperationType::Sale);
    EXPECT_EQ(operations[0].quantity_change, -12);
    EXPECT_EQ(operations[0].balance_after, 88);
    EXPECT_EQ(operations[0].order_id.value_or(0), order);
    EXPECT_EQ(operations[0].description, "Order Assembly - #A-17 (from reservation)");
    EXPECT_GT(operations[0].id, 0);
    EXPECT_EQ(operations[1].warehouse_item_id, fern_);
    EXPECT_EQ(operations[1].balance_after, 32);

    EXPECT_EQ(on_hand(rose_), 88);
    EXPECT_EQ(on_hand(fern_), 32);
    EXPECT_EQ(on_hand(ribbon_), 5);
    EXPECT_EQ(count_rows("order_reservation"), 0);
    EXPECT_EQ(count_rows("warehouse_operation"), 2);
}

TEST_F(DeductionConverterTest, Convert_ShouldPersistAuditRowsForOrder) {
    Id order = add_order("A-18", OrderStatus::Accepted);
    ReservationManager(db()).create(order, {{arrangement_, 1}}, true);

    converter().convert(order);
    auto recorded = WarehouseStore(db()).operations_for_order(order);

    ASSERT_EQ(recorded.size(), 2u);
    EXPECT_EQ(recorded[0].quantity_change, -3);
    EXPECT_EQ(recorded[0].balance_after, 97);
    EXPECT_EQ(recorded[1].quantity_change, -2);
}

TEST_F(DeductionConverterTest, Convert_WhenStockDroppedOutOfBand_ShouldChangeNothing) {
    // Given reservations for 12 roses and 8 ferns, then fern stock lost
    Id order = add_order("A-19", OrderStatus::Accepted);
    ReservationManager(db()).create(order, {{arrangement_, 4}}, true);
    set_quantity(fern_, 5);

    // When
    try {
        converter().convert(order);
        FAIL() << "Expected InsufficientStockError";
    } catch (const InsufficientStockError& e) {
        ASSERT_EQ(e.item_shortfalls().size(), 1u);
        EXPECT_EQ(e.item_shortfalls()[0].warehouse_item_id, fern_);
        EXPECT_EQ(e.item_shortfalls()[0].required, 8);
        EXPECT_EQ(e.item_shortfalls()[0].available, 5);
        EXPECT_STREQ(e.what(), "Insufficient stock for Fern. Required: 8, Available: 5");
    }

    // Then
    EXPECT_EQ(on_hand(rose_), 100);
    EXPECT_EQ(on_hand(fern_), 5);
    EXPECT_EQ(count_rows("order_reservation"), 2);
    EXPECT_EQ(count_rows("warehouse_operation"), 0);
}

TEST_F(DeductionConverterTest, Convert_WithUnknownOrder_ShouldThrowNotFound) {
    EXPECT_THROW(converter().convert(9999), NotFoundError);
}

TEST_F(DeductionConverterTest, Convert_AfterReservationsConsumedWithoutItems_ShouldThrowReservationError) {
    Id order = add_order("A-20", OrderStatus::Accepted);
    ReservationManager(db()).create(order, {{arrangement_, 1}}, true);
    converter().convert(order);

    EXPECT_THROW(converter().convert(order), ReservationError);
    EXPECT_EQ(on_hand(rose_), 97);
}

TEST_F(DeductionConverterTest, Convert_AfterReservationsConsumed_ShouldNotDeductOrderItemsAgain) {
    // Given an order with line items whose reservations were already converted
    Id order = add_order("A-21", OrderStatus::Accepted, std::chrono::system_clock::now(),
                         {{arrangement_, "Arrangement", 2}});
    ReservationManager(db()).create(order, {{arrangement_, 2}}, true);
    converter().convert(order);

    // When / Then
    EXPECT_THROW(converter().convert(order), ReservationError);
    EXPECT_EQ(on_hand(rose_), 94);
    EXPECT_EQ(on_hand(fern_), 36);
    EXPECT_EQ(count_rows("warehouse_operation"), 2);
}

// =============================================================================
// Legacy Path Tests
// =============================================================================

TEST_F(DeductionConverterTest, Convert_WithoutReservations_ShouldDeductFromOrderItems) {
    // Given an order with line items but no reservations
    Id bouquet = add_product("Rose bouquet");
    add_recipe(bouquet, rose_, 5);
    Id order = add_order("L-1", OrderStatus::Accepted, std::chrono::system_clock::now(),
                         {{arrangement_, "Arrangement", 2}, {bouquet, "Rose bouquet", 1}});

    // When
    auto operations = converter().convert(order);

    // Then one audit row per item touched
    ASSERT_EQ(operations.size(), 2u);
    EXPECT_EQ(operations[0].warehouse_item_id, rose_);
    EXPECT_EQ(operations[0].quantity_change, -11);
    EXPECT_EQ(operations[0].description,
              "Order Assembly - #L-1 - Arrangement x2 (needs 6); Rose bouquet x1 (needs 5)");
    EXPECT_EQ(operations[1].warehouse_item_id, fern_);
    EXPECT_EQ(operations[1].quantity_change, -4);

    EXPECT_EQ(on_hand(rose_), 89);
    EXPECT_EQ(on_hand(fern_), 36);
    EXPECT_EQ(on_hand(ribbon_), 5);
}

TEST_F(DeductionConverterTest, Convert_WithoutReservationsAndShortStock_ShouldAbortWholeOrder) {
    Id order = add_order("L-2", OrderStatus::Accepted, std::chrono::system_clock::now(),
                         {{arrangement_, "Arrangement", 25}});

    try {
        converter().convert(order);
        FAIL() << "Expected InsufficientStockError";
    } catch (const InsufficientStockError& e) {
        ASSERT_EQ(e.item_shortfalls().size(), 1u);
        EXPECT_EQ(e.item_shortfalls()[0].needed_for, "Arrangement (x25)");
        EXPECT_STREQ(e.what(),
                     "Insufficient stock for Fern. Required: 50, Available: 40. Needed for products: Arrangement (x25)");
    }

    EXPECT_EQ(on_hand(rose_), 100);
    EXPECT_EQ(on_hand(fern_), 40);
    EXPECT_EQ(count_rows("warehouse_operation"), 0);
}

TEST_F(DeductionConverterTest, Convert_FromOrderItemsTwice_ShouldDeductOnce) {
    Id order = add_order("L-4", OrderStatus::Accepted, std::chrono::system_clock::now(),
                         {{arrangement_, "Arrangement", 1}});
    converter().convert(order);

    EXPECT_THROW(converter().convert(order), ReservationError);
    EXPECT_EQ(on_hand(rose_), 97);
    EXPECT_EQ(on_hand(fern_), 38);
    EXPECT_EQ(count_rows("warehouse_operation"), 2);
}

TEST_F(DeductionConverterTest, Convert_WithNonUtf8OrderNumber_ShouldStillDeduct) {
    set_log_level(LogLevel::Debug);
    Id order = add_order("L-\xFF", OrderStatus::Accepted, std::chrono::system_clock::now(),
                         {{arrangement_, "Arrangement", 1}});

    testing::internal::CaptureStdout();
    testing::internal::CaptureStderr();
    std::vector<WarehouseOperation> operations;
    EXPECT_NO_THROW(operations = converter().convert(order));
    testing::internal::GetCapturedStdout();
    testing::internal::GetCapturedStderr();
    set_log_level(LogLevel::Error);

    EXPECT_EQ(operations.size(), 2u);
    EXPECT_EQ(on_hand(rose_), 97);
}

TEST_F(DeductionConverterTest, Convert_WithoutReservationsOrItems_ShouldThrowReservationError) {
    Id order = add_order("L-3", OrderStatus::Accepted);

    EXPECT_THROW(converter().convert(order), ReservationError);
}

// =============================================================================
// Planning Tests
// =============================================================================

TEST(PlanDeductionsTest, FromReservations_ShouldSumRowsPerItem) {
    Order order;
    order.id = 1;
    order.order_number = "P-1";

    ReservationDetail first;
    first.reservation.warehouse_item_id = 4;
    first.reservation.reserved_quantity = 3;
    first.warehouse_item_name = "Tulip";
    ReservationDetail second = first;
    second.reservation.reserved_quantity = 2;

    auto deductions = plan_deductions(FromReservations{{first, second}}, order);

    ASSERT_EQ(deductions.size(), 1u);
    EXPECT_EQ(deductions[0].warehouse_item_id, 4);
    EXPECT_EQ(deductions[0].quantity, 5);
    EXPECT_EQ(deductions[0].warehouse_item_name, "Tulip");
    EXPECT_TRUE(deductions[0].needed_for.empty());
}

TEST(PlanDeductionsTest, FromOrderItems_ShouldListContributingProducts) {
    Order order;
    order.id = 2;
    order.order_number = "P-2";

    WarehouseItem tulip;
    tulip.id = 4;
    tulip.name = "Tulip";
    std::vector<OrderItem> items{{1, "Spring mix", 2}, {2, "Tulip bunch", 1}};
    RecipeLine mix_line;
    mix_line.product_id = 1;
    mix_line.item = tulip;
    mix_line.quantity_per_unit = 3;
    RecipeLine bunch_line = mix_line;
    bunch_line.product_id = 2;
    bunch_line.quantity_per_unit = 10;
    LinesByProduct lines{{1, {mix_line}}, {2, {bunch_line}}};

    auto deductions = plan_deductions(FromOrderItems{expand(items, lines)}, order);

    ASSERT_EQ(deductions.size(), 1u);
    EXPECT_EQ(deductions[0].quantity, 16);
    EXPECT_EQ(deductions[0].needed_for, "Spring mix (x2), Tulip bunch (x1)");
}
