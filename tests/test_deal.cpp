#include <gtest/gtest.h>
#include "Deal.hpp"
#include <limits>

using namespace realestate;

class DealTest : public ::testing::Test {
protected:
    static DealCore makeCore() {
        DealCore core;
        core.id = "deal-1";
        core.name = "Elm Street Duplex";
        core.property.address = "12 Elm St";
        core.purchasePrice = 200000.0;
        core.monthlyRent = 1500.0;
        return core;
    }

    static DealCore makeBrrrrCore() {
        DealCore core = makeCore();
        core.rehab.afterRepairValue = 250000.0;
        core.rehab.renovationCosts = 30000.0;
        core.rehab.durationMonths = 4;
        return core;
    }

    static LeaseOptionTerms makeLeaseTerms(double strike) {
        LeaseOptionTerms terms;
        terms.optionConsiderationFee = 5000.0;
        terms.optionTermMonths = 24;
        terms.strikePrice = strike;
        terms.monthlyRentCreditPercent = 25.0;
        terms.rentCreditCap = 10000.0;
        return terms;
    }

    static MultiFamilyTerms makeMultiFamilyTerms() {
        MultiFamilyTerms terms;
        terms.totalUnits = 4;
        terms.occupiedUnits = 3;
        terms.unitTypes = {{"1BR", 2, 900.0, std::nullopt}, {"2BR", 2, 1200.0, 850}};
        return terms;
    }
};

// ============================================================================
// ТЕСТЫ: Общие поля
// ============================================================================

TEST_F(DealTest, CreateLongTermRental) {
    auto deal = Deal::create(makeCore(), LongTermRentalTerms{});
    ASSERT_TRUE(deal.has_value()) << deal.error();

    EXPECT_EQ(deal->strategy(), StrategyType::LongTermRental);
    EXPECT_EQ(deal->id(), "deal-1");
    EXPECT_DOUBLE_EQ(deal->monthlyRent(), 1500.0);
    EXPECT_DOUBLE_EQ(deal->renovationCosts(), 0.0);
}

TEST_F(DealTest, NameIsRequired) {
    DealCore core = makeCore();
    core.name.clear();

    auto deal = Deal::create(core, LongTermRentalTerms{});
    ASSERT_FALSE(deal.has_value());
    EXPECT_NE(deal.error().find("analysis_name"), std::string::npos);
}

TEST_F(DealTest, LongTermRentalRequiresMonthlyRent) {
    DealCore core = makeCore();
    core.monthlyRent.reset();

    auto deal = Deal::create(core, LongTermRentalTerms{});
    ASSERT_FALSE(deal.has_value());
    EXPECT_EQ(deal.error(), "monthly_rent is required for LTR analysis");
}

TEST_F(DealTest, RejectsNegativeMoney) {
    DealCore core = makeCore();
    core.expenses.insuranceAnnual = -10.0;

    auto deal = Deal::create(core, LongTermRentalTerms{});
    ASSERT_FALSE(deal.has_value());
    EXPECT_NE(deal.error().find("insurance"), std::string::npos);
}

TEST_F(DealTest, RejectsPercentOutOfRange) {
    DealCore core = makeCore();
    core.expenses.vacancyPercent = 120.0;

    auto deal = Deal::create(core, LongTermRentalTerms{});
    ASSERT_FALSE(deal.has_value());
    EXPECT_NE(deal.error().find("vacancy_percentage"), std::string::npos);
}

TEST_F(DealTest, RejectsLongNotes) {
    DealCore core = makeCore();
    core.notes = std::string(Deal::kMaxNotesLength + 1, 'x');

    EXPECT_FALSE(Deal::create(core, LongTermRentalTerms{}).has_value());

    core.notes = std::string(Deal::kMaxNotesLength, 'x');
    EXPECT_TRUE(Deal::create(core, LongTermRentalTerms{}).has_value());
}

TEST_F(DealTest, BalloonLtvMustBeInRange) {
    DealCore core = makeCore();
    core.balloon.hasBalloonPayment = true;
    core.balloon.refinanceLtvPercent = 0.0;

    EXPECT_FALSE(Deal::create(core, LongTermRentalTerms{}).has_value());

    core.balloon.refinanceLtvPercent = 80.0;
    EXPECT_TRUE(Deal::create(core, LongTermRentalTerms{}).has_value());
}

// ============================================================================
// ТЕСТЫ: BRRRR
// ============================================================================

TEST_F(DealTest, BrrrrWithoutArvFails) {
    DealCore core = makeBrrrrCore();
    core.rehab.afterRepairValue.reset();

    auto deal = Deal::create(core, BrrrrTerms{});
    ASSERT_FALSE(deal.has_value());
    EXPECT_NE(deal.error().find("after_repair_value"), std::string::npos);
}

TEST_F(DealTest, BrrrrWithoutRenovationDurationFails) {
    DealCore core = makeBrrrrCore();
    core.rehab.durationMonths.reset();

    auto deal = Deal::create(core, BrrrrTerms{});
    ASSERT_FALSE(deal.has_value());
    EXPECT_NE(deal.error().find("renovation_duration"), std::string::npos);
}

TEST_F(DealTest, BrrrrWithRehabFieldsSucceeds) {
    auto deal = Deal::create(makeBrrrrCore(), BrrrrTerms{});
    ASSERT_TRUE(deal.has_value()) << deal.error();

    EXPECT_EQ(deal->strategy(), StrategyType::Brrrr);
    EXPECT_DOUBLE_EQ(deal->renovationCosts(), 30000.0);
    EXPECT_EQ(deal->renovationDurationMonths(), 4);
}

TEST_F(DealTest, BrrrrRefinanceLtvRange) {
    BrrrrTerms terms;
    terms.refinanceLtvPercent = 150.0;

    EXPECT_FALSE(Deal::create(makeBrrrrCore(), terms).has_value());
}

// ============================================================================
// ТЕСТЫ: LeaseOption
// ============================================================================

TEST_F(DealTest, LeaseOptionStrikeMustExceedPurchasePrice) {
    auto equal = Deal::create(makeCore(), makeLeaseTerms(200000.0));
    ASSERT_FALSE(equal.has_value());
    EXPECT_NE(equal.error().find("strike_price"), std::string::npos);

    auto above = Deal::create(makeCore(), makeLeaseTerms(220000.0));
    ASSERT_TRUE(above.has_value()) << above.error();
    EXPECT_EQ(above->strategy(), StrategyType::LeaseOption);
}

TEST_F(DealTest, LeaseOptionRequiresAllTerms) {
    LeaseOptionTerms terms = makeLeaseTerms(220000.0);
    terms.rentCreditCap.reset();

    auto deal = Deal::create(makeCore(), terms);
    ASSERT_FALSE(deal.has_value());
    EXPECT_EQ(deal.error(), "rent_credit_cap is required for LeaseOption analysis");
}

// ============================================================================
// ТЕСТЫ: MultiFamily
// ============================================================================

TEST_F(DealTest, MultiFamilyValid) {
    DealCore core = makeCore();
    core.monthlyRent.reset();

    auto deal = Deal::create(core, makeMultiFamilyTerms());
    ASSERT_TRUE(deal.has_value()) << deal.error();
    ASSERT_NE(deal->termsAs<MultiFamilyTerms>(), nullptr);
    EXPECT_EQ(deal->termsAs<MultiFamilyTerms>()->unitTypes.size(), 2u);
    EXPECT_EQ(deal->termsAs<PadSplitTerms>(), nullptr);
}

TEST_F(DealTest, MultiFamilyOccupiedCannotExceedTotal) {
    MultiFamilyTerms terms = makeMultiFamilyTerms();
    terms.occupiedUnits = 5;

    auto deal = Deal::create(makeCore(), terms);
    ASSERT_FALSE(deal.has_value());
    EXPECT_NE(deal.error().find("occupied_units"), std::string::npos);
}

TEST_F(DealTest, MultiFamilyUnitCountsCannotExceedTotal) {
    MultiFamilyTerms terms = makeMultiFamilyTerms();
    terms.unitTypes.push_back({"Studio", 1, 700.0, std::nullopt});

    auto deal = Deal::create(makeCore(), terms);
    ASSERT_FALSE(deal.has_value());
    EXPECT_NE(deal.error().find("unit_types"), std::string::npos);
}

TEST_F(DealTest, MultiFamilyHugeUnitCountsDoNotWrap) {
    MultiFamilyTerms terms = makeMultiFamilyTerms();
    terms.totalUnits = 10;
    terms.occupiedUnits = 10;
    terms.unitTypes = {
        {"1BR", std::numeric_limits<int>::max() - 1, 900.0, std::nullopt},
        {"2BR", std::numeric_limits<int>::max() - 1, 1200.0, std::nullopt}
    };

    auto deal = Deal::create(makeCore(), terms);
    ASSERT_FALSE(deal.has_value());
    EXPECT_NE(deal.error().find("unit_types"), std::string::npos);
}

TEST_F(DealTest, MultiFamilyRequiresUnitTypes) {
    MultiFamilyTerms terms = makeMultiFamilyTerms();
    terms.unitTypes.clear();

    auto deal = Deal::create(makeCore(), terms);
    ASSERT_FALSE(deal.has_value());
    EXPECT_EQ(deal.error(), "unit_types is required for MultiFamily analysis");
}

// ============================================================================
// ТЕСТЫ: PadSplit
// ============================================================================

TEST_F(DealTest, PadSplitRequiresRoomCount) {
    PadSplitTerms terms;
    terms.averageRoomRent = 700.0;
    terms.platformPercent = 12.0;

    auto deal = Deal::create(makeCore(), terms);
    ASSERT_FALSE(deal.has_value());
    EXPECT_NE(deal.error().find("room_count"), std::string::npos);

    terms.roomCount = 5;
    EXPECT_TRUE(Deal::create(makeCore(), terms).has_value());
}

// ============================================================================
// ТЕСТЫ: Метки времени и перечисления
// ============================================================================

TEST_F(DealTest, WithUpdatedTimestampKeepsCreatedAt) {
    auto deal = Deal::create(makeCore(), LongTermRentalTerms{});
    ASSERT_TRUE(deal.has_value());

    auto first = deal->withUpdatedTimestamp("2024-01-01 10:00:00");
    EXPECT_EQ(first.core().createdAt, "2024-01-01 10:00:00");
    EXPECT_EQ(first.core().updatedAt, "2024-01-01 10:00:00");

    auto second = first.withUpdatedTimestamp("2024-02-01 09:30:00");
    EXPECT_EQ(second.core().createdAt, "2024-01-01 10:00:00");
    EXPECT_EQ(second.core().updatedAt, "2024-02-01 09:30:00");
}

TEST(LoanSlotsTest, MutableAccessWritesMatchingSlot) {
    auto loan = LoanSpec::create("Refi", 150000.0, 6.0, 360);
    ASSERT_TRUE(loan.has_value()) << loan.error();

    LoanSlots slots;
    slots.at(LoanSlot::Refinance) = *loan;
    slots.at(LoanSlot::Loan3) = *loan;

    EXPECT_TRUE(slots.refinance.has_value());
    EXPECT_TRUE(slots.loan3.has_value());
    EXPECT_FALSE(slots.initial.has_value());
    EXPECT_FALSE(slots.balloonRefinance.has_value());

    const LoanSlots& view = slots;
    ASSERT_TRUE(view.at(LoanSlot::Refinance).has_value());
    EXPECT_DOUBLE_EQ(view.at(LoanSlot::Refinance)->principal(), 150000.0);
}

TEST(StrategyTypeTest, ParseKnownAndUnknown) {
    auto brrrr = parseStrategyType("BRRRR");
    ASSERT_TRUE(brrrr.has_value());
    EXPECT_EQ(*brrrr, StrategyType::Brrrr);
    EXPECT_EQ(toString(StrategyType::PadSplit), "PadSplit");

    auto unknown = parseStrategyType("Flip");
    ASSERT_FALSE(unknown.has_value());
    EXPECT_NE(unknown.error().find("analysis_type"), std::string::npos);
}
