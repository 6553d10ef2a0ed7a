// signal_generator_test.cpp — tests for moving averages, crossover signals,
// position changes and warm-up cleaning.

#include <gtest/gtest.h>

#include "backtest/backtest_errors.hpp"
#include "strategy/signal_generator.hpp"
#include "test_price_helpers.hpp"

#include <cmath>
#include <optional>
#include <vector>

namespace {

using test_helpers::make_flat_series;
using test_helpers::make_linear_series;
using test_helpers::make_series;
using test_helpers::make_wavy_series;

}  // namespace

// ===========================================================================
// 1. moving_average
// ===========================================================================
class MovingAverageTest : public ::testing::Test {};

TEST_F(MovingAverageTest, TrailingMeanOfThree) {
    auto s = make_series({1.0, 2.0, 3.0, 4.0, 5.0});
    auto ma = signal_gen::moving_average(s, 3);
    ASSERT_EQ(ma.size(), 5u);
    EXPECT_FALSE(ma[0].has_value());
    EXPECT_FALSE(ma[1].has_value());
    EXPECT_DOUBLE_EQ(*ma[2], 2.0);
    EXPECT_DOUBLE_EQ(*ma[3], 3.0);
    EXPECT_DOUBLE_EQ(*ma[4], 4.0);
}

TEST_F(MovingAverageTest, WindowOneIsThePriceItself) {
    auto s = make_series({7.0, 3.5, 9.25});
    auto ma = signal_gen::moving_average(s, 1);
    for (size_t i = 0; i < s.size(); ++i) {
        ASSERT_TRUE(ma[i].has_value());
        EXPECT_DOUBLE_EQ(*ma[i], s[i].price);
    }
}

TEST_F(MovingAverageTest, WindowEqualToLengthDefinesOnlyLastRow) {
    auto s = make_series({1.0, 2.0, 3.0, 4.0, 5.0});
    auto ma = signal_gen::moving_average(s, 5);
    for (size_t i = 0; i < 4; ++i) EXPECT_FALSE(ma[i].has_value());
    ASSERT_TRUE(ma[4].has_value());
    EXPECT_DOUBLE_EQ(*ma[4], 3.0);
}

TEST_F(MovingAverageTest, MatchesTrailingMeanEverywhere) {
    auto s = make_wavy_series(120);
    for (int window : {1, 2, 7, 20, 50}) {
        auto ma = signal_gen::moving_average(s, window);
        for (int i = 0; i < static_cast<int>(s.size()); ++i) {
            if (i < window - 1) {
                EXPECT_FALSE(ma[i].has_value()) << "window=" << window << " i=" << i;
                continue;
            }
            double sum = 0.0;
            for (int j = i - window + 1; j <= i; ++j) sum += s[j].price;
            ASSERT_TRUE(ma[i].has_value());
            EXPECT_NEAR(*ma[i], sum / window, 1e-10) << "window=" << window << " i=" << i;
        }
    }
}

TEST_F(MovingAverageTest, ConstantWindowIsExact) {
    // 0.1 is not representable; the average must still equal it bit for bit.
    auto s = make_flat_series(10, 0.1);
    auto ma = signal_gen::moving_average(s, 7);
    for (size_t i = 6; i < s.size(); ++i) {
        EXPECT_EQ(*ma[i], 0.1);
    }
}

TEST_F(MovingAverageTest, ZeroWindowThrows) {
    auto s = make_series({1.0, 2.0});
    EXPECT_THROW(signal_gen::moving_average(s, 0), InvalidParameterError);
    EXPECT_THROW(signal_gen::moving_average(s, -3), InvalidParameterError);
}

TEST_F(MovingAverageTest, WindowLongerThanSeriesThrows) {
    auto s = make_series({1.0, 2.0, 3.0});
    EXPECT_THROW(signal_gen::moving_average(s, 4), InvalidParameterError);
}

// ===========================================================================
// 2. signal — strict greater-than, ties go SHORT
// ===========================================================================
class SignalTest : public ::testing::Test {};

TEST_F(SignalTest, ShortAboveLongIsLong) {
    EXPECT_EQ(signal_gen::signal(2.0, 1.0), 1);
}

TEST_F(SignalTest, ShortBelowLongIsShort) {
    EXPECT_EQ(signal_gen::signal(1.0, 2.0), -1);
}

TEST_F(SignalTest, EqualAveragesResolveToShort) {
    EXPECT_EQ(signal_gen::signal(1.5, 1.5), -1);
}

TEST_F(SignalTest, UndefinedWhenEitherAverageMissing) {
    EXPECT_FALSE(signal_gen::signal(std::nullopt, 1.0).has_value());
    EXPECT_FALSE(signal_gen::signal(1.0, std::nullopt).has_value());
    EXPECT_FALSE(signal_gen::signal(std::nullopt, std::nullopt).has_value());
}

TEST_F(SignalTest, DefinedExactlyWhereBothAveragesDefined) {
    auto s = make_wavy_series(60);
    auto short_ma = signal_gen::moving_average(s, 5);
    auto long_ma = signal_gen::moving_average(s, 17);
    auto sig = signal_gen::signals(short_ma, long_ma);
    for (size_t i = 0; i < s.size(); ++i) {
        bool both = short_ma[i].has_value() && long_ma[i].has_value();
        EXPECT_EQ(sig[i].has_value(), both) << "i=" << i;
        if (both) {
            EXPECT_EQ(*sig[i], *short_ma[i] > *long_ma[i] ? 1 : -1);
        }
    }
}

// ===========================================================================
// 3. position_change — first difference of the signal
// ===========================================================================
class PositionChangeTest : public ::testing::Test {};

TEST_F(PositionChangeTest, FirstDifference) {
    std::vector<std::optional<int>> sig = {std::nullopt, 1, -1, -1, 1};
    auto change = signal_gen::position_change(sig);
    ASSERT_EQ(change.size(), 5u);
    EXPECT_FALSE(change[0].has_value());  // no predecessor
    EXPECT_EQ(*change[1], 2);             // warm-up counts as SHORT
    EXPECT_EQ(*change[2], -2);
    EXPECT_EQ(*change[3], 0);
    EXPECT_EQ(*change[4], 2);
}

TEST_F(PositionChangeTest, WarmupToShortIsNoChange) {
    std::vector<std::optional<int>> sig = {std::nullopt, std::nullopt, -1, -1};
    auto change = signal_gen::position_change(sig);
    EXPECT_EQ(*change[1], 0);
    EXPECT_EQ(*change[2], 0);
    EXPECT_EQ(*change[3], 0);
}

TEST_F(PositionChangeTest, EmptyInput) {
    EXPECT_TRUE(signal_gen::position_change({}).empty());
}

// ===========================================================================
// 4. SignalGenerator — row assembly and cleaning
// ===========================================================================
class SignalGeneratorTest : public ::testing::Test {};

TEST_F(SignalGeneratorTest, GenerateProducesOneRowPerPrice) {
    auto s = make_series({1.0, 2.0, 3.0, 4.0, 5.0});
    SignalGenerator gen(2, 3);
    auto rows = gen.generate(s);
    ASSERT_EQ(rows.size(), 5u);

    EXPECT_FALSE(rows[0].short_ma.has_value());
    EXPECT_DOUBLE_EQ(*rows[1].short_ma, 1.5);
    EXPECT_FALSE(rows[1].long_ma.has_value());
    EXPECT_DOUBLE_EQ(*rows[2].long_ma, 2.0);
    EXPECT_EQ(*rows[2].signal, 1);
    EXPECT_FALSE(rows[0].position_change.has_value());
    EXPECT_EQ(*rows[2].position_change, 2);
    EXPECT_FALSE(rows[2].previous_signal.has_value());
    EXPECT_EQ(*rows[3].position_change, 0);
    EXPECT_EQ(*rows[3].previous_signal, 1);

    for (size_t i = 0; i < rows.size(); ++i) {
        EXPECT_EQ(rows[i].index, i);
        EXPECT_EQ(rows[i].timestamp, s[i].timestamp);
        EXPECT_DOUBLE_EQ(rows[i].price, s[i].price);
    }
}

TEST_F(SignalGeneratorTest, DropReasonsFollowDerivationOrder) {
    auto s = make_series({1.0, 2.0, 3.0, 4.0, 5.0});
    auto rows = SignalGenerator(2, 3).generate(s);
    EXPECT_EQ(rows[0].drop_reason(), SignalRow::DropReason::SHORT_WARMUP);
    EXPECT_EQ(rows[1].drop_reason(), SignalRow::DropReason::LONG_WARMUP);
    EXPECT_EQ(rows[2].drop_reason(), SignalRow::DropReason::NONE);
    EXPECT_EQ(drop_reason_str(rows[1].drop_reason()), "LONG_WARMUP");
}

TEST_F(SignalGeneratorTest, FirstRowWithoutWarmupHasNoPreviousRow) {
    auto s = make_series({1.0, 2.0, 3.0});
    auto rows = SignalGenerator(1, 1).generate(s);
    EXPECT_TRUE(rows[0].signal.has_value());
    EXPECT_EQ(rows[0].drop_reason(), SignalRow::DropReason::NO_PREVIOUS_ROW);
    EXPECT_EQ(rows[1].drop_reason(), SignalRow::DropReason::NONE);
    EXPECT_EQ(drop_reason_str(rows[0].drop_reason()), "NO_PREVIOUS_ROW");
}

TEST_F(SignalGeneratorTest, CleanRemovesWarmup) {
    auto s = make_wavy_series(40);
    SignalGenerator gen(4, 9);
    auto cleaned = gen.generate_clean(s);
    // Long warm-up covers indices 0..7; index 8 is the first signal and is kept.
    ASSERT_EQ(cleaned.size(), 40u - 8u);
    EXPECT_EQ(cleaned.front().index, 8u);
    EXPECT_EQ(cleaned.back().index, 39u);
    for (const auto& r : cleaned) EXPECT_TRUE(r.retained());
}

TEST_F(SignalGeneratorTest, ShortWindowLongerThanLongWindowStillCleans) {
    auto s = make_wavy_series(30);
    auto cleaned = SignalGenerator(10, 3).generate_clean(s);
    ASSERT_FALSE(cleaned.empty());
    EXPECT_EQ(cleaned.front().index, 9u);
}

TEST_F(SignalGeneratorTest, FlatSeriesSignalsShortEverywhere) {
    auto s = make_flat_series(25, 37.3);
    auto cleaned = SignalGenerator(3, 8).generate_clean(s);
    ASSERT_FALSE(cleaned.empty());
    for (const auto& r : cleaned) {
        EXPECT_EQ(*r.signal, -1);
        EXPECT_EQ(*r.position_change, 0);
    }
}

TEST_F(SignalGeneratorTest, RisingSeriesSignalsLongEverywhere) {
    auto s = make_linear_series(30, 100.0, 1.0);
    auto rows = SignalGenerator(3, 10).generate(s);
    for (const auto& r : rows) {
        if (r.signal) EXPECT_EQ(*r.signal, 1);
    }
}

TEST_F(SignalGeneratorTest, RisingSeriesEntersLongOnceAtEndOfWarmup) {
    auto s = make_linear_series(30, 100.0, 1.0);
    auto cleaned = SignalGenerator(3, 10).generate_clean(s);
    ASSERT_EQ(cleaned.size(), 21u);
    EXPECT_EQ(cleaned.front().index, 9u);
    EXPECT_EQ(*cleaned.front().position_change, 2);
    EXPECT_FALSE(cleaned.front().previous_signal.has_value());
    for (size_t k = 1; k < cleaned.size(); ++k) {
        EXPECT_EQ(*cleaned[k].position_change, 0) << "k=" << k;
        EXPECT_EQ(*cleaned[k].previous_signal, 1) << "k=" << k;
    }
}

TEST_F(SignalGeneratorTest, SeriesEqualToLongWindowLeavesOneRow) {
    auto s = make_wavy_series(10);
    auto cleaned = SignalGenerator(3, 10).generate_clean(s);
    ASSERT_EQ(cleaned.size(), 1u);
    EXPECT_EQ(cleaned.front().index, 9u);
}

TEST_F(SignalGeneratorTest, SingleRowWithUnitWindowsLeavesNothing) {
    auto s = make_series({5.0});
    EXPECT_TRUE(SignalGenerator(1, 1).generate_clean(s).empty());
}

TEST_F(SignalGeneratorTest, WindowTooLongThrows) {
    auto s = make_wavy_series(10);
    EXPECT_THROW(SignalGenerator(3, 11).generate(s), InvalidParameterError);
}
