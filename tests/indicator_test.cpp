#include "growin/indicator.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <string>
#include <stdexcept>
#include <vector>

using namespace growin;

namespace {

std::vector<double> ramp(std::size_t n, double start = 1.0) {
    std::vector<double> v;
    for (std::size_t i = 0; i < n; ++i) {
        v.push_back(start + static_cast<double>(i));
    }
    return v;
}

}  // namespace

/* ----- SMA ----- */

TEST(SmaTest, PadsWarmupAndAveragesWindow) {
    const auto out = indicator::sma({1, 2, 3, 4, 5}, 3);
    const std::vector<double> expected{0.0, 0.0, 2.0, 3.0, 4.0};
    EXPECT_EQ(out, expected);
}

TEST(SmaTest, ShortSeriesIsAllPadding) {
    const auto out = indicator::sma({1, 2}, 5);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0], 0.0);
    EXPECT_EQ(out[1], 0.0);
}

TEST(SmaTest, PeriodOneIsIdentity) {
    const std::vector<double> data{3.5, -1.0, 7.25};
    EXPECT_EQ(indicator::sma(data, 1), data);
}

TEST(SmaTest, EmptyInput) {
    EXPECT_TRUE(indicator::sma({}, 20).empty());
}

TEST(SmaTest, ZeroPeriodThrows) {
    EXPECT_THROW((void)indicator::sma({1, 2, 3}, 0), std::invalid_argument);
}

/* ----- EMA ----- */

TEST(EmaTest, SeedsWithMeanOfFirstWindow) {
    // k = 0.5, seed = (1 + 2 + 3) / 3
    const auto out = indicator::ema({1, 2, 3, 4, 5}, 3);
    const std::vector<double> expected{0.0, 0.0, 2.0, 3.0, 4.0};
    EXPECT_EQ(out, expected);
}

TEST(EmaTest, ShortSeriesSeedsFromFirstValue) {
    // Fewer values than the period: start = 0, k = 1/3
    const auto out = indicator::ema({4, 6}, 5);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_DOUBLE_EQ(out[0], 4.0);
    EXPECT_NEAR(out[1], 6.0 / 3.0 + 4.0 * 2.0 / 3.0, 1e-12);
}

TEST(EmaTest, EmptyInputGivesEmptyOutput) {
    EXPECT_TRUE(indicator::ema({}, 14).empty());
}

TEST(EmaTest, ZeroPeriodThrows) {
    EXPECT_THROW((void)indicator::ema({1, 2, 3}, 0), std::invalid_argument);
    EXPECT_THROW((void)indicator::ema({}, 0), std::invalid_argument);
}

/* ----- RSI ----- */

TEST(RsiTest, WilderSmoothingReferenceCase) {
    const auto out = indicator::rsi({1, 2, 1, 2, 5}, 3);
    ASSERT_EQ(out.size(), 5u);
    EXPECT_EQ(out[0], 50.0);
    EXPECT_EQ(out[1], 50.0);
    EXPECT_EQ(out[2], 50.0);
    EXPECT_NEAR(out[3], 66.667, 1e-3);
    EXPECT_NEAR(out[4], 86.667, 1e-3);
}

TEST(RsiTest, InsufficientDataIsNeutral) {
    const auto out = indicator::rsi({1, 2, 3}, 5);
    EXPECT_EQ(out, std::vector<double>(3, 50.0));
}

TEST(RsiTest, SeriesExactlyOnePeriodLongIsNeutral) {
    const auto out = indicator::rsi({1, 5, 2}, 3);
    EXPECT_EQ(out, std::vector<double>(3, 50.0));
}

TEST(RsiTest, EmptyInput) {
    EXPECT_TRUE(indicator::rsi({}, 14).empty());
}

TEST(RsiTest, NoLossesGiveHundred) {
    const auto out = indicator::rsi(ramp(6), 3);
    const std::vector<double> expected{50.0, 50.0, 50.0, 100.0, 100.0, 100.0};
    EXPECT_EQ(out, expected);
}

TEST(RsiTest, ConstantSeriesTakesZeroLossPath) {
    const auto out = indicator::rsi({5, 5, 5, 5}, 2);
    const std::vector<double> expected{50.0, 50.0, 100.0, 100.0};
    EXPECT_EQ(out, expected);
}

TEST(RsiTest, OnlyLossesGiveZero) {
    const auto out = indicator::rsi({6, 5, 4, 3, 2}, 2);
    const std::vector<double> expected{50.0, 50.0, 0.0, 0.0, 0.0};
    EXPECT_EQ(out, expected);
}

TEST(RsiTest, RecurrenceStartsAfterFirstSmoothedValue) {
    // period 1: warm-up average is used as-is at index 1, recurrence applies at index 2
    const auto out = indicator::rsi({1, 3, 2}, 1);
    const std::vector<double> expected{50.0, 100.0, 0.0};
    EXPECT_EQ(out, expected);
}

TEST(RsiTest, ZeroPeriodThrows) {
    EXPECT_THROW((void)indicator::rsi({1, 2, 3}, 0), std::invalid_argument);
    EXPECT_THROW((void)indicator::rsi({}, 0), std::invalid_argument);
}

/* ----- MACD ----- */

TEST(MacdTest, ComposesTwoEmasAndSignal) {
    const auto out = indicator::macd({1, 2, 3, 4, 5}, 2, 3, 2);

    ASSERT_EQ(out.macdLine.size(), 5u);
    EXPECT_NEAR(out.macdLine[0], 0.0, 1e-12);
    EXPECT_NEAR(out.macdLine[1], 1.5, 1e-12);
    EXPECT_NEAR(out.macdLine[2], 0.5, 1e-12);
    EXPECT_NEAR(out.macdLine[3], 0.5, 1e-12);
    EXPECT_NEAR(out.macdLine[4], 0.5, 1e-12);

    // Signal EMA is seeded over the zero-padded MACD line
    ASSERT_EQ(out.signalLine.size(), 5u);
    EXPECT_EQ(out.signalLine[0], 0.0);
    EXPECT_NEAR(out.signalLine[1], 0.75, 1e-12);
    EXPECT_NEAR(out.signalLine[2], 7.0 / 12.0, 1e-12);
    EXPECT_NEAR(out.signalLine[3], 19.0 / 36.0, 1e-12);
    EXPECT_NEAR(out.signalLine[4], 55.0 / 108.0, 1e-12);
}

TEST(MacdTest, MacdLineIsDifferenceOfEmas) {
    const std::vector<double> data{10, 11, 10.5, 12, 13, 12.5, 14, 15, 14.2, 16, 17, 18, 17.5, 19};
    const auto                out  = indicator::macd(data, 3, 6, 4);
    const auto                fast = indicator::ema(data, 3);
    const auto                slow = indicator::ema(data, 6);

    for (std::size_t i = 0; i < data.size(); ++i) {
        EXPECT_EQ(out.macdLine[i], fast[i] - slow[i]) << "index " << i;
    }
    EXPECT_EQ(out.signalLine, indicator::ema(out.macdLine, 4));
}

TEST(MacdTest, HistogramIsExactDifference) {
    std::vector<double> data;
    for (int i = 0; i < 60; ++i) {
        data.push_back(100.0 + 5.0 * std::sin(i * 0.3) + i * 0.1);
    }
    const auto out = indicator::macd(data);

    ASSERT_EQ(out.histogram.size(), data.size());
    for (std::size_t i = 0; i < data.size(); ++i) {
        EXPECT_EQ(out.histogram[i], out.macdLine[i] - out.signalLine[i]) << "index " << i;
    }
}

TEST(MacdTest, SeriesShorterThanSlowPeriodKeepsLength) {
    const auto out = indicator::macd({1, 2, 3, 4, 5});
    EXPECT_EQ(out.macdLine.size(), 5u);
    EXPECT_EQ(out.signalLine.size(), 5u);
    EXPECT_EQ(out.histogram.size(), 5u);
}

TEST(MacdTest, EmptyInput) {
    const auto out = indicator::macd({});
    EXPECT_TRUE(out.macdLine.empty());
    EXPECT_TRUE(out.signalLine.empty());
    EXPECT_TRUE(out.histogram.empty());
}

TEST(MacdTest, ZeroPeriodThrows) {
    EXPECT_THROW((void)indicator::macd({1, 2, 3}, 0, 26, 9), std::invalid_argument);
    EXPECT_THROW((void)indicator::macd({1, 2, 3}, 12, 0, 9), std::invalid_argument);
    EXPECT_THROW((void)indicator::macd({1, 2, 3}, 12, 26, 0), std::invalid_argument);
}

/* ----- Bollinger Bands ----- */

TEST(BollingerTest, PopulationStandardDeviation) {
    // mean 5, population variance 4
    const auto out = indicator::bbands({2, 4, 4, 4, 5, 5, 7, 9}, 8, 2.0);

    for (std::size_t i = 0; i < 7; ++i) {
        EXPECT_EQ(out.upper[i], 0.0);
        EXPECT_EQ(out.middle[i], 0.0);
        EXPECT_EQ(out.lower[i], 0.0);
    }
    EXPECT_DOUBLE_EQ(out.middle[7], 5.0);
    EXPECT_DOUBLE_EQ(out.upper[7], 9.0);
    EXPECT_DOUBLE_EQ(out.lower[7], 1.0);
}

TEST(BollingerTest, MiddleBandMatchesSma) {
    const std::vector<double> data{3, 8, 1, 9, 4, 4, 7, 2, 6, 5, 10, 3, 8, 2, 7};
    const auto                bands = indicator::bbands(data, 4);
    const auto                avg   = indicator::sma(data, 4);

    ASSERT_EQ(bands.middle.size(), avg.size());
    for (std::size_t i = 0; i < data.size(); ++i) {
        EXPECT_DOUBLE_EQ(bands.middle[i], avg[i]) << "index " << i;
    }
}

TEST(BollingerTest, MiddleBandTracksSmaOnFractionalData) {
    std::vector<double> data;
    for (int i = 0; i < 200; ++i) {
        data.push_back(100.0 + 3.7 * std::sin(i * 0.17) + 0.013 * i);
    }
    const auto bands = indicator::bbands(data, 20);
    const auto avg   = indicator::sma(data, 20);

    for (std::size_t i = 0; i < data.size(); ++i) {
        EXPECT_NEAR(bands.middle[i], avg[i], 1e-9) << "index " << i;
    }
}

TEST(BollingerTest, ConstantSeriesCollapsesBands) {
    const std::vector<double> data(25, 42.5);
    const auto                out = indicator::bbands(data, 20, 2.0);

    for (std::size_t i = 19; i < data.size(); ++i) {
        EXPECT_EQ(out.upper[i], 42.5);
        EXPECT_EQ(out.middle[i], 42.5);
        EXPECT_EQ(out.lower[i], 42.5);
    }
}

TEST(BollingerTest, BandsAreSymmetric) {
    const std::vector<double> data{1, 3, 2, 6, 4, 8, 5, 9};
    const auto                out = indicator::bbands(data, 3, 1.5);

    for (std::size_t i = 2; i < data.size(); ++i) {
        EXPECT_NEAR(out.upper[i] - out.middle[i], out.middle[i] - out.lower[i], 1e-12);
        EXPECT_GE(out.upper[i], out.lower[i]);
    }
}

TEST(BollingerTest, ZeroPeriodThrows) {
    EXPECT_THROW((void)indicator::bbands({1, 2, 3}, 0), std::invalid_argument);
}

/* ----- Shared length contract ----- */

TEST(IndicatorLengthTest, EveryOutputMatchesInputLength) {
    for (std::size_t n = 0; n <= 30; ++n) {
        const auto data = ramp(n, 10.0);
        for (std::size_t p = 1; p <= 8; ++p) {
            SCOPED_TRACE("n=" + std::to_string(n) + " period=" + std::to_string(p));

            EXPECT_EQ(indicator::sma(data, p).size(), n);
            EXPECT_EQ(indicator::ema(data, p).size(), n);
            EXPECT_EQ(indicator::rsi(data, p).size(), n);

            const auto m = indicator::macd(data, p, p + 3, p);
            EXPECT_EQ(m.macdLine.size(), n);
            EXPECT_EQ(m.signalLine.size(), n);
            EXPECT_EQ(m.histogram.size(), n);

            const auto b = indicator::bbands(data, p);
            EXPECT_EQ(b.upper.size(), n);
            EXPECT_EQ(b.middle.size(), n);
            EXPECT_EQ(b.lower.size(), n);
        }
    }
}
