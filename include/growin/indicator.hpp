#pragma once

#include <cstddef>
#include <vector>

namespace growin::indicator {

/**
 * @brief Padding written to RSI indices that precede the warm-up period.
 */
inline constexpr double kRsiPadding = 50.0;

/**
 * @brief Padding written to SMA/EMA/MACD/Bollinger indices that precede the warm-up period.
 */
inline constexpr double kPadding = 0.0;

struct MacdResult {
    std::vector<double> macdLine;
    std::vector<double> signalLine;
    std::vector<double> histogram;  // macdLine - signalLine
};

struct BollingerBands {
    std::vector<double> upper;
    std::vector<double> middle;  // rolling mean, matches sma() up to rounding
    std::vector<double> lower;
};

/**
 * @brief Compute Simple Moving Average (SMA).
 * @param data    Input price series.
 * @param period  Window size for the moving average.
 * @return        SMA values. Size = data.size().
 *                Indices before (period - 1) hold 0.0.
 * @throws std::invalid_argument if period is 0.
 */
[[nodiscard]] std::vector<double> sma(const std::vector<double>& data, std::size_t period = 20);

/**
 * @brief Compute Exponential Moving Average (EMA), k = 2 / (period + 1).
 * @param data    Input price series.
 * @param period  Lookback period.
 * @return        EMA values. Size = data.size().
 *
 * The first value is seeded with the arithmetic mean of data[0..start], where
 * start = period - 1 if enough data exists, 0 otherwise. Indices before start hold 0.0.
 *
 * @throws std::invalid_argument if period is 0.
 */
[[nodiscard]] std::vector<double> ema(const std::vector<double>& data, std::size_t period = 14);

/**
 * @brief Compute Relative Strength Index (RSI).
 * @param prices  Input price series.
 * @param period  Lookback period (typically 14).
 * @return        RSI values (0~100). Size = prices.size().
 *                The first `period` values are 50.0, and every value is 50.0
 *                if prices.size() < period.
 *
 * Uses Wilder's smoothing. The simple warm-up average is the first smoothed
 * value (index == period); the recurrence applies from period + 1 onward.
 *
 * @throws std::invalid_argument if period is 0.
 */
[[nodiscard]] std::vector<double> rsi(const std::vector<double>& prices, std::size_t period = 14);

/**
 * @brief Compute MACD (Moving Average Convergence Divergence).
 * @param data    Input price series.
 * @param fast    Fast EMA period.
 * @param slow    Slow EMA period.
 * @param signal  Signal EMA period, applied to the MACD line itself.
 * @return        MACD line, signal line and histogram, each of size data.size().
 * @throws std::invalid_argument if any period is 0.
 */
[[nodiscard]] MacdResult macd(const std::vector<double>& data, std::size_t fast = 12, std::size_t slow = 26,
                              std::size_t signal = 9);

/**
 * @brief Compute Bollinger Bands over a rolling window.
 * @param data    Input price series.
 * @param period  Window size.
 * @param stdDev  Band width in population standard deviations.
 * @return        Upper, middle and lower bands, each of size data.size().
 *                Indices before (period - 1) hold 0.0 in all three bands.
 * @throws std::invalid_argument if period is 0.
 */
[[nodiscard]] BollingerBands bbands(const std::vector<double>& data, std::size_t period = 20, double stdDev = 2.0);

}  // namespace growin::indicator
